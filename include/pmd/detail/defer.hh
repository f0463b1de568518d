#ifndef PMD_DETAIL_DEFER_HH
#define PMD_DETAIL_DEFER_HH

#include <pmd/utils.hh>

namespace pmd::detail {
template <typename Callable>
struct DeferStage2 {
    Callable cb;
    ~DeferStage2() { cb(); }

    explicit DeferStage2(Callable&& _cb)
        : cb(std::forward<Callable>(_cb)) {}
};

struct DeferStage1 {
    template <typename Callable>
    DeferStage2<Callable> operator->*(Callable&& cb) {
        return DeferStage2<Callable>{std::forward<Callable>(cb)};
    }
};
} // namespace pmd::detail

/// Run a block when the enclosing scope exits.
#define defer auto PMD_CAT(_pmd_defer_, __COUNTER__) = ::pmd::detail::DeferStage1{}->*[&]

#endif // PMD_DETAIL_DEFER_HH
