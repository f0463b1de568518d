#ifndef PMD_ERROR_IDS_HH
#define PMD_ERROR_IDS_HH

#include <pmd/utils.hh>

#include <array>
#include <utility>

namespace pmd {

// NOTE: If you add an ID, please also add a mapping in
//       @see error_id_strings
enum struct ErrorId : unsigned {
    INVALID,

    /// A required value is missing, or a value is out of range.
    InvalidArgument,

    /// Malformed input: bad grammar text, unknown codes, wrong arity.
    InvalidData,

    /// A construct the portable format cannot represent.
    Unsupported,

    /// The call is not valid in the current state.
    InvalidOperation,

    COUNT
};

constexpr std::array<
    std::pair<ErrorId, const char*>,
    6>
    error_id_strings{
        std::pair{ErrorId::INVALID, "ICE: INVALID ERROR ID"},

        {ErrorId::InvalidArgument, "invalid-argument"},
        {ErrorId::InvalidData, "invalid-data"},
        {ErrorId::Unsupported, "unsupported"},
        {ErrorId::InvalidOperation, "invalid-operation"},

        {ErrorId::COUNT, "ICE: INVALID ERROR ID"}
    };

static_assert(
    error_id_strings.size() == +ErrorId::COUNT + 1,
    "Exhaustive handling of ErrorId"
);

constexpr auto StringifyEnum(ErrorId id) -> std::string_view {
    if (+id > +ErrorId::COUNT) return error_id_strings[+ErrorId::INVALID].second;
    return error_id_strings[+id].second;
}

} // namespace pmd

#endif /* PMD_ERROR_IDS_HH */
