#pragma once

#include <string_view>

namespace DomDecode {


enum class DecodeErrorKind {
    NO_ERROR,

    TYPE_MISMATCH,
    NUMBER_OUT_OF_RANGE,
    KEY_MISSING,
    VALUE_MISSING,
    MALFORMED_INPUT,
    SEQUENCE_EXHAUSTED,

    NESTING_TOO_DEEP
};

constexpr std::string_view error_to_string(DecodeErrorKind e) {
    switch(e) {
    case DecodeErrorKind::NO_ERROR: return "NO_ERROR"; break;
    case DecodeErrorKind::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case DecodeErrorKind::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE"; break;
    case DecodeErrorKind::KEY_MISSING: return "KEY_MISSING"; break;
    case DecodeErrorKind::VALUE_MISSING: return "VALUE_MISSING"; break;
    case DecodeErrorKind::MALFORMED_INPUT: return "MALFORMED_INPUT"; break;
    case DecodeErrorKind::SEQUENCE_EXHAUSTED: return "SEQUENCE_EXHAUSTED"; break;
    case DecodeErrorKind::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP"; break;
    }
    return "N/A";
}


// ============================================================================
// Tree-level failures
// ============================================================================

// Raw failure signal raised while walking a parsed tree, before it is
// attributed to a coding path.
enum class TreeFailureKind {
    wrong_type,
    number_does_not_fit,
    key_does_not_exist,
    value_does_not_exist,
    went_past_end_of_array,
    sequence_at_end,
    json_parsing_failed,
    data_corrupted,
    too_deep
};

constexpr DecodeErrorKind translate_failure_kind(TreeFailureKind k) {
    switch(k) {
    case TreeFailureKind::wrong_type: return DecodeErrorKind::TYPE_MISMATCH;
    case TreeFailureKind::number_does_not_fit: return DecodeErrorKind::NUMBER_OUT_OF_RANGE;
    case TreeFailureKind::key_does_not_exist: return DecodeErrorKind::KEY_MISSING;
    case TreeFailureKind::value_does_not_exist: return DecodeErrorKind::VALUE_MISSING;
    case TreeFailureKind::went_past_end_of_array: return DecodeErrorKind::VALUE_MISSING;
    case TreeFailureKind::sequence_at_end: return DecodeErrorKind::SEQUENCE_EXHAUSTED;
    case TreeFailureKind::json_parsing_failed: return DecodeErrorKind::MALFORMED_INPUT;
    case TreeFailureKind::data_corrupted: return DecodeErrorKind::MALFORMED_INPUT;
    case TreeFailureKind::too_deep: return DecodeErrorKind::NESTING_TOO_DEEP;
    }
    return DecodeErrorKind::NO_ERROR;
}

} // namespace DomDecode
