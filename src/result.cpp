#include "hanabi/result.h"

namespace hanabi {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ABBREVIATION_EXPECTED:  return "ABBREVIATION_EXPECTED";
        case ErrorKind::ABBREVIATION_TOO_SHORT: return "ABBREVIATION_TOO_SHORT";
        case ErrorKind::ABBREVIATION_TOO_LONG:  return "ABBREVIATION_TOO_LONG";
        case ErrorKind::UNKNOWN_COLOR_LETTER:   return "UNKNOWN_COLOR_LETTER";
        case ErrorKind::COLOR_NAME_EXPECTED:    return "COLOR_NAME_EXPECTED";
        case ErrorKind::UNKNOWN_COLOR_NAME:     return "UNKNOWN_COLOR_NAME";
        case ErrorKind::COLOR_OUT_OF_RANGE:     return "COLOR_OUT_OF_RANGE";
        case ErrorKind::RANK_EXPECTED:          return "RANK_EXPECTED";
        case ErrorKind::RANK_NOT_INTEGER:       return "RANK_NOT_INTEGER";
        case ErrorKind::RANK_OUT_OF_RANGE:      return "RANK_OUT_OF_RANGE";
        default:                                return "UNKNOWN_ERROR_KIND";
    }
}

CardParseError::CardParseError(CardError error)
    : std::invalid_argument(error.message),
      error_(std::move(error))
{
}

} // namespace hanabi
