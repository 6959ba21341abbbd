/**
 * @file Error.cpp
 * @brief Error code names and Error::format().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include "hive/core/Error.hpp"

#include <sstream>

namespace hive::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                  return "None";
        case ErrorCode::kInvalidArgument:       return "InvalidArgument";
        case ErrorCode::kInvalidState:          return "InvalidState";
        case ErrorCode::kNotFound:              return "NotFound";
        case ErrorCode::kOutOfRange:            return "OutOfRange";
        case ErrorCode::kInternalError:         return "InternalError";
        case ErrorCode::kAlreadyExists:         return "AlreadyExists";
        case ErrorCode::kSelfConflictingAccess: return "SelfConflictingAccess";
        case ErrorCode::kUnknownType:           return "UnknownType";
        case ErrorCode::kAccessViolation:       return "AccessViolation";
        case ErrorCode::kSystemFailed:          return "SystemFailed";
        case ErrorCode::kSystemFatal:           return "SystemFatal";
        case ErrorCode::kCastFailed:            return "CastFailed";
        case ErrorCode::kSymbolNotFound:        return "SymbolNotFound";
        case ErrorCode::kSignatureMismatch:     return "SignatureMismatch";
        case ErrorCode::kAssertionFailed:       return "AssertionFailed";
    }
    return "Unknown";
}

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace hive::core
