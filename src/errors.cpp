#include "tlsscan/errors.hpp"

namespace tlsscan {

const char* to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::BadPort:             return "BadPort";
        case FailureReason::PlatformUnsupported: return "PlatformUnsupported";
        case FailureReason::NameNotResolved:     return "NameNotResolved";
        case FailureReason::InvalidIpAddress:    return "InvalidIpAddress";
        case FailureReason::ConnectionFailed:    return "ConnectionFailed";
    }
    return "Unknown";
}

const char* to_string(ConfigErrorKind kind) {
    switch (kind) {
        case ConfigErrorKind::MutuallyExclusiveInputs:     return "MutuallyExclusiveInputs";
        case ConfigErrorKind::NoTargets:                   return "NoTargets";
        case ConfigErrorKind::UnreadableTargetsFile:       return "UnreadableTargetsFile";
        case ConfigErrorKind::OutputSinkConflict:          return "OutputSinkConflict";
        case ConfigErrorKind::ClientAuthMismatch:          return "ClientAuthMismatch";
        case ConfigErrorKind::InvalidKeyFormat:            return "InvalidKeyFormat";
        case ConfigErrorKind::InvalidCredential:           return "InvalidCredential";
        case ConfigErrorKind::InvalidProxyUrl:             return "InvalidProxyUrl";
        case ConfigErrorKind::InvalidStartTlsValue:        return "InvalidStartTlsValue";
        case ConfigErrorKind::InvalidRetryCount:           return "InvalidRetryCount";
        case ConfigErrorKind::UnknownOption:               return "UnknownOption";
        case ConfigErrorKind::MissingOptionValue:          return "MissingOptionValue";
        case ConfigErrorKind::InvalidOptionValue:          return "InvalidOptionValue";
        case ConfigErrorKind::CrossTargetMisconfiguration: return "CrossTargetMisconfiguration";
    }
    return "Unknown";
}

std::string ConfigurationError::usage_message() const {
    return std::string("  Command line error: ") + what() + "\n  Use -h for help.";
}

} // namespace tlsscan
