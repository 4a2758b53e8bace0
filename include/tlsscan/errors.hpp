#pragma once
#include <stdexcept>
#include <string>

namespace tlsscan {

/**
 * Why a single target could not be turned into a connectivity descriptor.
 * Per-target failures never abort the rest of the batch.
 */
enum class FailureReason {
    BadPort,              // Port is not an integer or is out of range
    PlatformUnsupported,  // IPv6 syntax on a host without IPv6 support
    NameNotResolved,      // DNS lookup failed
    InvalidIpAddress,     // Forced {ip} is not a literal IPv4/IPv6 address
    ConnectionFailed      // TCP connect failed after every retry
};

const char* to_string(FailureReason reason);

/**
 * Base class for errors scoped to one target string.
 */
class TargetError : public std::runtime_error {
public:
    TargetError(FailureReason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    FailureReason reason() const { return reason_; }

private:
    FailureReason reason_;
};

/** Malformed server string (bad port, unsupported IPv6). */
class TargetSyntaxError : public TargetError {
public:
    using TargetError::TargetError;
};

/** The connectivity prober rejected the target. */
class ConnectivityError : public TargetError {
public:
    using TargetError::TargetError;
};

/**
 * Global configuration failures. All of them are detected before
 * (or, for CrossTargetMisconfiguration, during) target resolution and
 * terminate the run with a usage-style message.
 */
enum class ConfigErrorKind {
    MutuallyExclusiveInputs,
    NoTargets,
    UnreadableTargetsFile,
    OutputSinkConflict,
    ClientAuthMismatch,
    InvalidKeyFormat,
    InvalidCredential,
    InvalidProxyUrl,
    InvalidStartTlsValue,
    InvalidRetryCount,
    UnknownOption,
    MissingOptionValue,
    InvalidOptionValue,
    CrossTargetMisconfiguration
};

const char* to_string(ConfigErrorKind kind);

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(ConfigErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ConfigErrorKind kind() const { return kind_; }

    /**
     * Two-line message printed to stderr before exiting:
     *   "  Command line error: <what>\n  Use -h for help."
     */
    std::string usage_message() const;

private:
    ConfigErrorKind kind_;
};

/**
 * A global setting that is only invalid in combination with a target,
 * e.g. --xmpp_to while the connection is not XMPP StartTLS. Raised while
 * building a descriptor and aborts the whole batch.
 */
class CrossTargetMisconfiguration : public ConfigurationError {
public:
    explicit CrossTargetMisconfiguration(const std::string& message)
        : ConfigurationError(ConfigErrorKind::CrossTargetMisconfiguration, message) {}
};

} // namespace tlsscan
