#pragma once

/**
 * @file devicename.hpp
 * @brief devicename core types
 *
 * Derives a deterministic device name from the hardware model identifier and
 * the tail of the hardware UUID, and applies it to the host identity.
 * Designed for fleet provisioning where names are assigned without a central
 * registry.
 */

#include <optional>
#include <string>
#include <utility>

namespace devicename {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Default number of trailing UUID characters used as the name suffix
constexpr int DEFAULT_SUFFIX_DIGIT_COUNT = 7;

/// Default DMI sysfs directory on Linux
constexpr const char* DEFAULT_DMI_PATH = "/sys/class/dmi/id";

/// Error codes returned by devicename operations
enum class ErrorCode {
    Success = 0,

    // Hardware metadata
    MetadataUnavailable,

    // Derivation
    InvalidDigitCount,
    SuffixLengthMismatch,

    // Validation
    EmptyName,
    InsufficientPrivilege,

    // Identity application
    ApplyFailed,

    // Ambient
    ConfigError,
    CommandFailed,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::MetadataUnavailable:
            return "Hardware metadata unavailable";
        case ErrorCode::InvalidDigitCount:
            return "Invalid suffix digit count";
        case ErrorCode::SuffixLengthMismatch:
            return "Suffix length mismatch";
        case ErrorCode::EmptyName:
            return "Empty device name";
        case ErrorCode::InsufficientPrivilege:
            return "Insufficient privilege";
        case ErrorCode::ApplyFailed:
            return "Failed to apply identity";
        case ErrorCode::ConfigError:
            return "Configuration error";
        case ErrorCode::CommandFailed:
            return "Command failed";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Map an error code to the process exit status
 *
 * 0 success, 1 configuration, 2 identifier parsing, 3 privilege,
 * 4 empty name, 5 identity application.
 */
[[nodiscard]] constexpr int exit_code_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return 0;
        case ErrorCode::ConfigError:
            return 1;
        case ErrorCode::MetadataUnavailable:
        case ErrorCode::InvalidDigitCount:
        case ErrorCode::SuffixLengthMismatch:
            return 2;
        case ErrorCode::InsufficientPrivilege:
            return 3;
        case ErrorCode::EmptyName:
            return 4;
        case ErrorCode::ApplyFailed:
        case ErrorCode::CommandFailed:
            return 5;
        case ErrorCode::Unknown:
            return 1;
    }
    return 1;
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/**
 * @brief Raw hardware metadata as reported by the host
 */
struct HardwareInfo {
    std::string model_identifier;  // e.g. "Z1AU001HXB/A"
    std::string hardware_uuid;     // e.g. "8C2A1F3E-...-653894A"
};

/**
 * @brief Names derived from the hardware metadata
 */
struct DerivedNames {
    std::string cleaned_model;       // Model identifier with '/' removed
    std::string suffix;              // Trailing characters of the hardware UUID
    std::string candidate_name;      // Display name: cleaned_model + "-" + suffix
    std::string sanitized_hostname;  // candidate_name without hostname-excluded characters
};

/**
 * @brief Configuration for a naming run
 */
struct Config {
    /// Number of trailing hardware UUID characters used as suffix
    int suffix_digit_count = DEFAULT_SUFFIX_DIGIT_COUNT;

    /// Derive, validate and report without touching the host identity
    bool dry_run = false;

    /// Log level: trace, debug, info, warning, error, fatal
    std::string log_level = "info";

    /// Use this model identifier instead of querying the hardware
    std::string model_override;

    /// Use this hardware UUID instead of querying the hardware
    std::string uuid_override;

    /// DMI sysfs directory (Linux only)
    std::string dmi_path = DEFAULT_DMI_PATH;
};

} // namespace devicename
