#pragma once

/**
 * @file naming.hpp
 * @brief Name derivation and validation
 *
 * Turns a model identifier and a hardware UUID into a display name and a
 * hostname-safe name, and checks the preconditions for applying them.
 */

#include "devicename/devicename.hpp"

#include <string>

namespace devicename {

/// Separator between the model prefix and the UUID suffix
constexpr char NAME_SEPARATOR = '-';

/**
 * @brief Check whether a character is stripped from hostnames
 *
 * The exclusion set is blank/whitespace plus ' & ( ) * % $ " \ - ~ ? ! < > [ ] { } = + : ; , . | ^ # @
 * Note that '-' is excluded too, so the sanitized hostname carries no separator.
 */
[[nodiscard]] bool is_hostname_excluded(char c) noexcept;

/// Remove every '/' from a model identifier ("Z1AU001HXB/A" -> "Z1AU001HXBA")
[[nodiscard]] std::string clean_model_identifier(const std::string& model);

/// Remove every hostname-excluded character from a name
[[nodiscard]] std::string sanitize_hostname(const std::string& name);

/**
 * @brief Derive the candidate name and sanitized hostname
 *
 * The suffix is the last @p digit_count characters of @p uuid.
 *
 * @param model Raw model identifier (may be empty)
 * @param uuid Raw hardware UUID
 * @param digit_count Number of trailing UUID characters to use
 * @return The derived names, or InvalidDigitCount if @p digit_count is not
 *         positive or exceeds the UUID length, or SuffixLengthMismatch if the
 *         extracted suffix is not well-formed UTF-8 or does not have
 *         @p digit_count characters
 */
[[nodiscard]] Result<DerivedNames> derive_names(const std::string& model, const std::string& uuid,
                                                int digit_count);

/**
 * @brief Check the preconditions for applying a derived name
 *
 * Privilege is checked first so a non-privileged run always reports
 * InsufficientPrivilege.
 *
 * @param candidate_name The derived display name
 * @param has_privilege Whether the process may change the host identity
 */
[[nodiscard]] Result<void> validate(const std::string& candidate_name, bool has_privilege);

}  // namespace devicename
