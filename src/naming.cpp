#include "devicename/naming.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <optional>

namespace devicename {

namespace {

// Punctuation stripped from hostnames; whitespace is handled separately
constexpr const char* HOSTNAME_EXCLUDED_PUNCT = "'&()*%$\"\\-~?!<>[]{}=+:;,.|^#@";

// Number of UTF-8 code points in @p text, or nullopt if it is not well-formed
std::optional<std::size_t> utf8_length(const std::string& text) {
    std::size_t length = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t width = 0;
        if (lead < 0x80) {
            width = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            width = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            width = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            width = 4;
        } else {
            return std::nullopt;
        }

        if (i + width > text.size()) {
            return std::nullopt;
        }
        for (std::size_t k = 1; k < width; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                return std::nullopt;
            }
        }

        i += width;
        ++length;
    }
    return length;
}

}  // namespace

bool is_hostname_excluded(char c) noexcept {
    if (c == '\0') {
        return false;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
        return true;
    }
    return std::strchr(HOSTNAME_EXCLUDED_PUNCT, c) != nullptr;
}

std::string clean_model_identifier(const std::string& model) {
    std::string cleaned = model;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '/'), cleaned.end());
    return cleaned;
}

std::string sanitize_hostname(const std::string& name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (char c : name) {
        if (!is_hostname_excluded(c)) {
            sanitized.push_back(c);
        }
    }
    return sanitized;
}

Result<DerivedNames> derive_names(const std::string& model, const std::string& uuid,
                                  int digit_count) {
    if (digit_count < 1) {
        return Result<DerivedNames>::error(
            ErrorCode::InvalidDigitCount,
            "Suffix digit count must be positive, got " + std::to_string(digit_count));
    }

    auto count = static_cast<std::string::size_type>(digit_count);
    if (uuid.size() < count) {
        return Result<DerivedNames>::error(
            ErrorCode::InvalidDigitCount,
            "Hardware UUID '" + uuid + "' is shorter than " + std::to_string(digit_count) +
                " characters");
    }

    DerivedNames names;
    names.cleaned_model = clean_model_identifier(model);
    names.suffix = uuid.substr(uuid.size() - count, count);

    // The tail is taken in bytes; a non-ASCII UUID can leave fewer characters
    // than requested or split a character
    auto suffix_length = utf8_length(names.suffix);
    if (!suffix_length || *suffix_length != count) {
        return Result<DerivedNames>::error(ErrorCode::SuffixLengthMismatch,
                                           "something went wrong parsing the identifier, " +
                                               uuid + ", " + names.suffix);
    }

    names.candidate_name = names.cleaned_model + NAME_SEPARATOR + names.suffix;
    names.sanitized_hostname = sanitize_hostname(names.candidate_name);

    return Result<DerivedNames>::ok(std::move(names));
}

Result<void> validate(const std::string& candidate_name, bool has_privilege) {
    if (!has_privilege) {
        return Result<void>::error(ErrorCode::InsufficientPrivilege,
                                   "this program needs to run as root");
    }

    if (candidate_name.empty()) {
        return Result<void>::error(ErrorCode::EmptyName,
                                   "could not determine computer name");
    }

    return Result<void>::ok();
}

}  // namespace devicename
