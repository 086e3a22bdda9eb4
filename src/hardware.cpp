#include "devicename/hardware.hpp"
#include "devicename/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

// Platform detection
#if defined(__APPLE__)
#define DEVICENAME_PLATFORM_MACOS 1
#elif defined(__linux__)
#define DEVICENAME_PLATFORM_LINUX 1
#endif

namespace devicename {

namespace {

constexpr const char* PLIST_MODEL_KEY = "model_number";
constexpr const char* REPORT_UUID_LABEL = "Hardware UUID";

// Values firmware vendors leave in DMI fields they never filled in
constexpr std::array<const char*, 8> DMI_PLACEHOLDERS = {
    "To Be Filled By O.E.M.", "To be filled by O.E.M.", "Default string", "None",
    "Not Specified", "System Product Name", "System SKU", "Not Applicable"};

bool is_dmi_placeholder(const std::string& value) {
    return std::any_of(DMI_PLACEHOLDERS.begin(), DMI_PLACEHOLDERS.end(),
                       [&value](const char* p) { return value == p; });
}

std::string decode_xml_entities(const std::string& text) {
    static const std::array<std::pair<const char*, char>, 5> entities = {{
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}}};

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool matched = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                std::string e(entity);
                if (text.compare(i, e.size(), e) == 0) {
                    out.push_back(ch);
                    i += e.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

Result<std::string> unavailable(const std::string& what) {
    return Result<std::string>::error(ErrorCode::MetadataUnavailable, what);
}

}  // namespace

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(value.rbegin(), value.rend(),
                                       [](unsigned char c) { return std::isspace(c); })
                          .base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::optional<std::string> find_plist_string_value(const std::string& plist,
                                                   const std::string& key) {
    const std::string key_tag = "<key>" + key + "</key>";
    auto pos = plist.find(key_tag);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += key_tag.size();

    // The value element must follow the key directly
    while (pos < plist.size() && std::isspace(static_cast<unsigned char>(plist[pos]))) {
        ++pos;
    }

    const std::string open_tag = "<string>";
    const std::string close_tag = "</string>";
    if (plist.compare(pos, open_tag.size(), open_tag) != 0) {
        return std::nullopt;
    }
    pos += open_tag.size();

    auto end = plist.find(close_tag, pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    auto value = trim(decode_xml_entities(plist.substr(pos, end - pos)));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> find_report_line_value(const std::string& report,
                                                  const std::string& label) {
    std::istringstream lines(report);
    std::string line;
    while (std::getline(lines, line)) {
        auto pos = line.find(label);
        if (pos == std::string::npos) {
            continue;
        }

        std::istringstream tokens(line.substr(pos + label.size()));
        std::string token;
        std::string last;
        while (tokens >> token) {
            last = token;
        }
        if (last.empty() || last == ":") {
            return std::nullopt;
        }
        return last;
    }
    return std::nullopt;
}

// ==================== SystemProfilerSource ====================

SystemProfilerSource::SystemProfilerSource(CommandRunner& runner) : runner_(runner) {}

Result<std::string> SystemProfilerSource::profiler_output(bool xml) {
    std::vector<std::string> args = {"system_profiler"};
    if (xml) {
        args.emplace_back("-xml");
    }
    args.emplace_back("SPHardwareDataType");

    auto result = runner_.run(args);
    if (result.is_error()) {
        return unavailable(result.error_message());
    }
    if (!result.value().success()) {
        return unavailable("system_profiler exited with " +
                           std::to_string(result.value().exit_code) + ": " +
                           trim(result.value().stderr_data));
    }
    return Result<std::string>::ok(std::move(result.value().stdout_data));
}

Result<std::string> SystemProfilerSource::read_model_identifier() {
    auto output = profiler_output(true);
    if (output.is_error()) {
        return output;
    }

    auto model = find_plist_string_value(output.value(), PLIST_MODEL_KEY);
    if (!model) {
        return unavailable("No model_number in system_profiler report");
    }

    DEVICENAME_LOG(debug) << "Model identifier: " << *model;
    return Result<std::string>::ok(*model);
}

Result<std::string> SystemProfilerSource::read_hardware_uuid() {
    auto output = profiler_output(false);
    if (output.is_error()) {
        return output;
    }

    auto uuid = find_report_line_value(output.value(), REPORT_UUID_LABEL);
    if (!uuid) {
        return unavailable("No Hardware UUID in system_profiler report");
    }

    DEVICENAME_LOG(debug) << "Hardware UUID: " << *uuid;
    return Result<std::string>::ok(*uuid);
}

// ==================== DmiSource ====================

DmiSource::DmiSource(std::filesystem::path dmi_path) : dmi_path_(std::move(dmi_path)) {}

std::optional<std::string> DmiSource::read_attribute(const std::string& name) const {
    std::ifstream file(dmi_path_ / name);
    if (!file.is_open()) {
        DEVICENAME_LOG(debug) << "Cannot open DMI attribute " << (dmi_path_ / name).string();
        return std::nullopt;
    }

    std::string value;
    std::getline(file, value);
    value = trim(value);
    if (value.empty() || is_dmi_placeholder(value)) {
        return std::nullopt;
    }
    return value;
}

Result<std::string> DmiSource::read_model_identifier() {
    for (const char* attribute : {"product_sku", "product_name"}) {
        auto value = read_attribute(attribute);
        if (value) {
            DEVICENAME_LOG(debug) << "Model identifier from " << attribute << ": " << *value;
            return Result<std::string>::ok(*value);
        }
    }
    return unavailable("No usable product_sku or product_name under " + dmi_path_.string());
}

Result<std::string> DmiSource::read_hardware_uuid() {
    auto value = read_attribute("product_uuid");
    if (!value) {
        return unavailable("No usable product_uuid under " + dmi_path_.string() +
                           " (reading it usually requires root)");
    }

    std::string uuid = *value;
    std::transform(uuid.begin(), uuid.end(), uuid.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    DEVICENAME_LOG(debug) << "Hardware UUID: " << uuid;
    return Result<std::string>::ok(std::move(uuid));
}

// ==================== StaticHardwareSource ====================

Result<std::string> StaticHardwareSource::read_model_identifier() {
    if (info_.model_identifier.empty()) {
        return unavailable("No model identifier given");
    }
    return Result<std::string>::ok(info_.model_identifier);
}

Result<std::string> StaticHardwareSource::read_hardware_uuid() {
    if (info_.hardware_uuid.empty()) {
        return unavailable("No hardware UUID given");
    }
    return Result<std::string>::ok(info_.hardware_uuid);
}

// ==================== OverrideHardwareSource ====================

Result<std::string> OverrideHardwareSource::read_model_identifier() {
    if (!overrides_.model_identifier.empty()) {
        return Result<std::string>::ok(overrides_.model_identifier);
    }
    if (!fallback_) {
        return unavailable("No model identifier source");
    }
    return fallback_->read_model_identifier();
}

Result<std::string> OverrideHardwareSource::read_hardware_uuid() {
    if (!overrides_.hardware_uuid.empty()) {
        return Result<std::string>::ok(overrides_.hardware_uuid);
    }
    if (!fallback_) {
        return unavailable("No hardware UUID source");
    }
    return fallback_->read_hardware_uuid();
}

// ==================== Factory ====================

std::unique_ptr<HardwareInfoSource> make_platform_source(CommandRunner& runner,
                                                         const Config& config) {
    std::unique_ptr<HardwareInfoSource> platform;

#if defined(DEVICENAME_PLATFORM_MACOS)
    platform = std::make_unique<SystemProfilerSource>(runner);
#elif defined(DEVICENAME_PLATFORM_LINUX)
    (void)runner;
    platform = std::make_unique<DmiSource>(config.dmi_path);
#else
    (void)runner;
    DEVICENAME_LOG(warning) << "No hardware metadata source for this platform";
#endif

    HardwareInfo overrides;
    overrides.model_identifier = config.model_override;
    overrides.hardware_uuid = config.uuid_override;
    return std::make_unique<OverrideHardwareSource>(std::move(overrides), std::move(platform));
}

}  // namespace devicename
