#pragma once

/**
 * @file hardware.hpp
 * @brief Hardware metadata sources for devicename
 *
 * Reads the model identifier and the hardware UUID from the host:
 * - macOS: system_profiler SPHardwareDataType
 * - Linux: DMI attributes under /sys/class/dmi/id
 */

#include "devicename/devicename.hpp"
#include "devicename/process.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace devicename {

/**
 * @brief Source of the two hardware values a name is derived from
 *
 * Both reads fail with MetadataUnavailable when no usable value is found.
 */
class HardwareInfoSource {
  public:
    virtual ~HardwareInfoSource() = default;

    /// Read the hardware model identifier (e.g. "Z1AU001HXB/A")
    virtual Result<std::string> read_model_identifier() = 0;

    /// Read the hardware UUID
    virtual Result<std::string> read_hardware_uuid() = 0;
};

/**
 * @brief macOS source backed by system_profiler
 *
 * The model number is taken from the XML (plist) report because the text
 * report does not carry it; the UUID is taken from the "Hardware UUID" line
 * of the text report.
 */
class SystemProfilerSource : public HardwareInfoSource {
  public:
    explicit SystemProfilerSource(CommandRunner& runner);

    Result<std::string> read_model_identifier() override;
    Result<std::string> read_hardware_uuid() override;

  private:
    Result<std::string> profiler_output(bool xml);

    CommandRunner& runner_;
};

/**
 * @brief Linux source backed by DMI sysfs attributes
 *
 * Model: first usable value of product_sku, product_name.
 * UUID: product_uuid, upper-cased. Reading product_uuid normally requires root.
 */
class DmiSource : public HardwareInfoSource {
  public:
    explicit DmiSource(std::filesystem::path dmi_path = DEFAULT_DMI_PATH);

    Result<std::string> read_model_identifier() override;
    Result<std::string> read_hardware_uuid() override;

  private:
    std::optional<std::string> read_attribute(const std::string& name) const;

    std::filesystem::path dmi_path_;
};

/**
 * @brief Source returning fixed values (operator overrides, testing)
 *
 * An empty value is reported as MetadataUnavailable.
 */
class StaticHardwareSource : public HardwareInfoSource {
  public:
    explicit StaticHardwareSource(HardwareInfo info) : info_(std::move(info)) {}

    Result<std::string> read_model_identifier() override;
    Result<std::string> read_hardware_uuid() override;

  private:
    HardwareInfo info_;
};

/**
 * @brief Source that prefers overrides and falls back to another source
 *
 * Each value is overridden independently; empty overrides defer to @p fallback.
 */
class OverrideHardwareSource : public HardwareInfoSource {
  public:
    OverrideHardwareSource(HardwareInfo overrides, std::unique_ptr<HardwareInfoSource> fallback)
        : overrides_(std::move(overrides)), fallback_(std::move(fallback)) {}

    Result<std::string> read_model_identifier() override;
    Result<std::string> read_hardware_uuid() override;

  private:
    HardwareInfo overrides_;
    std::unique_ptr<HardwareInfoSource> fallback_;
};

/**
 * @brief Create the hardware source for the build platform
 *
 * On platforms without a source, reads fail with MetadataUnavailable.
 */
[[nodiscard]] std::unique_ptr<HardwareInfoSource> make_platform_source(CommandRunner& runner,
                                                                       const Config& config);

/**
 * @brief Find the <string> value that follows <key>@p key</key> in a plist
 *
 * @return The value with surrounding whitespace removed, or nullopt
 */
[[nodiscard]] std::optional<std::string> find_plist_string_value(const std::string& plist,
                                                                 const std::string& key);

/**
 * @brief Find the last whitespace-separated token of the first line containing @p label
 *
 * Matches "Hardware UUID: 8C2A...". Returns nullopt when no line matches or
 * the token would be the label itself.
 */
[[nodiscard]] std::optional<std::string> find_report_line_value(const std::string& report,
                                                                const std::string& label);

/// Trim leading and trailing whitespace
[[nodiscard]] std::string trim(const std::string& value);

}  // namespace devicename
