#pragma once

/**
 * @file runner.hpp
 * @brief One naming run: read, derive, validate, apply
 */

#include "devicename/devicename.hpp"
#include "devicename/hardware.hpp"
#include "devicename/identity.hpp"

#include <ostream>

namespace devicename {

/**
 * @brief Sequences a single naming run
 *
 * Progress lines for the operator are written to the output stream given at
 * construction. Every failure is terminal and returned to the caller, which
 * maps it to an exit status with exit_code_for().
 *
 * The applier may be null when config.dry_run is set. A dry run does not
 * require privilege.
 */
class NameRunner {
  public:
    NameRunner(Config config, HardwareInfoSource& source, IdentityApplier* applier,
               std::ostream& out);

    /**
     * @brief Run the naming sequence
     *
     * @param has_privilege Whether the process may change the host identity
     * @return The derived names on success (applied unless dry_run)
     */
    [[nodiscard]] Result<DerivedNames> run(bool has_privilege);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

  private:
    Config config_;
    HardwareInfoSource& source_;
    IdentityApplier* applier_;
    std::ostream& out_;
};

}  // namespace devicename
