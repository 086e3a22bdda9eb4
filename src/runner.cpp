#include "devicename/runner.hpp"
#include "devicename/log.hpp"
#include "devicename/naming.hpp"

namespace devicename {

NameRunner::NameRunner(Config config, HardwareInfoSource& source, IdentityApplier* applier,
                       std::ostream& out)
    : config_(std::move(config)), source_(source), applier_(applier), out_(out) {}

Result<DerivedNames> NameRunner::run(bool has_privilege) {
    auto model = source_.read_model_identifier();
    if (model.is_error()) {
        out_ << "could not read the model number: " << model.error_message() << "\n";
        return Result<DerivedNames>::error(model.error_code(), model.error_message());
    }

    auto uuid = source_.read_hardware_uuid();
    if (uuid.is_error()) {
        out_ << "could not read the hardware UUID: " << uuid.error_message() << "\n";
        return Result<DerivedNames>::error(uuid.error_code(), uuid.error_message());
    }

    auto derived = derive_names(model.value(), uuid.value(), config_.suffix_digit_count);
    if (derived.is_error()) {
        out_ << derived.error_message() << "\n";
        return derived;
    }

    const DerivedNames& names = derived.value();
    DEVICENAME_LOG(debug) << "Derived " << names.candidate_name << " ("
                          << names.sanitized_hostname << ") from model " << model.value();

    // Dry runs do not require privilege
    auto valid = validate(names.candidate_name, has_privilege || config_.dry_run);
    if (valid.is_error()) {
        out_ << valid.error_message() << "\n";
        if (valid.error_code() == ErrorCode::InsufficientPrivilege) {
            out_ << "cannot set computer name to " << names.candidate_name << " ("
                 << names.sanitized_hostname << ")\n";
        }
        return Result<DerivedNames>::error(valid.error_code(), valid.error_message());
    }

    out_ << "Setting Computer name to " << names.candidate_name << "\n";
    out_ << "Setting Hostname to " << names.sanitized_hostname << "\n";

    if (config_.dry_run) {
        out_ << "Dry run, host identity left unchanged\n";
        return derived;
    }

    if (applier_ == nullptr) {
        out_ << "no way to apply a computer name on this platform\n";
        return Result<DerivedNames>::error(ErrorCode::ApplyFailed,
                                           "No identity applier for this platform");
    }

    auto applied = applier_->apply_identity(names.candidate_name, names.sanitized_hostname);
    if (applied.is_error()) {
        out_ << applied.error_message() << "\n";
        return Result<DerivedNames>::error(applied.error_code(), applied.error_message());
    }

    DEVICENAME_LOG(info) << "Applied computer name " << names.candidate_name;
    return derived;
}

}  // namespace devicename
