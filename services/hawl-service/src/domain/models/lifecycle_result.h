#pragma once

/**
 * @file lifecycle_result.h
 * @brief Typed outcome of a record lifecycle operation
 *
 * Validation failures are values, not exceptions. Infrastructure failures
 * (database, audit write) are still thrown.
 *
 * @date 2026-10-18
 */

#include "nisab_year_record.h"
#include <optional>
#include <string>

namespace nisab::hawl::domain {

enum class LifecycleErrorCode {
    InvalidTransition,
    DuplicateOpenWindow,
    InsufficientJustification,
    RecordNotFound,          ///< also returned when the record belongs to another user
    InvalidInput
};

std::string toString(LifecycleErrorCode code);

struct LifecycleError {
    LifecycleErrorCode code;
    std::string message;
};

class LifecycleResult {
public:
    static LifecycleResult ok(NisabYearRecord record) {
        LifecycleResult r;
        r.record_ = std::move(record);
        return r;
    }

    static LifecycleResult fail(LifecycleErrorCode code, std::string message) {
        LifecycleResult r;
        r.error_ = LifecycleError{code, std::move(message)};
        return r;
    }

    bool isSuccess() const { return !error_.has_value(); }
    explicit operator bool() const { return isSuccess(); }

    const NisabYearRecord& record() const { return *record_; }
    const LifecycleError& error() const { return *error_; }

    bool failedWith(LifecycleErrorCode code) const {
        return error_.has_value() && error_->code == code;
    }

private:
    LifecycleResult() = default;

    std::optional<NisabYearRecord> record_;
    std::optional<LifecycleError> error_;
};

} // namespace nisab::hawl::domain
