#include "operation_tracker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Result<void> OperationTracker::begin(const std::string& op) {
    if (op.empty() || op == OP_IDLE) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
                                 fmt::format("invalid operation name '{}'", op));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != OP_IDLE) {
        return Result<void>::Err(ErrorKind::AlreadyRunning,
            fmt::format("operation '{}' is already running", status_));
    }
    status_ = op;
    last_error_.reset();
    started_at_ = now_iso();
    log_info(fmt::format("Operation started: {}", op));
    return Result<void>::Ok();
}

Result<void> OperationTracker::complete(const std::string& op,
                                        const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != op) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
            fmt::format("cannot complete '{}': current operation is '{}'", op, status_));
    }
    status_ = OP_IDLE;
    last_error_ = error;
    if (error) {
        log_error(fmt::format("Operation failed: {}: {}", op, *error));
    } else {
        log_info(fmt::format("Operation completed: {}", op));
    }
    return Result<void>::Ok();
}

OperationSnapshot OperationTracker::current_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {status_, last_error_, started_at_};
}

bool OperationTracker::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == OP_IDLE;
}
