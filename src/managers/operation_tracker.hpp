#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

struct OperationSnapshot {
    std::string status;                      // operation name, or "idle"
    std::optional<std::string> last_error;
    std::string started_at;                  // ISO timestamp of the last begin()
};

// Single-slot operation gate. begin() is the only way to claim the
// environment for a long-running operation; complete() always returns the
// slot to idle and keeps the failure (if any) until the next begin().
class OperationTracker {
public:
    // AlreadyRunning if another operation holds the slot.
    Result<void> begin(const std::string& op);

    // InvalidArgument (and no state change) if `op` is not the current operation.
    Result<void> complete(const std::string& op,
                          const std::optional<std::string>& error = std::nullopt);

    OperationSnapshot current_status() const;
    bool idle() const;

private:
    mutable std::mutex mutex_;
    std::string status_ = "idle";
    std::optional<std::string> last_error_;
    std::string started_at_;
};
