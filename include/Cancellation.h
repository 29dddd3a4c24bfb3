#pragma once

#include <functional>
#include <optional>
#include <utility>

/**
 * Cooperative cancellation hook. Long loops poll it at fixed intervals and
 * stop cleanly when it returns true. An empty hook never cancels.
 */
using CancelCheck = std::function<bool()>;

enum class RunStatus { COMPLETED, CANCELLED };

template <typename T>
struct RunOutcome {
    RunStatus status = RunStatus::CANCELLED;
    std::optional<T> result;

    static RunOutcome completed(T value) {
        RunOutcome out;
        out.status = RunStatus::COMPLETED;
        out.result.emplace(std::move(value));
        return out;
    }
    static RunOutcome cancelled() { return RunOutcome{}; }

    bool isCancelled() const noexcept { return status == RunStatus::CANCELLED; }
};

// Thrown internally to unwind a cancelled computation; converted to a
// cancelled RunOutcome at every public run() entry point.
struct OperationCancelled {};

inline void throwIfCancelled(const CancelCheck& shouldCancel) {
    if (shouldCancel && shouldCancel()) throw OperationCancelled{};
}

template <typename T, typename Fn>
RunOutcome<T> runCancellable(Fn&& fn) {
    try {
        return RunOutcome<T>::completed(fn());
    } catch (const OperationCancelled&) {
        return RunOutcome<T>::cancelled();
    }
}
