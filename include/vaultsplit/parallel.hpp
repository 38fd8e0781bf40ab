#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vaultsplit::parallel {

enum class ExecutionMode {
    Parallel,
    Sequential,
    Failed
};

class CancelToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct UnitFailure {
    std::size_t index = 0;
    std::string message;
    std::exception_ptr error;
};

struct ExecutionReport {
    ExecutionMode mode = ExecutionMode::Sequential;
    std::size_t workers = 1;
    // Set when the pool ran with fewer workers than requested.
    std::string fallback_reason;
    // Sorted by unit index.
    std::vector<UnitFailure> failures;
    bool cancelled = false;
    std::size_t completed = 0;

    bool Ok() const noexcept { return failures.empty() && !cancelled; }
};

struct RunOptions {
    // 0 resolves to VAULTSPLIT_WORKERS or the hardware concurrency.
    std::size_t workers = 0;
    bool force_sequential = false;
    const CancelToken* cancel = nullptr;
    // Starts one worker thread; empty uses std::thread. A spawner that throws
    // std::system_error is treated like a failed thread launch.
    std::function<std::thread(std::function<void()>)> spawn;
};

// Runs fn(i) for every i in [0, count). Units are independent; a throwing
// unit is recorded and the remaining units still run. Workers stop pulling
// new units once the token is cancelled.
ExecutionReport RunIndexed(std::size_t count,
                           const std::function<void(std::size_t)>& fn,
                           const RunOptions& options = {});

std::size_t ResolveWorkers(std::size_t requested, std::size_t max_tasks);
std::string_view ModeName(ExecutionMode mode);

}  // namespace vaultsplit::parallel
