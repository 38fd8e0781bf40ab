#include "vaultsplit/parallel.hpp"

#include "vaultsplit/constants.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <thread>

namespace vaultsplit::parallel {

namespace {

class FailureSink {
public:
    void Record(std::size_t index, std::string message, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back({index, std::move(message), std::move(error)});
    }

    std::vector<UnitFailure> Take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::sort(failures_.begin(), failures_.end(),
                  [](const UnitFailure& a, const UnitFailure& b) { return a.index < b.index; });
        return std::move(failures_);
    }

private:
    std::mutex mutex_;
    std::vector<UnitFailure> failures_;
};

bool IsCancelled(const RunOptions& options) {
    return options.cancel != nullptr && options.cancel->IsCancelled();
}

void RunUnit(std::size_t index,
             const std::function<void(std::size_t)>& fn,
             FailureSink& sink,
             std::atomic<std::size_t>& completed) {
    try {
        fn(index);
        completed.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& exc) {
        sink.Record(index, exc.what(), std::current_exception());
    } catch (...) {
        sink.Record(index, "unknown error", std::current_exception());
    }
}

}  // namespace

std::size_t ResolveWorkers(std::size_t requested, std::size_t max_tasks) {
    std::size_t workers = requested > 0 ? requested : constants::DefaultWorkers();
    return std::max<std::size_t>(1, std::min(workers, std::max<std::size_t>(1, max_tasks)));
}

ExecutionReport RunIndexed(std::size_t count,
                           const std::function<void(std::size_t)>& fn,
                           const RunOptions& options) {
    ExecutionReport report;
    FailureSink sink;
    std::atomic<std::size_t> completed{0};
    std::size_t workers = options.force_sequential ? 1 : ResolveWorkers(options.workers, count);

    if (workers <= 1) {
        report.mode = ExecutionMode::Sequential;
        report.workers = 1;
        if (options.force_sequential) {
            report.fallback_reason = "sequential execution requested";
        }
        for (std::size_t i = 0; i < count; ++i) {
            if (IsCancelled(options)) {
                report.cancelled = true;
                break;
            }
            RunUnit(i, fn, sink, completed);
        }
    } else {
        std::atomic<std::size_t> next{0};
        std::atomic<bool> saw_cancel{false};
        auto worker_loop = [&]() {
            while (true) {
                if (IsCancelled(options)) {
                    saw_cancel.store(true);
                    break;
                }
                std::size_t idx = next.fetch_add(1);
                if (idx >= count) {
                    break;
                }
                RunUnit(idx, fn, sink, completed);
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            try {
                if (options.spawn) {
                    threads.push_back(options.spawn(worker_loop));
                } else {
                    threads.emplace_back(worker_loop);
                }
            } catch (const std::system_error& exc) {
                report.fallback_reason = std::string("worker spawn failed: ") + exc.what();
                break;
            }
        }
        if (threads.empty()) {
            // No pool at all: the caller's thread drains the queue itself.
            worker_loop();
            report.mode = ExecutionMode::Sequential;
            report.workers = 1;
        } else {
            if (threads.size() < workers) {
                // Partial pool: the caller's thread works alongside it.
                worker_loop();
            }
            for (auto& t : threads) {
                if (t.joinable()) {
                    t.join();
                }
            }
            report.mode = ExecutionMode::Parallel;
            report.workers = threads.size();
        }
        report.cancelled = saw_cancel.load();
    }

    report.failures = sink.Take();
    report.completed = completed.load();
    if (!report.failures.empty()) {
        report.mode = ExecutionMode::Failed;
    }
    return report;
}

std::string_view ModeName(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Parallel:
            return "parallel";
        case ExecutionMode::Sequential:
            return "sequential";
        case ExecutionMode::Failed:
            return "failed";
    }
    return "unknown";
}

}  // namespace vaultsplit::parallel
