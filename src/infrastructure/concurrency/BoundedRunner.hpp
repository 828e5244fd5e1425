#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace netsweep::infra {

/**
 * @brief Runs a task over a list of items with a capped number of worker threads.
 *
 * Workers pull the next unclaimed item from a shared index until the list is
 * exhausted, so at most maxConcurrency() tasks are in flight at once. Each
 * worker may build its own task through a factory, which lets a worker own
 * resources (a socket, a buffer) for the length of its session.
 *
 * If a factory or task throws, no further items are handed out, in-flight
 * tasks finish, and the first exception is rethrown from run(). If only some
 * worker threads can be created, the run continues on those; if none can,
 * run() throws std::system_error.
 *
 * @tparam Item Element type of the work list.
 */
template <typename Item>
class BoundedRunner {
public:
    using Task = std::function<void(const Item&)>;
    using WorkerFactory = std::function<Task(size_t workerIndex)>;

    /**
     * @brief Constructs a runner.
     * @param maxConcurrency Maximum worker threads (values below 1 become 1).
     * @param name Name used in log messages.
     */
    explicit BoundedRunner(size_t maxConcurrency, std::string name = "runner")
        : maxConcurrency_(std::max<size_t>(maxConcurrency, 1)), name_(std::move(name)) {}

    virtual ~BoundedRunner() = default;

    BoundedRunner(const BoundedRunner&) = delete;
    BoundedRunner& operator=(const BoundedRunner&) = delete;

    /**
     * @brief Runs the same task for every item.
     */
    void run(const std::vector<Item>& items, const Task& task) {
        run(items, WorkerFactory([&task](size_t) { return task; }));
    }

    /**
     * @brief Runs a per-worker task for every item and waits for completion.
     * @param items Work list; each item is processed at most once.
     * @param factory Called once per worker thread to build that worker's task.
     *
     * With integral items a factory lambda also converts to Task, so pass a
     * WorkerFactory object to select this overload.
     */
    void run(const std::vector<Item>& items, const WorkerFactory& factory) {
        if (items.empty()) {
            return;
        }

        cancelled_ = false;
        std::atomic<size_t> nextIndex{0};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        const size_t workerCount = std::min(maxConcurrency_, items.size());
        spdlog::debug("{}: {} items on {} workers", name_, items.size(), workerCount);

        auto work = [&](size_t workerIndex) {
            try {
                Task task = factory(workerIndex);
                while (!cancelled_) {
                    size_t index = nextIndex++;
                    if (index >= items.size()) {
                        break;
                    }
                    task(items[index]);
                }
            } catch (...) {
                std::lock_guard lock(errorMutex);
                if (!firstError) {
                    firstError = std::current_exception();
                }
                cancelled_ = true;
            }
        };

        // Workers drain the shared index, so the ones that did start still
        // cover every item when thread creation fails part way
        std::vector<std::jthread> workers;
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            try {
                workers.push_back(spawn([&work, i]() { work(i); }));
            } catch (const std::system_error& e) {
                if (workers.empty()) {
                    spdlog::error("{}: no worker thread could start: {}", name_, e.what());
                    throw;
                }
                spdlog::warn("{}: started {} of {} workers: {}", name_, workers.size(),
                             workerCount, e.what());
                break;
            }
        }
        workers.clear();

        if (firstError) {
            spdlog::debug("{}: aborted after a worker failure", name_);
            std::rethrow_exception(firstError);
        }
    }

    /**
     * @brief Stops handing out items; in-flight tasks still finish.
     */
    void cancel() { cancelled_ = true; }

    [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

    [[nodiscard]] size_t maxConcurrency() const { return maxConcurrency_; }

protected:
    /**
     * @brief Starts one worker thread running @p body.
     * @throws std::system_error when the thread cannot be created.
     */
    virtual std::jthread spawn(std::function<void()> body) { return std::jthread(std::move(body)); }

private:
    size_t maxConcurrency_;
    std::string name_;
    std::atomic<bool> cancelled_{false};
};

} // namespace netsweep::infra
