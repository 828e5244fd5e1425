#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace netsweep::infra {

/**
 * @brief I/O threads that carry every socket probe of one discovery run.
 *
 * The threads start with the object and live until shutdown() or
 * destruction. Shutdown drains instead of stopping: probes already issued
 * still complete, which terminates because each one is bounded by its own
 * timer.
 */
class ProbeRuntime {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    /// Concurrent probes one I/O thread is expected to keep in flight
    static constexpr size_t PROBES_PER_THREAD = 32;

    explicit ProbeRuntime(size_t threadCount);
    ~ProbeRuntime();

    ProbeRuntime(const ProbeRuntime&) = delete;
    ProbeRuntime& operator=(const ProbeRuntime&) = delete;

    /**
     * @brief I/O thread count for a given number of probes in flight.
     *
     * One thread per PROBES_PER_THREAD probes, at least one, and no more than
     * twice the hardware concurrency.
     */
    static size_t threadsFor(size_t concurrentProbes);

    /**
     * @brief New strand for one probe operation's handlers.
     */
    Strand makeStrand() { return asio::make_strand(ioContext_); }

    asio::io_context& ioContext() { return ioContext_; }

    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    /**
     * @brief False once shutdown() has begun.
     */
    [[nodiscard]] bool accepting() const { return accepting_.load(); }

    /**
     * @brief Lets outstanding probes finish, then joins the I/O threads.
     *
     * Idempotent. Call it once no thread issues new probes; SocketProbe
     * answers probes issued afterwards with an empty result.
     */
    void shutdown();

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::jthread> threads_;
    std::atomic<bool> accepting_{true};
    size_t threadCount_;
};

} // namespace netsweep::infra
