#include "infrastructure/network/ProbeRuntime.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace netsweep::infra {

ProbeRuntime::ProbeRuntime(size_t threadCount)
    : workGuard_(asio::make_work_guard(ioContext_)),
      threadCount_(std::max<size_t>(threadCount, 1)) {
    threads_.reserve(threadCount_);
    try {
        for (size_t i = 0; i < threadCount_; ++i) {
            threads_.emplace_back([this]() { ioContext_.run(); });
        }
    } catch (const std::system_error& e) {
        spdlog::error("Probe runtime could not start I/O threads: {}", e.what());
        accepting_ = false;
        workGuard_.reset();
        threads_.clear();
        throw;
    }
    spdlog::debug("Probe runtime running {} I/O threads", threadCount_);
}

ProbeRuntime::~ProbeRuntime() {
    shutdown();
}

size_t ProbeRuntime::threadsFor(size_t concurrentProbes) {
    const size_t ceiling = std::max<size_t>(2 * std::thread::hardware_concurrency(), 1);
    const size_t wanted = (concurrentProbes + PROBES_PER_THREAD - 1) / PROBES_PER_THREAD;
    return std::clamp<size_t>(wanted, 1, ceiling);
}

void ProbeRuntime::shutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }

    // Without the guard run() returns once the last pending probe completes
    workGuard_.reset();
    threads_.clear();
    spdlog::debug("Probe runtime drained");
}

} // namespace netsweep::infra
