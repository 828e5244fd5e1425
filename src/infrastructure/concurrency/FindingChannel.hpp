#pragma once

#include "core/types/HostRecord.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace netsweep::infra {

/**
 * @brief Multi-producer, single-consumer queue of probe findings.
 *
 * The channel is created with the number of producers feeding it. Each
 * producer calls producerDone() exactly once when it has nothing more to
 * send; once every producer is done and the queue is drained, pop() returns
 * std::nullopt.
 */
class FindingChannel {
public:
    /**
     * @brief Constructs a channel expecting @p producerCount producers.
     */
    explicit FindingChannel(size_t producerCount);

    FindingChannel(const FindingChannel&) = delete;
    FindingChannel& operator=(const FindingChannel&) = delete;

    /**
     * @brief Enqueues a finding. Findings pushed after closing are dropped.
     */
    void push(core::ProbeFinding finding);

    /**
     * @brief Signals that one producer has finished.
     */
    void producerDone();

    /**
     * @brief Blocks until a finding is available or the channel is closed.
     * @return The next finding, or std::nullopt once closed and drained.
     */
    std::optional<core::ProbeFinding> pop();

    /**
     * @brief Checks whether every producer has signalled completion.
     */
    [[nodiscard]] bool closed() const;

    /**
     * @brief Total number of findings accepted so far.
     */
    [[nodiscard]] size_t pushedCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<core::ProbeFinding> queue_;
    size_t pendingProducers_;
    size_t pushed_{0};
};

} // namespace netsweep::infra
