#include "infrastructure/concurrency/FindingChannel.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

FindingChannel::FindingChannel(size_t producerCount) : pendingProducers_(producerCount) {}

void FindingChannel::push(core::ProbeFinding finding) {
    {
        std::lock_guard lock(mutex_);
        if (pendingProducers_ == 0) {
            spdlog::warn("Finding for {} pushed after channel closed", finding.address);
            return;
        }
        queue_.push_back(std::move(finding));
        ++pushed_;
    }
    available_.notify_one();
}

void FindingChannel::producerDone() {
    {
        std::lock_guard lock(mutex_);
        if (pendingProducers_ == 0) {
            return;
        }
        --pendingProducers_;
    }
    available_.notify_all();
}

std::optional<core::ProbeFinding> FindingChannel::pop() {
    std::unique_lock lock(mutex_);
    available_.wait(lock, [this]() { return !queue_.empty() || pendingProducers_ == 0; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    auto finding = std::move(queue_.front());
    queue_.pop_front();
    return finding;
}

bool FindingChannel::closed() const {
    std::lock_guard lock(mutex_);
    return pendingProducers_ == 0;
}

size_t FindingChannel::pushedCount() const {
    std::lock_guard lock(mutex_);
    return pushed_;
}

} // namespace netsweep::infra
