// Orexa - Game Server Supervisor
// Console ring buffer and subscriber channels implementation

#include "orexa/console/console_buffer.hpp"

#include <algorithm>

namespace orexa {
namespace console {

// =============================================================================
// ConsoleChannel
// =============================================================================

ConsoleChannel::ConsoleChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

bool ConsoleChannel::tryPush(const core::ConsoleEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (entries_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        entries_.push_back(entry);
    }
    available_.notify_one();
    return true;
}

std::optional<core::ConsoleEntry> ConsoleChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this]() {
        return closed_ || !entries_.empty();
    });

    if (entries_.empty()) {
        return std::nullopt;
    }

    core::ConsoleEntry entry = std::move(entries_.front());
    entries_.pop_front();
    return entry;
}

void ConsoleChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool ConsoleChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ConsoleChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t ConsoleChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

// =============================================================================
// ConsoleBuffer
// =============================================================================

ConsoleBuffer::ConsoleBuffer(size_t capacity, size_t trimBatch, size_t channelCapacity)
    : capacity_(capacity == 0 ? 1 : capacity)
    , trimBatch_(std::max<size_t>(1, std::min(trimBatch, capacity_)))
    , channelCapacity_(channelCapacity)
{
}

ConsoleBuffer::~ConsoleBuffer() {
    for (auto& subscriber : subscribers_) {
        subscriber.channel->close();
    }
}

core::ConsoleEntry ConsoleBuffer::append(const std::string& line) {
    core::ConsoleEntry entry;
    entry.seq = nextSeq_++;
    entry.line = line;
    entries_.push_back(entry);

    if (entries_.size() > capacity_) {
        size_t drop = std::min(trimBatch_, entries_.size());
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(drop));
    }
    return entry;
}

void ConsoleBuffer::broadcast(const core::ConsoleEntry& entry) {
    for (auto& subscriber : subscribers_) {
        subscriber.channel->tryPush(entry);
    }
}

void ConsoleBuffer::clear() {
    entries_.clear();
    nextSeq_ = 1;
}

ConsoleSubscription ConsoleBuffer::subscribe(core::SequenceNumber lastSeq) {
    ConsoleSubscription subscription;

    if (!entries_.empty()) {
        core::SequenceNumber oldest = entries_.front().seq;
        core::SequenceNumber newest = entries_.back().seq;

        if (lastSeq > newest) {
            // The viewer is ahead of this stream: the process was relaunched
            subscription.reset = true;
        }

        bool fullSnapshot = lastSeq == 0 || lastSeq + 1 < oldest || lastSeq > newest;
        for (const auto& entry : entries_) {
            if (fullSnapshot || entry.seq > lastSeq) {
                subscription.snapshot.push_back(entry);
            }
        }
    } else if (lastSeq > 0) {
        subscription.reset = true;
    }

    subscription.id = nextSubscriberId_++;
    subscription.channel = std::make_shared<ConsoleChannel>(channelCapacity_);
    subscribers_.push_back(Subscriber{subscription.id, subscription.channel});
    return subscription;
}

void ConsoleBuffer::unsubscribe(SubscriberId id) {
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers_.end()) {
        return;
    }
    it->channel->close();
    subscribers_.erase(it);
}

} // namespace console
} // namespace orexa
