// Orexa - Game Server Supervisor
// Console ring buffer and subscriber channels
//
// Holds the most recent output lines of one instance with per-launch
// sequence numbers and fans new lines out to live subscribers. Implements the
// resumable subscription contract: a viewer presents the last sequence it
// saw and receives either an incremental replay, a full resend, or a reset.

#ifndef OREXA_CONSOLE_CONSOLE_BUFFER_HPP
#define OREXA_CONSOLE_CONSOLE_BUFFER_HPP

#include "orexa/core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace orexa {
namespace console {

/**
 * @brief Bounded queue of console entries for one subscriber.
 *
 * The producer never blocks: pushing into a full channel drops the entry
 * for this subscriber and counts it.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 */
class ConsoleChannel {
public:
    explicit ConsoleChannel(size_t capacity);

    // Non-copyable, non-movable
    ConsoleChannel(const ConsoleChannel&) = delete;
    ConsoleChannel& operator=(const ConsoleChannel&) = delete;
    ConsoleChannel(ConsoleChannel&&) = delete;
    ConsoleChannel& operator=(ConsoleChannel&&) = delete;

    /**
     * @brief Enqueue without blocking.
     * @return false if the channel is full or closed
     */
    bool tryPush(const core::ConsoleEntry& entry);

    /**
     * @brief Wait up to timeout for the next entry.
     * @return The entry, or std::nullopt on timeout or once closed and drained
     */
    std::optional<core::ConsoleEntry> pop(std::chrono::milliseconds timeout);

    /**
     * @brief Wake all waiters; further pushes are rejected. Idempotent.
     */
    void close();

    bool isClosed() const;

    size_t size() const;

    size_t capacity() const { return capacity_; }

    uint64_t droppedCount() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<core::ConsoleEntry> entries_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

using SubscriberId = uint64_t;

/**
 * @brief What a new subscriber receives.
 */
struct ConsoleSubscription {
    SubscriberId id = 0;
    std::vector<core::ConsoleEntry> snapshot;   ///< Entries to replay first
    bool reset = false;                         ///< Drop previously shown history
    std::shared_ptr<ConsoleChannel> channel;    ///< Live entries after the snapshot
};

/**
 * @brief Per-instance console history and subscriber set.
 *
 * Not internally synchronized: every call happens under the owning
 * instance's lock, which also orders sequence assignment with the rest of
 * the instance state.
 */
class ConsoleBuffer {
public:
    /**
     * @param capacity Maximum retained entries
     * @param trimBatch Entries dropped at once when capacity is exceeded
     * @param channelCapacity Queue size of each subscriber channel
     */
    ConsoleBuffer(size_t capacity, size_t trimBatch, size_t channelCapacity);

    /**
     * @brief Closes every subscriber channel.
     */
    ~ConsoleBuffer();

    // Non-copyable
    ConsoleBuffer(const ConsoleBuffer&) = delete;
    ConsoleBuffer& operator=(const ConsoleBuffer&) = delete;

    /**
     * @brief Store a line under the next sequence number.
     */
    core::ConsoleEntry append(const std::string& line);

    /**
     * @brief Offer an entry to every subscriber (best effort).
     */
    void broadcast(const core::ConsoleEntry& entry);

    /**
     * @brief Forget all entries; the next append gets sequence 1.
     *
     * Subscribers stay attached and see the rewind as a reset on their next
     * resubscription.
     */
    void clear();

    /**
     * @brief Attach a subscriber that last saw lastSeq (0 for none).
     *
     * Full snapshot when lastSeq is 0, older than the oldest retained entry,
     * or newer than the newest one; otherwise only entries after lastSeq.
     * reset is set when lastSeq is ahead of the newest entry, or when the
     * buffer is empty and lastSeq is non-zero.
     */
    ConsoleSubscription subscribe(core::SequenceNumber lastSeq);

    /**
     * @brief Detach and close a subscriber. Unknown ids are ignored.
     */
    void unsubscribe(SubscriberId id);

    const std::deque<core::ConsoleEntry>& entries() const { return entries_; }

    size_t subscriberCount() const { return subscribers_.size(); }

    core::SequenceNumber nextSequence() const { return nextSeq_; }

private:
    struct Subscriber {
        SubscriberId id;
        std::shared_ptr<ConsoleChannel> channel;
    };

    const size_t capacity_;
    const size_t trimBatch_;
    const size_t channelCapacity_;

    std::deque<core::ConsoleEntry> entries_;
    core::SequenceNumber nextSeq_ = 1;

    std::vector<Subscriber> subscribers_;
    SubscriberId nextSubscriberId_ = 1;
};

} // namespace console
} // namespace orexa

#endif // OREXA_CONSOLE_CONSOLE_BUFFER_HPP
