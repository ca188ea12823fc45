#ifndef AGENTLINK_INTERNAL_MESSAGE_QUEUE_HPP
#define AGENTLINK_INTERNAL_MESSAGE_QUEUE_HPP

#include <agentlink/cancellation.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace agentlink
{
namespace internal
{

// Bounded queue of application messages between the reader thread and the consumer.
// Once closed, queued messages can still be drained; pops then return nullopt.
class MessageQueue
{
  public:
    explicit MessageQueue(size_t capacity);

    // Blocks while the queue is full. Returns false, dropping the message, when the
    // queue is closed or the token fires before space frees up.
    bool push(nlohmann::json message, const CancellationToken& cancel = CancellationToken{});

    // Blocks until a message is available or the queue is closed and empty
    std::optional<nlohmann::json> pop();

    // Returns nullopt on timeout or when closed and empty
    std::optional<nlohmann::json> pop_for(std::chrono::milliseconds timeout);

    void close();

    bool is_closed() const;
    bool has_more() const;
    size_t size() const;
    size_t capacity() const
    {
        return capacity_;
    }

  private:
    static constexpr std::chrono::milliseconds PUSH_POLL_INTERVAL{10};

    const size_t capacity_;
    std::deque<nlohmann::json> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_MESSAGE_QUEUE_HPP
