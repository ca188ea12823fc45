#include "message_queue.hpp"

namespace agentlink
{
namespace internal
{

MessageQueue::MessageQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool MessageQueue::push(nlohmann::json message, const CancellationToken& cancel)
{
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait in slices so a cancellation without a notify is still observed
    while (!closed_ && queue_.size() >= capacity_)
    {
        if (cancel.is_cancelled())
            return false;
        not_full_.wait_for(lock, PUSH_POLL_INTERVAL);
    }

    if (closed_)
        return false;

    queue_.push_back(std::move(message));
    not_empty_.notify_one();
    return true;
}

std::optional<nlohmann::json> MessageQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);

    not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty())
        return std::nullopt;

    nlohmann::json msg = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return msg;
}

std::optional<nlohmann::json> MessageQueue::pop_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; }))
        return std::nullopt;

    if (queue_.empty())
        return std::nullopt;

    nlohmann::json msg = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return msg;
}

void MessageQueue::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool MessageQueue::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool MessageQueue::has_more() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty() || !closed_;
}

size_t MessageQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace internal
} // namespace agentlink
