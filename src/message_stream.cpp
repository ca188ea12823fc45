#include "internal/message_queue.hpp"

#include <agentlink/message_stream.hpp>
#include <stdexcept>

namespace agentlink
{

MessageStream::MessageStream(std::shared_ptr<internal::MessageQueue> queue)
    : queue_(std::move(queue))
{
}

MessageStream::~MessageStream() = default;

MessageStream::MessageStream(MessageStream&&) noexcept = default;
MessageStream& MessageStream::operator=(MessageStream&&) noexcept = default;

MessageStream::Iterator MessageStream::begin()
{
    return Iterator(this);
}

MessageStream::Iterator MessageStream::end()
{
    return Iterator();
}

std::optional<nlohmann::json> MessageStream::get_next()
{
    if (!queue_)
        return std::nullopt;
    return queue_->pop();
}

std::optional<nlohmann::json> MessageStream::get_next_for(std::chrono::milliseconds timeout)
{
    if (!queue_)
        return std::nullopt;
    return queue_->pop_for(timeout);
}

bool MessageStream::has_more() const
{
    return queue_ && queue_->has_more();
}

// ============================================================================
// MessageStream::Iterator implementation
// ============================================================================

MessageStream::Iterator::Iterator() : stream_(nullptr), is_end_(true) {}

MessageStream::Iterator::Iterator(MessageStream* stream) : stream_(stream), is_end_(false)
{
    fetch_next();
}

void MessageStream::Iterator::fetch_next()
{
    if (!stream_)
    {
        is_end_ = true;
        return;
    }

    current_ = stream_->get_next();
    if (!current_)
        is_end_ = true;
}

MessageStream::Iterator::reference MessageStream::Iterator::operator*() const
{
    if (!current_)
        throw std::runtime_error("Dereferencing end iterator");
    return *current_;
}

MessageStream::Iterator::pointer MessageStream::Iterator::operator->() const
{
    return &(operator*());
}

MessageStream::Iterator& MessageStream::Iterator::operator++()
{
    fetch_next();
    return *this;
}

bool MessageStream::Iterator::operator==(const Iterator& other) const
{
    if (is_end_ && other.is_end_)
        return true;
    if (is_end_ || other.is_end_)
        return false;
    return stream_ == other.stream_;
}

bool MessageStream::Iterator::operator!=(const Iterator& other) const
{
    return !(*this == other);
}

} // namespace agentlink
