#ifndef AGENTLINK_MESSAGE_STREAM_HPP
#define AGENTLINK_MESSAGE_STREAM_HPP

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>

namespace agentlink
{

namespace internal
{
class MessageQueue;
}

// Iterator over the application messages of a session (every frame that is not
// control traffic), forwarded unmodified in arrival order
class MessageStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = nlohmann::json;
        using difference_type = std::ptrdiff_t;
        using pointer = const nlohmann::json*;
        using reference = const nlohmann::json&;

        Iterator();
        explicit Iterator(MessageStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        MessageStream* stream_;
        std::optional<nlohmann::json> current_;
        bool is_end_;

        void fetch_next();
    };

    explicit MessageStream(std::shared_ptr<internal::MessageQueue> queue);
    ~MessageStream();

    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;
    MessageStream(MessageStream&&) noexcept;
    MessageStream& operator=(MessageStream&&) noexcept;

    Iterator begin();
    Iterator end();

    // Get next message (blocking); nullopt once the session is finished and drained
    std::optional<nlohmann::json> get_next();

    // Get next message with timeout (returns nullopt on timeout or end)
    std::optional<nlohmann::json> get_next_for(std::chrono::milliseconds timeout);

    bool has_more() const;

  private:
    std::shared_ptr<internal::MessageQueue> queue_;
};

} // namespace agentlink

#endif // AGENTLINK_MESSAGE_STREAM_HPP
