#ifndef AGENTLINK_CANCELLATION_HPP
#define AGENTLINK_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace agentlink
{

/**
 * Read side of a cancellation signal.
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy and
 * share state with the CancellationSource that produced them.
 */
class CancellationToken
{
  public:
    CancellationToken() = default;

    bool is_cancelled() const
    {
        return state_ && state_->load();
    }

    // True if this token is tied to a source (i.e. can ever become cancelled)
    bool can_be_cancelled() const
    {
        return static_cast<bool>(state_);
    }

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<std::atomic<bool>> state_;
};

/**
 * Write side of a cancellation signal.
 *
 * Waits that accept a CancellationToken observe cancel() within one poll interval.
 */
class CancellationSource
{
  public:
    CancellationSource() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()
    {
        state_->store(true);
    }

    bool is_cancelled() const
    {
        return state_->load();
    }

    CancellationToken token() const
    {
        return CancellationToken(state_);
    }

  private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace agentlink

#endif // AGENTLINK_CANCELLATION_HPP
