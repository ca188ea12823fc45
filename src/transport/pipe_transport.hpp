#ifndef AGENTLINK_TRANSPORT_PIPE_TRANSPORT_HPP
#define AGENTLINK_TRANSPORT_PIPE_TRANSPORT_HPP

#include "../internal/frame_parser.hpp"

#include <agentlink/transport.hpp>
#include <atomic>
#include <mutex>

namespace agentlink
{
namespace transport
{

/**
 * Transport over a pair of POSIX file descriptors (typically the pipes of a
 * child process, or stdin/stdout of the current one).
 *
 * Reads wait with select() so read_frames() never blocks longer than
 * poll_timeout_ms. Oversized frames are discarded with a warning.
 */
class PipeTransport : public Transport
{
  public:
    PipeTransport(int read_fd, int write_fd, const PipeTransportOptions& options);
    ~PipeTransport() override;

    // No copy
    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    void write(const std::string& data) override;
    std::vector<std::string> read_frames() override;
    bool is_open() const override;
    void close() override;

  private:
    int read_fd_;
    int write_fd_;
    PipeTransportOptions options_;
    protocol::FrameParser parser_;

    std::atomic<bool> eof_{false};
    std::atomic<bool> closed_{false};
    std::mutex read_mutex_;

    // Wait up to timeout_ms for the read side to become readable
    bool has_data(int timeout_ms);
};

} // namespace transport
} // namespace agentlink

#endif // AGENTLINK_TRANSPORT_PIPE_TRANSPORT_HPP
