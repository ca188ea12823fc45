#include "pipe_transport.hpp"

#include "../internal/logging.hpp"

#include <agentlink/errors.hpp>
#include <cerrno>
#include <cstring>
#include <sys/select.h>
#include <unistd.h>

namespace agentlink
{
namespace transport
{

namespace
{
std::string get_errno_message()
{
    return std::strerror(errno);
}
} // namespace

PipeTransport::PipeTransport(int read_fd, int write_fd, const PipeTransportOptions& options)
    : read_fd_(read_fd), write_fd_(write_fd), options_(options), parser_(options.max_frame_size)
{
}

PipeTransport::~PipeTransport()
{
    close();
}

void PipeTransport::write(const std::string& data)
{
    if (closed_ || write_fd_ < 0)
        throw TransportError("Cannot write to closed transport");

    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0)
    {
        ssize_t written = ::write(write_fd_, ptr, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw TransportError("Broken pipe (agent closed its input)");
            throw TransportError("Write failed: " + get_errno_message());
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
}

bool PipeTransport::has_data(int timeout_ms)
{
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(read_fd_, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(read_fd_ + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw TransportError("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(read_fd_, &read_fds);
}

std::vector<std::string> PipeTransport::read_frames()
{
    std::lock_guard<std::mutex> lock(read_mutex_);

    if (closed_ || eof_ || read_fd_ < 0)
        return {};

    try
    {
        if (!has_data(options_.poll_timeout_ms))
            return {};
    }
    catch (const TransportError& e)
    {
        log::logger()->error("pipe transport: {}", e.what());
        eof_ = true;
        return {};
    }

    char buffer[4096];
    ssize_t n = ::read(read_fd_, buffer, sizeof(buffer));
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            return {};
        log::logger()->error("pipe transport read failed: {}", get_errno_message());
        eof_ = true;
        return {};
    }

    if (n == 0)
    {
        // EOF: a final frame without trailing newline still counts
        eof_ = true;
        std::string rest = parser_.take_buffer();
        if (!rest.empty() && rest.back() == '\r')
            rest.pop_back();
        if (rest.empty())
            return {};
        return {rest};
    }

    try
    {
        return parser_.add_data(std::string(buffer, static_cast<size_t>(n)));
    }
    catch (const JSONDecodeError& e)
    {
        log::logger()->warn("pipe transport discarded oversized frame: {}", e.what());
        return {};
    }
}

bool PipeTransport::is_open() const
{
    return !closed_ && !eof_;
}

void PipeTransport::close()
{
    if (closed_.exchange(true))
        return;

    if (!options_.owns_fds)
        return;

    if (write_fd_ >= 0)
        ::close(write_fd_);
    // Same descriptor used for both directions (e.g. a socket)
    if (read_fd_ >= 0 && read_fd_ != write_fd_)
        ::close(read_fd_);
    write_fd_ = -1;
    read_fd_ = -1;
}

} // namespace transport

std::unique_ptr<Transport> create_pipe_transport(int read_fd, int write_fd,
                                                 const PipeTransportOptions& options)
{
    return std::make_unique<transport::PipeTransport>(read_fd, write_fd, options);
}

} // namespace agentlink
