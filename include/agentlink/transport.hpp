#ifndef AGENTLINK_TRANSPORT_HPP
#define AGENTLINK_TRANSPORT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace agentlink
{

/**
 * Abstract duplex frame channel to the agent process.
 *
 * The engine never launches or discovers the remote process; it is handed a
 * Transport that is already connected. Frames are single lines of JSON.
 *
 * Implementations include:
 * - PipeTransport: a pair of POSIX file descriptors (create_pipe_transport)
 * - Test doubles that script inbound frames in memory
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Write one frame.
     * @param data Serialized JSON followed by a single newline
     * @throws TransportError if the frame could not be written
     *
     * The session serializes calls to write(); implementations need not.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Return the frames that are currently available, without trailing newlines.
     *
     * May block briefly while waiting for data but must return periodically
     * (well under a second) so the reader thread can observe shutdown.
     * An empty vector is a normal result.
     */
    virtual std::vector<std::string> read_frames() = 0;

    /**
     * False once the remote end has closed and every buffered frame
     * has been returned by read_frames().
     */
    virtual bool is_open() const = 0;

    /**
     * Close the transport connection and clean up resources.
     */
    virtual void close() = 0;
};

struct PipeTransportOptions
{
    /// Maximum size of one buffered frame in bytes (default: 1MB)
    size_t max_frame_size = 1024 * 1024;

    /// How long one read_frames() call waits for data
    int poll_timeout_ms = 100;

    /// Close the file descriptors in close()
    bool owns_fds = true;
};

// Factory for the POSIX file-descriptor transport.
// read_fd receives frames from the agent, write_fd sends frames to it.
std::unique_ptr<Transport> create_pipe_transport(int read_fd, int write_fd,
                                                 const PipeTransportOptions& options = {});

} // namespace agentlink

#endif // AGENTLINK_TRANSPORT_HPP
