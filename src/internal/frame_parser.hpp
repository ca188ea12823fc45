#ifndef AGENTLINK_INTERNAL_FRAME_PARSER_HPP
#define AGENTLINK_INTERNAL_FRAME_PARSER_HPP

#include <agentlink/protocol/control.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{
namespace protocol
{

// Default limit for a single buffered frame (1MB)
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

enum class FrameKind
{
    ControlResponse, // reply to one of our outbound requests
    ControlRequest,  // reverse request initiated by the remote process
    Message          // anything else: opaque application message
};

struct Frame
{
    FrameKind kind = FrameKind::Message;
    json raw;
    ControlResponse response; // valid when kind == ControlResponse
    ControlRequest request;   // valid when kind == ControlRequest
};

class FrameParser
{
  public:
    explicit FrameParser(size_t max_buffer_size = DEFAULT_MAX_FRAME_SIZE);

    // Parse and classify one complete frame.
    // Throws JSONDecodeError for invalid JSON, MessageParseError for a
    // control envelope missing its mandatory fields or a non-object frame.
    static Frame parse_frame(const std::string& line);

    // Classify an already parsed JSON value
    static Frame classify(json j);

    // Add raw bytes and return every complete, non-empty line.
    // Throws JSONDecodeError when the pending partial line exceeds the limit
    // (the buffer is discarded so the stream can resynchronize on the next newline).
    std::vector<std::string> add_data(const std::string& data);

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    // Return and clear whatever partial line is left (used at end of stream)
    std::string take_buffer();

  private:
    std::string buffer_;
    size_t max_buffer_size_;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();

    static ControlRequest parse_control_request(const json& j);
    static ControlResponse parse_control_response(const json& j);
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_FRAME_PARSER_HPP
