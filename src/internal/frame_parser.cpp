#include "frame_parser.hpp"

#include <agentlink/errors.hpp>

namespace agentlink
{
namespace protocol
{

FrameParser::FrameParser(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

Frame FrameParser::parse_frame(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }

    return classify(std::move(j));
}

Frame FrameParser::classify(json j)
{
    if (!j.is_object())
        throw MessageParseError("Frame is not a JSON object", j);

    Frame frame;

    // Frames without a string "type" are forwarded untouched
    auto type_it = j.find("type");
    if (type_it != j.end() && type_it->is_string())
    {
        const auto& type = type_it->get_ref<const std::string&>();
        if (type == TYPE_CONTROL_RESPONSE)
        {
            frame.kind = FrameKind::ControlResponse;
            frame.response = parse_control_response(j);
        }
        else if (type == TYPE_CONTROL_REQUEST)
        {
            frame.kind = FrameKind::ControlRequest;
            frame.request = parse_control_request(j);
        }
    }

    frame.raw = std::move(j);
    return frame;
}

std::vector<std::string> FrameParser::add_data(const std::string& data)
{
    buffer_ += data;

    if (buffer_.size() > max_buffer_size_)
    {
        size_t size = buffer_.size();
        buffer_.clear();
        throw JSONDecodeError("Buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(size) + ")");
    }

    std::vector<std::string> lines;

    while (auto line = extract_line())
    {
        if (!line->empty() && line->back() == '\r')
            line->pop_back();
        if (line->empty())
            continue;
        lines.push_back(std::move(*line));
    }

    return lines;
}

std::string FrameParser::take_buffer()
{
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

std::optional<std::string> FrameParser::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    return line;
}

ControlRequest FrameParser::parse_control_request(const json& j)
{
    ControlRequest req;

    auto id_it = j.find("request_id");
    if (id_it == j.end() || !id_it->is_string() || id_it->get_ref<const std::string&>().empty())
        throw MessageParseError("Control request missing request_id", j);
    req.request_id = id_it->get<std::string>();

    // A non-object payload is kept as null; the dispatcher answers it with an error
    auto req_it = j.find("request");
    if (req_it != j.end() && req_it->is_object())
        req.request = *req_it;

    return req;
}

ControlResponse FrameParser::parse_control_response(const json& j)
{
    ControlResponse resp;

    auto resp_it = j.find("response");
    if (resp_it == j.end() || !resp_it->is_object())
        throw MessageParseError("Control response missing response object", j);

    const json& inner = *resp_it;

    auto id_it = inner.find("request_id");
    if (id_it == inner.end() || !id_it->is_string())
        throw MessageParseError("Control response missing request_id", j);
    resp.response.request_id = id_it->get<std::string>();

    // Anything other than "error" is treated as success
    auto subtype_it = inner.find("subtype");
    if (subtype_it != inner.end() && subtype_it->is_string())
        resp.response.subtype = subtype_it->get<std::string>();

    auto err_it = inner.find("error");
    if (err_it != inner.end() && err_it->is_string())
        resp.response.error = err_it->get<std::string>();

    auto data_it = inner.find("response");
    if (data_it != inner.end())
        resp.response.response = *data_it;

    return resp;
}

} // namespace protocol
} // namespace agentlink
