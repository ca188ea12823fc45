#include "../../src/internal/frame_parser.hpp"

#include <agentlink/errors.hpp>
#include <gtest/gtest.h>

using namespace agentlink;
using namespace agentlink::protocol;

TEST(FrameParserTest, ClassifiesControlResponse)
{
    Frame frame = FrameParser::parse_frame(
        R"({"type":"control_response","response":{"subtype":"success","request_id":"req_1_abcd0123","response":{"x":1}}})");

    ASSERT_EQ(frame.kind, FrameKind::ControlResponse);
    EXPECT_EQ(frame.response.response.request_id, "req_1_abcd0123");
    EXPECT_FALSE(frame.response.is_error());
    EXPECT_EQ(frame.response.response.response["x"], 1);
}

TEST(FrameParserTest, ClassifiesErrorResponse)
{
    Frame frame = FrameParser::parse_frame(
        R"({"type":"control_response","response":{"subtype":"error","request_id":"r","error":"bad"}})");

    ASSERT_EQ(frame.kind, FrameKind::ControlResponse);
    EXPECT_TRUE(frame.response.is_error());
    EXPECT_EQ(frame.response.response.error, "bad");
}

TEST(FrameParserTest, ClassifiesReverseRequest)
{
    Frame frame = FrameParser::parse_frame(
        R"({"type":"control_request","request_id":"cli_7","request":{"subtype":"can_use_tool","tool_name":"Bash"}})");

    ASSERT_EQ(frame.kind, FrameKind::ControlRequest);
    EXPECT_EQ(frame.request.request_id, "cli_7");
    EXPECT_EQ(frame.request.subtype(), "can_use_tool");
    EXPECT_EQ(frame.request.request["tool_name"], "Bash");
}

TEST(FrameParserTest, OtherFramesAreApplicationMessages)
{
    Frame assistant = FrameParser::parse_frame(
        R"({"type":"assistant","message":{"content":[{"type":"text","text":"hi"}]}})");
    EXPECT_EQ(assistant.kind, FrameKind::Message);
    EXPECT_EQ(assistant.raw["type"], "assistant");

    // No type at all is still forwarded
    Frame untyped = FrameParser::parse_frame(R"({"hello":"world"})");
    EXPECT_EQ(untyped.kind, FrameKind::Message);
    EXPECT_EQ(untyped.raw["hello"], "world");
}

TEST(FrameParserTest, InvalidJsonThrowsDecodeError)
{
    EXPECT_THROW(FrameParser::parse_frame("{not json"), JSONDecodeError);
}

TEST(FrameParserTest, NonObjectThrowsParseError)
{
    EXPECT_THROW(FrameParser::parse_frame("[1,2,3]"), MessageParseError);
}

TEST(FrameParserTest, ControlEnvelopesWithoutRequestIdAreRejected)
{
    EXPECT_THROW(FrameParser::parse_frame(R"({"type":"control_request","request":{}})"),
                 MessageParseError);
    EXPECT_THROW(
        FrameParser::parse_frame(R"({"type":"control_response","response":{"subtype":"success"}})"),
        MessageParseError);
    EXPECT_THROW(FrameParser::parse_frame(R"({"type":"control_response"})"), MessageParseError);
}

TEST(FrameParserTest, NonObjectRequestPayloadIsKeptNull)
{
    Frame frame =
        FrameParser::parse_frame(R"({"type":"control_request","request_id":"x","request":"oops"})");
    ASSERT_EQ(frame.kind, FrameKind::ControlRequest);
    EXPECT_TRUE(frame.request.request.is_null());
    EXPECT_EQ(frame.request.subtype(), "");
}

TEST(FrameParserTest, AddDataSplitsLinesAcrossChunks)
{
    FrameParser parser;

    auto first = parser.add_data("{\"a\":1}\n{\"b\":");
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], "{\"a\":1}");
    EXPECT_TRUE(parser.has_buffered_data());

    auto second = parser.add_data("2}\r\n\n");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], "{\"b\":2}");
    EXPECT_FALSE(parser.has_buffered_data());
}

TEST(FrameParserTest, TakeBufferReturnsPartialLine)
{
    FrameParser parser;
    parser.add_data("{\"tail\":true}");
    EXPECT_EQ(parser.take_buffer(), "{\"tail\":true}");
    EXPECT_FALSE(parser.has_buffered_data());
}

TEST(FrameParserTest, OversizedBufferIsDiscarded)
{
    FrameParser parser(16);

    EXPECT_THROW(parser.add_data(std::string(32, 'x')), JSONDecodeError);
    EXPECT_FALSE(parser.has_buffered_data());

    // Parser keeps working afterwards
    auto lines = parser.add_data("{}\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{}");
}
