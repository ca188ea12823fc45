#pragma once

#include <agentlink/errors.hpp>
#include <agentlink/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentlink::test
{

using json = nlohmann::json;

// In-memory transport: tests script inbound frames and inspect what the session wrote.
class MockTransport : public Transport
{
  public:
    // Called for every written frame; returned lines are queued as inbound frames
    using Responder = std::function<std::vector<std::string>(const json& frame)>;

    void write(const std::string& data) override
    {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                throw TransportError("Cannot write to closed transport");
            if (fail_writes_)
                throw TransportError("Simulated write failure");
            written_.push_back(data);
            responder = responder_;
        }
        cv_.notify_all();

        if (responder)
        {
            for (auto& line : responder(json::parse(data)))
                push_line(line);
        }
    }

    std::vector<std::string> read_frames() override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(20),
                     [this] { return !inbound_.empty() || closed_ || eof_; });

        std::vector<std::string> frames(inbound_.begin(), inbound_.end());
        inbound_.clear();
        return frames;
    }

    bool is_open() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_ && !(eof_ && inbound_.empty());
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    // ------------------------------------------------------------------------
    // Scripting helpers
    // ------------------------------------------------------------------------

    void push_line(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(line);
        cv_.notify_all();
    }

    void push_frame(const json& frame)
    {
        push_line(frame.dump());
    }

    // Remote end closes its output once queued frames are consumed
    void finish()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        eof_ = true;
        cv_.notify_all();
    }

    void set_responder(Responder responder)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_fail_writes(bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::vector<json> written_frames() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> frames;
        for (const auto& line : written_)
            frames.push_back(json::parse(line));
        return frames;
    }

    std::vector<std::string> written_lines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    size_t write_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_.size();
    }

    bool wait_for_writes(size_t count,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return written_.size() >= count; });
    }

    // Wait for the control_response the session sent for an inbound request
    std::optional<json> wait_for_reply(const std::string& request_id,
                                       std::chrono::milliseconds timeout =
                                           std::chrono::milliseconds(2000))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<json> found;
        cv_.wait_for(lock, timeout,
                     [&]
                     {
                         for (const auto& line : written_)
                         {
                             json frame = json::parse(line);
                             if (frame.value("type", "") == "control_response" &&
                                 frame["response"].value("request_id", "") == request_id)
                             {
                                 found = frame;
                                 return true;
                             }
                         }
                         return false;
                     });
        return found;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> written_;
    Responder responder_;
    bool closed_ = false;
    bool eof_ = false;
    bool fail_writes_ = false;
};

// ----------------------------------------------------------------------------
// Frame builders
// ----------------------------------------------------------------------------

inline json success_reply(const std::string& request_id, const json& payload = json::object())
{
    return json{{"type", "control_response"},
                {"response",
                 {{"subtype", "success"}, {"request_id", request_id}, {"response", payload}}}};
}

inline json error_reply(const std::string& request_id, const std::string& message)
{
    return json{
        {"type", "control_response"},
        {"response", {{"subtype", "error"}, {"request_id", request_id}, {"error", message}}}};
}

inline json reverse_request(const std::string& request_id, const json& request)
{
    return json{{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

// Responder that answers every outbound control request with success,
// echoing the subtype back as {"echo": <subtype>}
inline MockTransport::Responder echo_responder()
{
    return [](const json& frame) -> std::vector<std::string>
    {
        if (frame.value("type", "") != "control_request")
            return {};
        std::string id = frame["request_id"].get<std::string>();
        return {success_reply(id, {{"echo", frame["request"]["subtype"]}}).dump()};
    };
}

} // namespace agentlink::test
