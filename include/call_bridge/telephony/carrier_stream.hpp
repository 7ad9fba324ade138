#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "call_bridge/telephony/carrier_channel.hpp"
#include "call_bridge/telephony/carrier_protocol.hpp"

namespace call_bridge {
namespace telephony {

// One carrier websocket before and after the start handshake. Control frames
// (mark, stop) that arrive before start are buffered; the first start creates
// the call session exactly once and the buffered frames are replayed into it.
// Media before start is dropped: the session only accepts audio once the AI
// leg is streaming.
class CarrierStream {
public:
    using SessionFactory =
        std::function<std::shared_ptr<CarrierEventSink>(const CarrierEvent& start)>;

    static constexpr size_t kMaxBufferedFrames = 64;

    CarrierStream(std::string connection_id, SessionFactory factory);

    void handle_text(const std::string& text);
    void handle_closed(const std::string& reason);

    bool started() const { return static_cast<bool>(sink_); }
    size_t buffered() const { return buffer_.size(); }
    const std::string& call_id() const { return call_id_; }

private:
    using FrameHandler = std::function<void(const CarrierEvent&)>;

    void buffer_frame(const CarrierEvent& event);
    void route_frame(const CarrierEvent& event);

    std::string connection_id_;
    SessionFactory factory_;
    FrameHandler handler_;
    std::deque<CarrierEvent> buffer_;
    std::shared_ptr<CarrierEventSink> sink_;
    std::string call_id_;
    bool closed_ = false;
};

}
}
