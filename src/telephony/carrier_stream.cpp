#include "call_bridge/telephony/carrier_stream.hpp"

#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace telephony {

CarrierStream::CarrierStream(std::string connection_id, SessionFactory factory)
    : connection_id_(std::move(connection_id)), factory_(std::move(factory)) {
    handler_ = [this](const CarrierEvent& event) { buffer_frame(event); };
}

void CarrierStream::handle_text(const std::string& text) {
    if (closed_) {
        return;
    }
    auto event = parse_carrier_frame(text);
    if (!event) {
        logging::warn("Malformed carrier frame dropped",
                      {kv("connection", connection_id_), kv("size", text.size())});
        return;
    }
    handler_(*event);
}

void CarrierStream::handle_closed(const std::string& reason) {
    if (closed_) {
        return;
    }
    closed_ = true;
    buffer_.clear();
    if (sink_) {
        sink_->on_carrier_closed(reason);
        sink_.reset();
        return;
    }
    logging::info("Carrier socket closed before start",
                  {kv("connection", connection_id_), kv("reason", reason)});
}

void CarrierStream::buffer_frame(const CarrierEvent& event) {
    if (event.kind != CarrierEventKind::Start) {
        if (event.kind == CarrierEventKind::Connected) {
            return;
        }
        if (event.kind == CarrierEventKind::Media) {
            logging::debug("Carrier media before start dropped",
                           {kv("connection", connection_id_)});
            return;
        }
        if (buffer_.size() >= kMaxBufferedFrames) {
            logging::warn("Carrier frame dropped before start",
                          {kv("connection", connection_id_), kv("event", event.type)});
            return;
        }
        buffer_.push_back(event);
        return;
    }

    if (event.call_id.empty() || event.stream_id.empty()) {
        logging::warn("Carrier start without call or stream id",
                      {kv("connection", connection_id_)});
        return;
    }

    call_id_ = event.call_id;
    handler_ = [this](const CarrierEvent& next) { route_frame(next); };
    sink_ = factory_(event);
    if (!sink_) {
        logging::error("Call session could not be created",
                       {kv("connection", connection_id_), kv("call_id", call_id_)});
        buffer_.clear();
        return;
    }

    auto pending = std::move(buffer_);
    buffer_.clear();
    for (const auto& frame : pending) {
        route_frame(frame);
    }
}

void CarrierStream::route_frame(const CarrierEvent& event) {
    if (!sink_) {
        return;
    }
    switch (event.kind) {
        case CarrierEventKind::Media:
            sink_->on_carrier_media(event.payload);
            break;
        case CarrierEventKind::Mark:
            sink_->on_carrier_mark(event.mark_name);
            break;
        case CarrierEventKind::Stop:
            sink_->on_carrier_stop();
            break;
        case CarrierEventKind::Start:
            logging::warn("Duplicate carrier start ignored",
                          {kv("connection", connection_id_), kv("call_id", call_id_)});
            break;
        case CarrierEventKind::Connected:
        case CarrierEventKind::Unknown:
            logging::debug("Carrier event ignored",
                           {kv("call_id", call_id_), kv("event", event.type)});
            break;
    }
}

}
}
