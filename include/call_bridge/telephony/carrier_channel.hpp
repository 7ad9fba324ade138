#pragma once

#include <string>

#include "call_bridge/telephony/carrier_protocol.hpp"

namespace call_bridge {
namespace telephony {

// Outbound half of the carrier socket.
class CarrierChannel {
public:
    virtual ~CarrierChannel() = default;

    virtual bool send_text(const std::string& payload) = 0;
    virtual void close(const std::string& reason) = 0;
    virtual bool closed() const = 0;
};

// Inbound carrier events for one call.
class CarrierEventSink {
public:
    virtual ~CarrierEventSink() = default;

    virtual void on_carrier_media(const std::string& base64_payload) = 0;
    virtual void on_carrier_mark(const std::string& name) = 0;
    virtual void on_carrier_stop() = 0;
    virtual void on_carrier_closed(const std::string& reason) = 0;
};

}
}
