#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_service.hpp>

#include "call_bridge/config.hpp"
#include "call_bridge/telephony/carrier_channel.hpp"
#include "call_bridge/telephony/carrier_stream.hpp"

namespace call_bridge {
namespace telephony {

struct UpgradeCheck {
    int status = 200;
    std::string body;
    std::string destination;
};

// Validates the request target of a carrier upgrade: path must match and the
// destination parameter must hold a phone number.
UpgradeCheck validate_upgrade(const std::string& resource,
                              const std::string& media_path,
                              const std::string& destination_param);

// websocketpp server accepting carrier media streams on the shared io_service.
class MediaGateway {
public:
    using StreamFactory = std::function<std::shared_ptr<CarrierStream>(
        const std::string& connection_id,
        const std::string& destination,
        std::shared_ptr<CarrierChannel> channel)>;

    MediaGateway(boost::asio::io_service& io, const Config& config, StreamFactory factory);
    ~MediaGateway();

    MediaGateway(const MediaGateway&) = delete;
    MediaGateway& operator=(const MediaGateway&) = delete;

    void start();
    void stop();
    size_t connection_count() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

}
}
