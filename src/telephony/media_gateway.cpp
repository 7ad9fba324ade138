#include "call_bridge/telephony/media_gateway.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"
#include "call_bridge/utils/text.hpp"

namespace call_bridge {
namespace telephony {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

class WsCarrierChannel : public CarrierChannel {
public:
    WsCarrierChannel(WsServer& server, websocketpp::connection_hdl hdl)
        : server_(server), hdl_(std::move(hdl)) {}

    bool send_text(const std::string& payload) override {
        if (closed_) {
            return false;
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
        return !ec;
    }

    void close(const std::string& reason) override {
        if (closed_.exchange(true)) {
            return;
        }
        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::normal, reason, ec);
        if (ec) {
            logging::debug("Carrier close skipped", {kv("error", ec.message())});
        }
    }

    bool closed() const override { return closed_; }

    void mark_closed() { closed_ = true; }

private:
    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    std::atomic<bool> closed_{false};
};

struct Connection {
    std::shared_ptr<CarrierStream> stream;
    std::shared_ptr<WsCarrierChannel> channel;
};

}

UpgradeCheck validate_upgrade(const std::string& resource,
                              const std::string& media_path,
                              const std::string& destination_param) {
    std::string path;
    std::string query;
    utils::split_target(resource, path, query);
    if (path != media_path) {
        return {404, "Not found", ""};
    }
    const auto params = utils::parse_query(query);
    auto it = params.find(destination_param);
    if (it == params.end()) {
        return {400, "Missing or invalid destination number", ""};
    }
    auto number = utils::normalize_phone_number(it->second);
    if (!number) {
        return {400, "Missing or invalid destination number", ""};
    }
    return {200, "", *number};
}

struct MediaGateway::Impl {
    Impl(const Config& config, StreamFactory factory)
        : config(config), factory(std::move(factory)) {}

    void on_open(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr message);
    void on_gone(websocketpp::connection_hdl hdl, const std::string& reason);
    bool validate(websocketpp::connection_hdl hdl);

    const Config& config;
    StreamFactory factory;
    WsServer server;
    mutable std::mutex mutex;
    std::map<websocketpp::connection_hdl, Connection,
             std::owner_less<websocketpp::connection_hdl>> connections;
    unsigned long next_id = 0;
    bool listening = false;
};

bool MediaGateway::Impl::validate(websocketpp::connection_hdl hdl) {
    auto con = server.get_con_from_hdl(hdl);
    const auto check = validate_upgrade(con->get_resource(), config.media_path,
                                        config.destination_param);
    if (check.status == 200) {
        return true;
    }
    logging::warn("Carrier upgrade rejected",
                  {kv("resource", con->get_resource()), kv("status", check.status)});
    con->set_status(static_cast<websocketpp::http::status_code::value>(check.status));
    con->append_header("Content-Type", "text/plain");
    con->set_body(check.body);
    return false;
}

void MediaGateway::Impl::on_open(websocketpp::connection_hdl hdl) {
    auto con = server.get_con_from_hdl(hdl);
    const auto check = validate_upgrade(con->get_resource(), config.media_path,
                                        config.destination_param);
    auto channel = std::make_shared<WsCarrierChannel>(server, hdl);
    std::string connection_id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        connection_id = "conn-" + std::to_string(++next_id);
    }
    auto stream = factory(connection_id, check.destination, channel);
    if (!stream) {
        channel->close("no session available");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        connections[hdl] = {stream, channel};
    }
    logging::info("Carrier stream connected",
                  {kv("connection", connection_id), kv("destination", check.destination)});
}

void MediaGateway::Impl::on_message(websocketpp::connection_hdl hdl,
                                    WsServer::message_ptr message) {
    std::shared_ptr<CarrierStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        if (it == connections.end()) {
            return;
        }
        stream = it->second.stream;
    }
    if (message->get_opcode() != websocketpp::frame::opcode::text) {
        logging::debug("Binary carrier frame ignored", {kv("call_id", stream->call_id())});
        return;
    }
    try {
        stream->handle_text(message->get_payload());
    } catch (const std::exception& ex) {
        logging::error("Carrier frame handler failed",
                       {kv("call_id", stream->call_id()), kv("error", ex.what())});
    }
}

void MediaGateway::Impl::on_gone(websocketpp::connection_hdl hdl, const std::string& reason) {
    Connection connection;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        if (it == connections.end()) {
            return;
        }
        connection = it->second;
        connections.erase(it);
    }
    connection.channel->mark_closed();
    connection.stream->handle_closed(reason);
}

MediaGateway::MediaGateway(boost::asio::io_service& io, const Config& config, StreamFactory factory)
    : impl_(std::make_shared<Impl>(config, std::move(factory))) {
    auto& server = impl_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio(&io);
    server.set_reuse_addr(true);

    Impl* impl = impl_.get();
    server.set_validate_handler([impl](websocketpp::connection_hdl hdl) {
        return impl->validate(hdl);
    });
    server.set_open_handler([impl](websocketpp::connection_hdl hdl) { impl->on_open(hdl); });
    server.set_message_handler([impl](websocketpp::connection_hdl hdl,
                                      WsServer::message_ptr message) {
        impl->on_message(hdl, message);
    });
    server.set_close_handler([impl](websocketpp::connection_hdl hdl) {
        std::string reason = "socket closed";
        websocketpp::lib::error_code ec;
        auto con = impl->server.get_con_from_hdl(hdl, ec);
        if (!ec) {
            reason = "socket closed (code " + std::to_string(con->get_remote_close_code()) + ")";
        }
        impl->on_gone(hdl, reason);
    });
    server.set_fail_handler([impl](websocketpp::connection_hdl hdl) {
        std::string reason = "socket error";
        websocketpp::lib::error_code ec;
        auto con = impl->server.get_con_from_hdl(hdl, ec);
        if (!ec) {
            reason = "socket error: " + con->get_ec().message();
        }
        impl->on_gone(hdl, reason);
    });
}

MediaGateway::~MediaGateway() {
    stop();
}

void MediaGateway::start() {
    websocketpp::lib::error_code ec;
    impl_->server.listen(static_cast<uint16_t>(impl_->config.media_port), ec);
    if (ec) {
        throw std::runtime_error("Media gateway cannot listen on port " +
                                 std::to_string(impl_->config.media_port) + ": " + ec.message());
    }
    impl_->server.start_accept(ec);
    if (ec) {
        throw std::runtime_error("Media gateway cannot accept: " + ec.message());
    }
    impl_->listening = true;
    logging::info("Media gateway listening",
                  {kv("port", impl_->config.media_port), kv("path", impl_->config.media_path)});
}

void MediaGateway::stop() {
    if (!impl_->listening) {
        return;
    }
    impl_->listening = false;
    websocketpp::lib::error_code ec;
    impl_->server.stop_listening(ec);

    std::vector<std::shared_ptr<WsCarrierChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& entry : impl_->connections) {
            channels.push_back(entry.second.channel);
        }
    }
    for (const auto& channel : channels) {
        channel->close("server shutdown");
    }
}

size_t MediaGateway::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->connections.size();
}

}
}
