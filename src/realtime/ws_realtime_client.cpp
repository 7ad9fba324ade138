#include "call_bridge/realtime/ws_realtime_client.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {
namespace realtime {

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = boost::asio::ssl::context;

bool starts_with(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

struct DialOutcome {
    bool opened = false;
    std::string redirect_url;
    std::string error;
};

// Shared by the websocketpp handlers and the session object.
struct ConnectionState {
    ConnectionState(std::string call_id, RealtimeCallbacks callbacks)
        : router(call_id, std::move(callbacks)), call_id(std::move(call_id)) {}

    void settle(DialOutcome outcome) {
        if (settled.exchange(true)) {
            return;
        }
        dial_result.set_value(std::move(outcome));
    }

    EventRouter router;
    std::string call_id;
    std::promise<DialOutcome> dial_result;
    std::atomic<bool> settled{false};
    std::atomic<bool> opened{false};
    std::atomic<bool> abandoned{false};
    std::atomic<bool> closed{false};
};

template <typename Client>
class WsRealtimeSession : public RealtimeSession {
public:
    using ConnectionPtr = typename Client::connection_ptr;

    WsRealtimeSession(ConnectionPtr connection,
                      std::string id,
                      std::shared_ptr<ConnectionState> state)
        : connection_(std::move(connection)), id_(std::move(id)), state_(std::move(state)) {}

    ~WsRealtimeSession() override {
        close("session released");
    }

    const std::string& id() const override { return id_; }

    bool send_text(const std::string& payload) override {
        return send(payload, websocketpp::frame::opcode::text);
    }

    bool send_binary(const std::string& payload) override {
        return send(payload, websocketpp::frame::opcode::binary);
    }

    bool ping() override {
        if (closed()) {
            return false;
        }
        websocketpp::lib::error_code ec;
        connection_->ping("", ec);
        if (ec) {
            logging::warn("Realtime ping failed",
                          {kv("call_id", state_->call_id), kv("error", ec.message())});
            return false;
        }
        return true;
    }

    void close(const std::string& reason) override {
        if (state_->closed.exchange(true)) {
            return;
        }
        websocketpp::lib::error_code ec;
        connection_->close(websocketpp::close::status::normal, reason, ec);
        if (ec) {
            logging::debug("Realtime close skipped",
                           {kv("call_id", state_->call_id), kv("error", ec.message())});
        }
    }

    bool closed() const override {
        return state_->closed.load();
    }

private:
    bool send(const std::string& payload, websocketpp::frame::opcode::value opcode) {
        if (closed()) {
            return false;
        }
        const auto ec = connection_->send(payload, opcode);
        if (ec) {
            logging::warn("Realtime send failed",
                          {kv("call_id", state_->call_id), kv("error", ec.message())});
            return false;
        }
        return true;
    }

    ConnectionPtr connection_;
    std::string id_;
    std::shared_ptr<ConnectionState> state_;
};

template <typename Client>
void init_endpoint(Client& client, boost::asio::io_service& io,
                   std::chrono::milliseconds connect_timeout) {
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio(&io);
    client.set_open_handshake_timeout(static_cast<long>(connect_timeout.count()));
}

template <typename Client>
DialResult dial_with(Client& client,
                     boost::asio::io_service& io,
                     const RealtimeClientOptions& options,
                     const std::string& url,
                     const std::string& call_id,
                     const std::string& session_id,
                     RealtimeCallbacks callbacks) {
    using ConnectionPtr = typename Client::connection_ptr;
    using ConnectionWeak = websocketpp::lib::weak_ptr<typename Client::connection_type>;

    auto state = std::make_shared<ConnectionState>(call_id, std::move(callbacks));
    auto outcome = state->dial_result.get_future();

    websocketpp::lib::error_code ec;
    ConnectionPtr connection = client.get_connection(url, ec);
    if (ec) {
        return DialResult::failed(ec.message());
    }
    if (!options.api_key.empty()) {
        connection->append_header("Authorization", "Bearer " + options.api_key);
    }
    ConnectionWeak weak = connection;

    connection->set_open_handler([state, weak](websocketpp::connection_hdl) {
        state->opened = true;
        if (state->abandoned) {
            if (auto con = weak.lock()) {
                websocketpp::lib::error_code close_ec;
                con->close(websocketpp::close::status::going_away, "connect timeout", close_ec);
            }
            return;
        }
        state->settle({true, "", ""});
    });

    connection->set_fail_handler([state, weak, url](websocketpp::connection_hdl) {
        state->closed = true;
        DialOutcome result;
        auto con = weak.lock();
        if (!con) {
            result.error = "connection released";
            state->settle(std::move(result));
            return;
        }
        const int status = static_cast<int>(con->get_response_code());
        const auto location = con->get_response_header("Location");
        if (is_redirect(status) && !location.empty()) {
            result.redirect_url = to_websocket_url(utils::resolve_redirect_url(url, location));
        } else if (status != 0) {
            result.error = "handshake rejected with HTTP " + std::to_string(status);
        } else {
            result.error = con->get_ec().message();
        }
        state->settle(std::move(result));
    });

    connection->set_close_handler([state, weak](websocketpp::connection_hdl) {
        state->closed = true;
        std::string reason = "closed";
        if (auto con = weak.lock()) {
            reason = "code " + std::to_string(con->get_remote_close_code());
            if (!con->get_remote_close_reason().empty()) {
                reason += ": " + con->get_remote_close_reason();
            }
        }
        if (!state->opened || state->abandoned) {
            state->settle({false, "", "closed during handshake (" + reason + ")"});
            return;
        }
        logging::info("Realtime session closed",
                      {kv("call_id", state->call_id), kv("reason", reason)});
        if (state->router.callbacks().on_closed) {
            state->router.callbacks().on_closed(reason);
        }
    });

    connection->set_message_handler([state](websocketpp::connection_hdl,
                                            typename Client::message_ptr message) {
        try {
            if (message->get_opcode() == websocketpp::frame::opcode::text) {
                state->router.handle_text(message->get_payload());
            } else {
                state->router.handle_binary(message->get_payload());
            }
        } catch (const std::exception& ex) {
            logging::error("Realtime frame handler failed",
                           {kv("call_id", state->call_id), kv("error", ex.what())});
        }
    });

    boost::asio::post(io, [&client, connection]() { client.connect(connection); });

    const auto wait = options.connect_timeout + std::chrono::milliseconds(500);
    if (outcome.wait_for(wait) != std::future_status::ready) {
        state->abandoned = true;
        state->closed = true;
        boost::asio::post(io, [connection]() {
            websocketpp::lib::error_code close_ec;
            connection->close(websocketpp::close::status::going_away, "connect timeout", close_ec);
        });
        return DialResult::failed("connect timeout after " +
                                  std::to_string(options.connect_timeout.count()) + "ms");
    }

    auto result = outcome.get();
    if (result.opened) {
        logging::info("Realtime session opened",
                      {kv("call_id", call_id), kv("session_id", session_id), kv("url", url)});
        return DialResult::connected(
            std::make_unique<WsRealtimeSession<Client>>(connection, session_id, state));
    }
    if (!result.redirect_url.empty()) {
        return DialResult::redirect(result.redirect_url);
    }
    return DialResult::failed(result.error);
}

}

std::string to_websocket_url(const std::string& url) {
    if (starts_with(url, "https://")) {
        return "wss://" + url.substr(8);
    }
    if (starts_with(url, "http://")) {
        return "ws://" + url.substr(7);
    }
    return url;
}

struct RealtimeClient::Endpoints {
    PlainClient plain;
    TlsClient tls;
};

RealtimeClient::RealtimeClient(boost::asio::io_service& io, RealtimeClientOptions options)
    : io_(io), options_(std::move(options)), endpoints_(std::make_unique<Endpoints>()) {
    init_endpoint(endpoints_->plain, io_, options_.connect_timeout);
    init_endpoint(endpoints_->tls, io_, options_.connect_timeout);

    TlsClient* tls = &endpoints_->tls;
    endpoints_->tls.set_tls_init_handler([tls](websocketpp::connection_hdl hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tls_client);
        boost::system::error_code ec;
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                                 SslContext::no_sslv3 | SslContext::single_dh_use,
                             ec);
        context->set_default_verify_paths(ec);
        if (ec) {
            logging::warn("TLS trust store unavailable", {kv("error", ec.message())});
        }
        context->set_verify_mode(boost::asio::ssl::verify_peer);
        websocketpp::lib::error_code con_ec;
        auto con = tls->get_con_from_hdl(hdl, con_ec);
        if (!con_ec) {
            context->set_verify_callback(boost::asio::ssl::host_name_verification(con->get_host()));
        }
        return context;
    });
    endpoints_->tls.set_socket_init_handler(
        [tls](websocketpp::connection_hdl hdl, boost::asio::ssl::stream<boost::asio::ip::tcp::socket>& socket) {
            websocketpp::lib::error_code ec;
            auto con = tls->get_con_from_hdl(hdl, ec);
            if (ec) {
                return;
            }
            SSL_set_tlsext_host_name(socket.native_handle(), con->get_host().c_str());
        });
}

RealtimeClient::~RealtimeClient() = default;

DialResult RealtimeClient::dial(const std::string& url,
                                const std::string& call_id,
                                const std::string& session_id,
                                RealtimeCallbacks callbacks) {
    const auto target = to_websocket_url(url);
    if (starts_with(target, "wss://")) {
        return dial_with(endpoints_->tls, io_, options_, target, call_id, session_id,
                         std::move(callbacks));
    }
    if (starts_with(target, "ws://")) {
        return dial_with(endpoints_->plain, io_, options_, target, call_id, session_id,
                         std::move(callbacks));
    }
    return DialResult::failed("unsupported URL scheme");
}

}
}
