#include "call_bridge/call/call_session.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <websocketpp/base64/base64.hpp>

#include "call_bridge/audio/g711.hpp"
#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/telephony/carrier_protocol.hpp"

namespace call_bridge {
namespace call {

const char* to_string(CallState state) {
    switch (state) {
        case CallState::Idle:
            return "idle";
        case CallState::Starting:
            return "starting";
        case CallState::Streaming:
            return "streaming";
        case CallState::Stopping:
            return "stopping";
        case CallState::Closed:
            return "closed";
    }
    return "unknown";
}

CallSession::CallSession(std::string destination_number,
                         std::shared_ptr<telephony::CarrierChannel> carrier,
                         std::shared_ptr<utils::Executor> executor,
                         CallDependencies deps,
                         CallOptions options)
    : destination_number_(std::move(destination_number)),
      carrier_(std::move(carrier)),
      executor_(std::move(executor)),
      deps_(std::move(deps)),
      options_(std::move(options)),
      detector_(options_.vad) {
    detector_.set_on_speech_start([this]() { handle_speech_start(); });
    detector_.set_on_commit([this](const vad::SegmentStats& stats) { handle_commit(stats); });
    detector_.set_on_discard([this](const vad::SegmentStats& stats) { handle_discard(stats); });
}

CallSession::~CallSession() {
    tasks_.cancel_all();
}

void CallSession::set_on_finished(FinishedHandler handler) {
    on_finished_ = std::move(handler);
}

void CallSession::start(const std::string& call_id, const std::string& stream_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CallState::Idle) {
            logging::warn("Duplicate start ignored",
                          {kv("call_id", call_id_), kv("state", to_string(state_))});
            return;
        }
        state_ = CallState::Starting;
        call_id_ = call_id;
        stream_id_ = stream_id;
    }
    Metrics::instance().call_started();
    logging::info("Call starting",
                  {kv("call_id", call_id),
                   kv("stream_id", stream_id),
                   kv("destination", destination_number_)});

    auto self = shared_from_this();
    deps_.registry->register_session(call_id, self, call_id);
    if (!executor_->post([self]() { self->run_startup(); })) {
        teardown("executor unavailable");
    }
}

void CallSession::run_startup() {
    std::string call_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CallState::Starting) {
            return;
        }
        call_id = call_id_;
    }

    try {
        auto found = deps_.company_lookup->find_by_number(destination_number_);
        if (!found) {
            throw std::runtime_error("No company configured for " + destination_number_);
        }
        auto config = std::make_shared<const business::AssistantConfig>(std::move(*found));

        std::shared_ptr<realtime::RealtimeSession> session =
            deps_.gateway->open_session(call_id, config, make_callbacks());
        bool ended_during_startup = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != CallState::Starting) {
                ended_during_startup = true;
            } else {
                ai_session_ = session;
                state_ = CallState::Streaming;
            }
        }
        if (ended_during_startup) {
            // Teardown already ran and cannot have seen this snapshot.
            deps_.gateway->forget_config(call_id);
            session->close("call ended during startup");
            return;
        }

        deps_.registry->bind_ai_session(call_id, session->id());
        arm_keepalive();
        logging::info("Call streaming",
                      {kv("call_id", call_id),
                       kv("company_id", config->company_id),
                       kv("ai_session_id", session->id())});
    } catch (const std::exception& ex) {
        logging::error("Call startup failed", {kv("call_id", call_id), kv("error", ex.what())});
        teardown(std::string("startup failed: ") + ex.what());
        deps_.gateway->forget_config(call_id);
    }
}

void CallSession::arm_keepalive() {
    if (!deps_.scheduler || options_.keepalive_interval.count() <= 0) {
        return;
    }
    std::weak_ptr<CallSession> weak = shared_from_this();
    tasks_.add(deps_.scheduler->every(options_.keepalive_interval, "keepalive-" + call_id(),
                                      [weak]() {
                                          if (auto self = weak.lock()) {
                                              self->keepalive_tick();
                                          }
                                      }));
}

void CallSession::keepalive_tick() {
    auto session = current_session();
    if (!session) {
        return;
    }
    if (!session->ping()) {
        logging::warn("Keepalive ping failed", {kv("call_id", call_id())});
    }
    deps_.registry->refresh(call_id());
}

realtime::RealtimeCallbacks CallSession::make_callbacks() {
    std::weak_ptr<CallSession> weak = shared_from_this();
    realtime::RealtimeCallbacks callbacks;
    callbacks.on_audio = [weak](const std::string& bytes) {
        if (auto self = weak.lock()) {
            self->handle_ai_audio(bytes);
        }
    };
    callbacks.on_text = [weak](const std::string& text) {
        if (auto self = weak.lock()) {
            logging::debug("Assistant text", {kv("call_id", self->call_id()), kv("text", text)});
        }
    };
    callbacks.on_turn_completed = [weak]() {
        if (auto self = weak.lock()) {
            self->handle_turn_completed();
        }
    };
    callbacks.on_tool_call = [weak](const realtime::ToolCall& call) {
        if (auto self = weak.lock()) {
            self->handle_ai_tool_call(call);
        }
    };
    callbacks.on_error = [weak](const std::string& message) {
        if (auto self = weak.lock()) {
            self->handle_ai_error(message);
        }
    };
    callbacks.on_closed = [weak](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->teardown("realtime session closed: " + reason);
        }
    };
    return callbacks;
}

void CallSession::on_carrier_media(const std::string& base64_payload) {
    std::shared_ptr<realtime::RealtimeSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CallState::Streaming) {
            return;
        }
        session = ai_session_;
    }
    if (!session || base64_payload.empty()) {
        return;
    }

    const std::string bytes = websocketpp::base64_decode(base64_payload);
    if (bytes.empty()) {
        return;
    }
    session->send_audio(bytes);

    const double energy = audio::frame_energy(audio::decode_ulaw_frame(bytes));
    std::lock_guard<std::mutex> lock(media_mutex_);
    detector_.process_frame(energy);
}

void CallSession::on_carrier_mark(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_mark_ && *pending_mark_ == name) {
        pending_mark_.reset();
    }
    logging::debug("Playback mark acknowledged", {kv("call_id", call_id_), kv("mark", name)});
}

void CallSession::on_carrier_stop() {
    teardown("carrier stop");
}

void CallSession::on_carrier_closed(const std::string& reason) {
    teardown("carrier closed: " + reason);
}

void CallSession::handle_ai_audio(const std::string& bytes) {
    if (bytes.empty()) {
        return;
    }
    std::string stream_id;
    std::string mark;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CallState::Starting && state_ != CallState::Streaming) {
            return;
        }
        stream_id = stream_id_;
        if (!assistant_speaking_) {
            assistant_speaking_ = true;
            mark = "response-" + std::to_string(++response_counter_);
            pending_mark_ = mark;
        }
    }
    if (!mark.empty()) {
        send_to_carrier(telephony::make_mark_frame(stream_id, mark));
    }
    send_to_carrier(telephony::make_media_frame(stream_id, websocketpp::base64_encode(bytes)));
}

void CallSession::handle_turn_completed() {
    std::lock_guard<std::mutex> lock(mutex_);
    assistant_speaking_ = false;
}

void CallSession::handle_ai_tool_call(const realtime::ToolCall& call) {
    logging::info("Tool call received",
                  {kv("call_id", call_id()), kv("tool_call_id", call.id), kv("tool", call.name)});
    auto self = shared_from_this();
    const bool queued = executor_->post([self, call]() {
        const auto result = self->run_tool_call(call);
        auto session = self->current_session();
        if (!session || !session->send_tool_response(call.id, result)) {
            logging::warn("Tool response not delivered",
                          {kv("call_id", self->call_id()), kv("tool_call_id", call.id)});
        }
    });
    if (!queued) {
        logging::warn("Tool call dropped after teardown",
                      {kv("call_id", call_id()), kv("tool_call_id", call.id)});
    }
}

void CallSession::handle_ai_error(const std::string& message) {
    logging::warn("Realtime session error", {kv("call_id", call_id()), kv("error", message)});
}

void CallSession::handle_speech_start() {
    std::shared_ptr<realtime::RealtimeSession> session;
    std::string stream_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!assistant_speaking_ || !options_.interruptions_allowed) {
            return;
        }
        assistant_speaking_ = false;
        pending_mark_.reset();
        session = ai_session_;
        stream_id = stream_id_;
    }
    logging::info("Caller interrupted the assistant", {kv("call_id", call_id())});
    send_to_carrier(telephony::make_clear_frame(stream_id));
    if (session) {
        session->cancel_response();
    }
}

void CallSession::handle_commit(const vad::SegmentStats& stats) {
    Metrics::instance().vad_commit();
    logging::debug("User turn committed",
                   {kv("call_id", call_id()),
                    kv("active_frames", stats.active_speech_frames),
                    kv("average_energy", stats.average_energy),
                    kv("forced", stats.forced)});
    if (auto session = current_session()) {
        session->commit_user_audio();
    }
}

void CallSession::handle_discard(const vad::SegmentStats& stats) {
    Metrics::instance().vad_discard();
    logging::debug("Noise segment discarded",
                   {kv("call_id", call_id()),
                    kv("active_frames", stats.active_speech_frames),
                    kv("average_energy", stats.average_energy)});
}

std::future<realtime::ToolResult> CallSession::submit_tool_call(realtime::ToolCall call) {
    auto promise = std::make_shared<std::promise<realtime::ToolResult>>();
    auto future = promise->get_future();
    auto self = shared_from_this();
    const bool queued = executor_->post([self, call = std::move(call), promise]() {
        promise->set_value(self->run_tool_call(call));
    });
    if (!queued) {
        promise->set_value(realtime::ToolResult::failure("Call has ended"));
    }
    return future;
}

realtime::ToolResult CallSession::run_tool_call(const realtime::ToolCall& call) {
    realtime::ToolContext context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        context.call_id = call_id_;
    }
    context.config = deps_.gateway->config_for(context.call_id);
    if (!context.config) {
        return realtime::ToolResult::failure("Call is not configured");
    }
    return deps_.dispatcher->dispatch(call, context);
}

void CallSession::teardown(const std::string& reason) {
    std::shared_ptr<realtime::RealtimeSession> session;
    std::string call_id;
    bool was_started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CallState::Stopping || state_ == CallState::Closed) {
            return;
        }
        was_started = state_ != CallState::Idle;
        state_ = CallState::Stopping;
        session = std::move(ai_session_);
        call_id = call_id_;
        assistant_speaking_ = false;
        pending_mark_.reset();
    }
    logging::info("Call teardown", {kv("call_id", call_id), kv("reason", reason)});

    tasks_.cancel_all();
    if (session) {
        session->close(reason);
    }
    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        detector_.reset();
    }
    if (carrier_ && !carrier_->closed()) {
        carrier_->close(reason);
    }
    if (was_started) {
        deps_.registry->unregister(call_id, this);
        if (deps_.gateway) {
            deps_.gateway->forget_config(call_id);
        }
        Metrics::instance().call_finished();
    }

    // Queued tool calls still drain; the worker stops once they are done.
    auto executor = executor_;
    if (!executor->post([executor]() { executor->shutdown(); })) {
        logging::debug("Executor already stopped", {kv("call_id", call_id)});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = CallState::Closed;
    }
    if (on_finished_) {
        on_finished_(call_id);
    }
}

std::string CallSession::call_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_id_;
}

CallState CallSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CallSession::assistant_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assistant_speaking_;
}

std::optional<std::string> CallSession::pending_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_mark_;
}

std::optional<std::string> CallSession::ai_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ai_session_) {
        return std::nullopt;
    }
    return ai_session_->id();
}

std::shared_ptr<realtime::RealtimeSession> CallSession::current_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ai_session_;
}

void CallSession::send_to_carrier(const std::string& frame) {
    if (!carrier_ || carrier_->closed()) {
        return;
    }
    if (!carrier_->send_text(frame)) {
        logging::debug("Carrier send failed", {kv("call_id", call_id())});
    }
}

}
}
