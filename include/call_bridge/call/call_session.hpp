#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "call_bridge/business/assistant_config.hpp"
#include "call_bridge/business/collaborators.hpp"
#include "call_bridge/call/active_call.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/realtime/event_router.hpp"
#include "call_bridge/realtime/gateway.hpp"
#include "call_bridge/realtime/realtime_session.hpp"
#include "call_bridge/realtime/tool_dispatcher.hpp"
#include "call_bridge/registry/session_registry.hpp"
#include "call_bridge/telephony/carrier_channel.hpp"
#include "call_bridge/utils/executor.hpp"
#include "call_bridge/utils/scheduler.hpp"
#include "call_bridge/vad/turn_detector.hpp"

namespace call_bridge {
namespace call {

enum class CallState {
    Idle,
    Starting,
    Streaming,
    Stopping,
    Closed,
};

const char* to_string(CallState state);

struct CallDependencies {
    std::shared_ptr<business::CompanyLookup> company_lookup;
    std::shared_ptr<realtime::RealtimeGateway> gateway;
    std::shared_ptr<registry::SessionRegistry> registry;
    std::shared_ptr<realtime::ToolDispatcher> dispatcher;
    std::shared_ptr<utils::Scheduler> scheduler;
};

struct CallOptions {
    VadConfig vad;
    bool interruptions_allowed = true;
    std::chrono::milliseconds keepalive_interval{15000};
};

// Bridges one carrier media stream and one AI realtime session.
//
// Carrier and AI frames arrive on the io thread and are handled inline. Start
// up and tool calls run in order on the session's executor. Teardown is
// idempotent and may be triggered from any thread.
class CallSession : public ActiveCall,
                    public telephony::CarrierEventSink,
                    public std::enable_shared_from_this<CallSession> {
public:
    using FinishedHandler = std::function<void(const std::string& call_id)>;

    CallSession(std::string destination_number,
                std::shared_ptr<telephony::CarrierChannel> carrier,
                std::shared_ptr<utils::Executor> executor,
                CallDependencies deps,
                CallOptions options);
    ~CallSession() override;

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void set_on_finished(FinishedHandler handler);

    // Only valid from Idle; later calls are ignored.
    void start(const std::string& call_id, const std::string& stream_id);
    void teardown(const std::string& reason);

    void on_carrier_media(const std::string& base64_payload) override;
    void on_carrier_mark(const std::string& name) override;
    void on_carrier_stop() override;
    void on_carrier_closed(const std::string& reason) override;

    std::string call_id() const override;
    std::future<realtime::ToolResult> submit_tool_call(realtime::ToolCall call) override;

    CallState state() const;
    bool assistant_speaking() const;
    std::optional<std::string> pending_mark() const;
    std::optional<std::string> ai_session_id() const;
    const std::string& destination_number() const { return destination_number_; }

private:
    void run_startup();
    void arm_keepalive();
    void keepalive_tick();
    realtime::RealtimeCallbacks make_callbacks();

    void handle_ai_audio(const std::string& bytes);
    void handle_turn_completed();
    void handle_ai_tool_call(const realtime::ToolCall& call);
    void handle_ai_error(const std::string& message);
    void handle_speech_start();
    void handle_commit(const vad::SegmentStats& stats);
    void handle_discard(const vad::SegmentStats& stats);

    realtime::ToolResult run_tool_call(const realtime::ToolCall& call);
    std::shared_ptr<realtime::RealtimeSession> current_session() const;
    void send_to_carrier(const std::string& frame);

    const std::string destination_number_;
    std::shared_ptr<telephony::CarrierChannel> carrier_;
    std::shared_ptr<utils::Executor> executor_;
    CallDependencies deps_;
    CallOptions options_;
    FinishedHandler on_finished_;

    mutable std::mutex mutex_;
    CallState state_ = CallState::Idle;
    std::string call_id_;
    std::string stream_id_;
    std::shared_ptr<realtime::RealtimeSession> ai_session_;
    bool assistant_speaking_ = false;
    std::optional<std::string> pending_mark_;
    int response_counter_ = 0;

    std::mutex media_mutex_;
    vad::TurnDetector detector_;

    utils::TaskGroup tasks_;
};

}
}
