#include "call_bridge/app.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/logging.hpp"

#include <exception>
#include <string>

int main() {
    try {
        const auto config = call_bridge::Config::load();
        config.validate();
        call_bridge::logging::init(config);
        call_bridge::logging::info(
            "Starting call-bridge",
            {call_bridge::kv("worker_id", config.worker_id),
             call_bridge::kv("media_port", config.media_port),
             call_bridge::kv("media_path", config.media_path),
             call_bridge::kv("rest_port", config.rest_api_port),
             call_bridge::kv("backend_url", config.backend_url),
             call_bridge::kv("interruptions_allowed", config.interruptions_are_allowed)});
        call_bridge::BridgeApp app(config);
        app.init();
        app.run();
        call_bridge::logging::info("call-bridge stopped");
    } catch (const std::exception& ex) {
        call_bridge::logging::error(
            "Startup failed",
            {call_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
