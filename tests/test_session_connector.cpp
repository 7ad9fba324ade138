#include <catch2/catch_test_macros.hpp>

#include "call_bridge/realtime/session_connector.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fakes.hpp"

using namespace call_bridge;
using nlohmann::json;

TEST_CASE("connection urls are collected in preference order") {
    const json response = {
        {"id", "call-1"},
        {"url", "wss://d"},
        {"urls", json::array({"wss://c", "wss://a"})},
        {"websocketCallUrl", "wss://b"},
        {"transport", {{"websocketCallUrl", "wss://a"}, {"url", "wss://c"}}},
    };
    const auto urls = realtime::extract_connection_urls(response);
    REQUIRE(urls == std::vector<std::string>{"wss://a", "wss://b", "wss://c", "wss://d"});
    REQUIRE(realtime::extract_connection_urls(json{{"id", "x"}}).empty());
}

TEST_CASE("the first successful dial wins") {
    std::vector<std::string> dialed;
    auto session = realtime::connect_with_fallback(
        {"wss://a", "wss://b", "wss://c"}, [&](const std::string& url) {
            dialed.push_back(url);
            if (url == "wss://b") {
                return realtime::DialResult::connected(
                    std::make_unique<testing::FakeRealtimeSession>("ai-b"));
            }
            return realtime::DialResult::failed("refused");
        });
    REQUIRE(session->id() == "ai-b");
    REQUIRE(dialed == std::vector<std::string>{"wss://a", "wss://b"});
}

TEST_CASE("redirects are followed once per url") {
    std::vector<std::string> dialed;
    auto session = realtime::connect_with_fallback({"wss://a"}, [&](const std::string& url) {
        dialed.push_back(url);
        if (url == "wss://a") {
            return realtime::DialResult::redirect("wss://edge");
        }
        return realtime::DialResult::connected(std::make_unique<testing::FakeRealtimeSession>());
    });
    REQUIRE(session);
    REQUIRE(dialed == std::vector<std::string>{"wss://a", "wss://edge"});
}

TEST_CASE("redirect loops terminate with every cause listed") {
    std::vector<std::string> dialed;
    try {
        realtime::connect_with_fallback({"wss://a", "wss://b"}, [&](const std::string& url) {
            dialed.push_back(url);
            if (url == "wss://b") {
                throw std::runtime_error("tls handshake failed");
            }
            return realtime::DialResult::redirect(url == "wss://a" ? "wss://loop" : "wss://a");
        });
        FAIL("expected RealtimeConnectError");
    } catch (const realtime::RealtimeConnectError& ex) {
        REQUIRE(dialed == std::vector<std::string>{"wss://a", "wss://loop", "wss://b"});
        REQUIRE(ex.attempts().size() == 3);
        REQUIRE(ex.attempts()[2].cause == "tls handshake failed");
        const std::string message = ex.what();
        REQUIRE(message.find("wss://loop") != std::string::npos);
        REQUIRE(message.find("tls handshake failed") != std::string::npos);
    }
}

TEST_CASE("no candidates is a connect error") {
    REQUIRE_THROWS_AS(realtime::connect_with_fallback({}, [](const std::string&) {
        return realtime::DialResult::failed("unused");
    }), realtime::RealtimeConnectError);
}
