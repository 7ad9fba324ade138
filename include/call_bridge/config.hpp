#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace call_bridge {

struct VadConfig {
    double speech_threshold = 0.030;
    double silence_threshold = 0.015;
    int silence_frames_to_commit = 25;
    int min_speech_frames = 8;
    double min_average_energy = 0.035;
    int max_segment_frames = 750;

    void validate() const;
};

struct Config {
    int media_port = 8080;
    std::string media_path = "/media-stream";
    std::string destination_param = "to";
    int rest_api_port = 8000;
    std::string worker_id;
    std::optional<std::string> worker_address;
    std::optional<std::string> tool_proxy_token;
    std::string provider_api_url = "https://api.vapi.ai";
    std::string provider_api_key;
    std::string audio_encoding = "mulaw";
    int audio_sample_rate = 8000;
    int realtime_connect_timeout_ms = 10000;
    int keepalive_interval_ms = 15000;
    std::string backend_url;
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 30.0;
    double backend_connect_timeout = 10.0;
    double backend_sock_read_timeout = 30.0;
    int registry_ttl_sec = 300;
    std::optional<std::filesystem::path> registry_store_path;
    std::string calendar_time_zone = "Europe/Amsterdam";
    bool interruptions_are_allowed = true;
    VadConfig vad;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "call_bridge";

    static Config load();
    void validate() const;
};

}
