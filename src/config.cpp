#include "call_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace call_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string generate_worker_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::uniform_int_distribution<uint64_t> dist;
    std::ostringstream stream;
    stream << "worker-" << std::hex << std::setw(16) << std::setfill('0') << dist(engine);
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

void VadConfig::validate() const {
    if (speech_threshold <= 0.0 || silence_threshold <= 0.0) {
        throw std::runtime_error("VAD thresholds must be positive");
    }
    if (silence_threshold >= speech_threshold) {
        throw std::runtime_error(
            "VAD_SILENCE_THRESHOLD must be lower than VAD_SPEECH_THRESHOLD");
    }
    if (silence_frames_to_commit <= 0) {
        throw std::runtime_error("VAD_SILENCE_FRAMES must be positive");
    }
    if (min_speech_frames <= 0) {
        throw std::runtime_error("VAD_MIN_SPEECH_FRAMES must be positive");
    }
    if (max_segment_frames <= 0) {
        throw std::runtime_error("VAD_MAX_SEGMENT_FRAMES must be positive");
    }
    if (min_average_energy < 0.0) {
        throw std::runtime_error("VAD_MIN_AVERAGE_ENERGY must not be negative");
    }
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.media_port = get_env_int("MEDIA_PORT", 8080);
    config.media_path = get_env_str("MEDIA_PATH", "/media-stream");
    config.destination_param = get_env_str("DESTINATION_PARAM", "to");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);

    const auto worker_id = get_env_optional("WORKER_ID");
    config.worker_id = worker_id ? trim(*worker_id) : generate_worker_id();
    config.worker_address = get_env_optional("WORKER_ADDRESS");
    config.tool_proxy_token = get_env_optional("TOOL_PROXY_TOKEN");

    config.provider_api_url = get_env_str("PROVIDER_API_URL", "https://api.vapi.ai");
    config.provider_api_key = get_env_required("PROVIDER_API_KEY");
    config.audio_encoding = get_env_str("AUDIO_ENCODING", "mulaw");
    config.audio_sample_rate = get_env_int("AUDIO_SAMPLE_RATE", 8000);
    config.realtime_connect_timeout_ms = get_env_int("REALTIME_CONNECT_TIMEOUT_MS", 10000);
    config.keepalive_interval_ms = get_env_int("KEEPALIVE_INTERVAL_MS", 15000);

    config.backend_url = get_env_required("BACKEND_URL");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 30.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 30.0);

    config.registry_ttl_sec = get_env_int("REGISTRY_TTL_SEC", 300);
    if (const auto store_path = get_env_optional("REGISTRY_STORE_PATH")) {
        config.registry_store_path = std::filesystem::path(*store_path);
    }

    config.calendar_time_zone = get_env_str("CALENDAR_TIME_ZONE", "Europe/Amsterdam");
    config.interruptions_are_allowed = get_env_bool("INTERRUPTIONS_ARE_ALLOWED", true);

    config.vad.speech_threshold = get_env_double("VAD_SPEECH_THRESHOLD", 0.030);
    config.vad.silence_threshold = get_env_double("VAD_SILENCE_THRESHOLD", 0.015);
    config.vad.silence_frames_to_commit = get_env_int("VAD_SILENCE_FRAMES", 25);
    config.vad.min_speech_frames = get_env_int("VAD_MIN_SPEECH_FRAMES", 8);
    config.vad.min_average_energy = get_env_double("VAD_MIN_AVERAGE_ENERGY", 0.035);
    config.vad.max_segment_frames = get_env_int("VAD_MAX_SEGMENT_FRAMES", 750);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "call_bridge");

    return config;
}

void Config::validate() const {
    if (provider_api_key.empty()) {
        throw std::runtime_error("PROVIDER_API_KEY is required");
    }
    if (provider_api_url.empty()) {
        throw std::runtime_error("PROVIDER_API_URL is required");
    }
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (worker_id.empty()) {
        throw std::runtime_error("WORKER_ID must not be blank");
    }
    if (media_port <= 0) {
        throw std::runtime_error("MEDIA_PORT must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (media_path.empty() || media_path.front() != '/') {
        throw std::runtime_error("MEDIA_PATH must start with '/'");
    }
    if (destination_param.empty()) {
        throw std::runtime_error("DESTINATION_PARAM is required");
    }
    if (keepalive_interval_ms <= 0) {
        throw std::runtime_error("KEEPALIVE_INTERVAL_MS must be positive");
    }
    if (realtime_connect_timeout_ms <= 0) {
        throw std::runtime_error("REALTIME_CONNECT_TIMEOUT_MS must be positive");
    }
    if (registry_ttl_sec <= 0) {
        throw std::runtime_error("REGISTRY_TTL_SEC must be positive");
    }
    vad.validate();
}

}
