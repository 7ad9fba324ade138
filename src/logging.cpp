#include "call_bridge/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace call_bridge::logging {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> active_logger;

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) || ch == '"' || ch == '=';
    });
}

void append_value(std::string& out, const std::string& value) {
    if (!needs_quotes(value)) {
        out += value;
        return;
    }
    out += '"';
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out += '\\';
        }
        out += ch;
    }
    out += '"';
}

}

std::string format_fields(Fields fields) {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty()) {
            out += ' ';
        }
        out += field.key;
        out += '=';
        append_value(out, field.value);
    }
    return out;
}

std::string with_kv(const std::string& message, Fields fields) {
    if (fields.size() == 0) {
        return message;
    }
    return message + " | " + format_fields(fields);
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), false));
    }

    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->set_level(parse_level(config.log_level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(logger_mutex);
    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    active_logger = logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (active_logger) {
        return active_logger;
    }
    return spdlog::default_logger();
}

void log(spdlog::level::level_enum level, const std::string& message, Fields fields) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, fields));
    }
}

}
