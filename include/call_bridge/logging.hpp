#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

#include "call_bridge/config.hpp"
#include "spdlog/logger.h"

namespace call_bridge {
namespace logging {

// One structured field appended to a log line as key=value.
struct KeyValue {
    std::string key;
    std::string value;
};

using Fields = std::initializer_list<KeyValue>;

template <typename T>
KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    if constexpr (std::is_floating_point<T>::value) {
        oss.precision(4);
        oss << std::fixed << value;
    } else {
        oss << std::boolalpha << value;
    }
    return {key, oss.str()};
}

template <typename T>
KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "-"};
    }
    return kv(key, *value);
}

// Values with spaces, quotes or '=' are quoted and escaped.
std::string format_fields(Fields fields);
std::string with_kv(const std::string& message, Fields fields);

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

void log(spdlog::level::level_enum level, const std::string& message, Fields fields = {});

inline void debug(const std::string& message, Fields fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void info(const std::string& message, Fields fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void warn(const std::string& message, Fields fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void error(const std::string& message, Fields fields = {}) {
    log(spdlog::level::err, message, fields);
}

}

using logging::kv;

}
