#include "call_bridge/utils/text.hpp"

#include <algorithm>
#include <cctype>

namespace call_bridge::utils {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string strip_whitespace(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (unsigned char ch : value) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(ch));
        }
    }
    return result;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::optional<std::string> normalize_phone_number(const std::string& value) {
    const auto compact = strip_whitespace(value);
    if (compact.empty()) {
        return std::nullopt;
    }
    size_t digits = 0;
    for (size_t i = 0; i < compact.size(); ++i) {
        const auto ch = static_cast<unsigned char>(compact[i]);
        if (ch == '+' && i == 0) {
            continue;
        }
        if (!std::isdigit(ch)) {
            return std::nullopt;
        }
        ++digits;
    }
    if (digits < 6 || digits > 15) {
        return std::nullopt;
    }
    return compact;
}

bool is_iso_date(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    const int month = std::stoi(value.substr(5, 2));
    const int day = std::stoi(value.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

}
