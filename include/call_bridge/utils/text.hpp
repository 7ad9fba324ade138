#pragma once

#include <optional>
#include <string>

namespace call_bridge::utils {

std::string trim(const std::string& value);
std::string strip_whitespace(const std::string& value);
std::string to_lower(std::string value);

// Accepts an optional leading '+' followed by 6 to 15 digits once whitespace
// is removed.
std::optional<std::string> normalize_phone_number(const std::string& value);

bool is_iso_date(const std::string& value);

}
