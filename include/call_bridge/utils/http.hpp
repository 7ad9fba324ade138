#pragma once

#include <map>
#include <string>

namespace call_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Splits "a=1&b=2" (with or without a leading '?'). Later keys win.
std::map<std::string, std::string> parse_query(const std::string& query);

// Splits a request target into path and query string.
void split_target(const std::string& target, std::string& path, std::string& query);

}
