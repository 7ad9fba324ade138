#include "call_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace call_bridge::utils {

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find_first_of("/?");
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        if (base_path.front() == '?') {
            base_path = "/" + base_path;
        }
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const bool secure = scheme == "https" || scheme == "wss";
    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        port = std::stoi(working.substr(port_pos + 1));
    } else {
        host = working;
        port = secure ? 443 : 80;
    }
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool secure = scheme == "https" || scheme == "wss";
    const bool default_port = (secure && port == 443) || (!secure && port == 80);
    if (!default_port && port > 0) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    if (location.empty()) {
        return "";
    }
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    parse_url(base_url, scheme, host, port, base_path);
    if (location.front() == '/') {
        return build_url(scheme, host, port, location);
    }
    const auto query_pos = base_path.find('?');
    if (query_pos != std::string::npos) {
        base_path = base_path.substr(0, query_pos);
    }
    const auto slash = base_path.find_last_of('/');
    const std::string base_dir = (slash == std::string::npos)
                                     ? "/"
                                     : base_path.substr(0, slash + 1);
    return build_url(scheme, host, port, base_dir + location);
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '%' && i + 2 < value.size()) {
            const int high = hex_value(value[i + 1]);
            const int low = hex_value(value[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(ch);
    }
    return decoded;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::string working = query;
    if (!working.empty() && working.front() == '?') {
        working.erase(working.begin());
    }
    size_t start = 0;
    while (start <= working.size()) {
        auto end = working.find('&', start);
        if (end == std::string::npos) {
            end = working.size();
        }
        const auto pair = working.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

void split_target(const std::string& target, std::string& path, std::string& query) {
    const auto pos = target.find('?');
    if (pos == std::string::npos) {
        path = target;
        query.clear();
        return;
    }
    path = target.substr(0, pos);
    query = target.substr(pos + 1);
}

}
