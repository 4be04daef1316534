#include "xtream_client.h"
#include "log.h"
#include <cmath>

using json = nlohmann::json;

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string strip_trailing_slash(std::string host) {
    while (!host.empty() && host.back() == '/') host.pop_back();
    return host;
}

std::string json_id(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number_unsigned()) return std::to_string(j.get<unsigned long long>());
    if (j.is_number_integer()) return std::to_string(j.get<long long>());
    if (j.is_number_float()) {
        double d = j.get<double>();
        if (d >= -9.2e18 && d <= 9.2e18 && std::trunc(d) == d)
            return std::to_string(static_cast<long long>(d));
        return j.dump();
    }
    return "";
}

std::string build_stream_url(const std::string& host, const std::string& username,
                             const std::string& password, const std::string& stream_id,
                             const std::string& ext) {
    return host + "/live/" + username + "/" + password + "/" + stream_id + ext;
}

std::string build_stream_url(const std::string& host, const std::string& username,
                             const std::string& password, long long stream_id,
                             const std::string& ext) {
    return build_stream_url(host, username, password, std::to_string(stream_id), ext);
}

XtreamClient::XtreamClient(const ServerCredential& server, HttpClient& http,
                           XtreamTimeouts timeouts)
    : server_(server), http_(http), timeouts_(timeouts) {
    server_.host = strip_trailing_slash(server_.host);
}

std::string XtreamClient::build_api_url(const std::string& action) const {
    std::string url = server_.host + "/player_api.php?username=" +
                      url_encode(server_.username) +
                      "&password=" + url_encode(server_.password);
    if (!action.empty()) url += "&action=" + action;
    return url;
}

std::string XtreamClient::build_stream_url(const std::string& stream_id,
                                           StreamFormat format) const {
    return ::build_stream_url(server_.host, server_.username, server_.password,
                              stream_id, stream_format_ext(format));
}

bool XtreamClient::fetch_json(const std::string& url, long timeout_s, json& out) {
    HttpResponse resp = http_.get(url, timeout_s);
    if (!resp.ok) {
        LOG_WARN("[%s] connection error: %s", server_.name.c_str(), resp.error.c_str());
        return false;
    }

    try {
        out = json::parse(resp.body);
    } catch (const json::exception& e) {
        LOG_WARN("[%s] invalid JSON response: %s", server_.name.c_str(), e.what());
        return false;
    }
    return true;
}

bool XtreamClient::test_connection() {
    json j;
    if (!fetch_json(build_api_url(), timeouts_.connect_test, j))
        return false;

    if (!j.is_object() || !j.contains("user_info") || !j["user_info"].is_object()) {
        LOG_WARN("[%s] response has no user_info, check credentials", server_.name.c_str());
        return false;
    }

    std::string status = "unknown";
    const json& info = j["user_info"];
    if (info.contains("status") && info["status"].is_string())
        status = info["status"].get<std::string>();
    LOG_INFO("[%s] connected as %s (status %s)", server_.name.c_str(),
             server_.username.c_str(), status.c_str());
    return true;
}

std::vector<json> XtreamClient::fetch_array(const std::string& action, long timeout_s) {
    std::vector<json> result;
    json j;
    if (!fetch_json(build_api_url(action), timeout_s, j))
        return result;

    if (!j.is_array()) {
        LOG_WARN("[%s] %s: expected a JSON array", server_.name.c_str(), action.c_str());
        return result;
    }

    for (auto& item : j) {
        if (item.is_object()) result.push_back(std::move(item));
    }
    LOG_DEBUG("[%s] %s returned %zu entries", server_.name.c_str(),
              action.c_str(), result.size());
    return result;
}

std::vector<json> XtreamClient::get_live_categories() {
    return fetch_array("get_live_categories", timeouts_.categories);
}

std::vector<json> XtreamClient::get_live_streams() {
    return fetch_array("get_live_streams", timeouts_.streams);
}

CategoryMap XtreamClient::build_category_map(const std::vector<json>& categories) {
    CategoryMap map;
    for (auto& c : categories) {
        if (!c.contains("category_id")) continue;
        std::string id = json_id(c.at("category_id"));
        if (id.empty()) continue;
        std::string name;
        if (c.contains("category_name") && c.at("category_name").is_string())
            name = c.at("category_name").get<std::string>();
        map[id] = name;
    }
    return map;
}
