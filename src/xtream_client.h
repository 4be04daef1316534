#pragma once

#include "channel.h"
#include "http_client.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct XtreamTimeouts {
    long connect_test = 15;
    long categories = 30;
    long streams = 60;
};

std::string build_stream_url(const std::string& host, const std::string& username,
                             const std::string& password, const std::string& stream_id,
                             const std::string& ext = ".ts");
std::string build_stream_url(const std::string& host, const std::string& username,
                             const std::string& password, long long stream_id,
                             const std::string& ext = ".ts");

std::string url_encode(const std::string& s);
std::string strip_trailing_slash(std::string host);

std::string json_id(const nlohmann::json& j);

class XtreamClient {
public:
    XtreamClient(const ServerCredential& server, HttpClient& http,
                 XtreamTimeouts timeouts = {});

    std::string build_api_url(const std::string& action = "") const;
    std::string build_stream_url(const std::string& stream_id,
                                 StreamFormat format = StreamFormat::TS) const;

    bool test_connection();
    std::vector<nlohmann::json> get_live_categories();
    std::vector<nlohmann::json> get_live_streams();

    static CategoryMap build_category_map(const std::vector<nlohmann::json>& categories);

    const ServerCredential& server() const { return server_; }

private:
    bool fetch_json(const std::string& url, long timeout_s, nlohmann::json& out);
    std::vector<nlohmann::json> fetch_array(const std::string& action, long timeout_s);

    ServerCredential server_;
    HttpClient& http_;
    XtreamTimeouts timeouts_;
};
