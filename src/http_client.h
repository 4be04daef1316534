#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{2000};
    double backoff = 1.0;
    std::chrono::milliseconds max_delay{30000};

    std::chrono::milliseconds delay_for(int attempt) const;
};

struct HttpOptions {
    std::string user_agent = "m3ugen/1.0";
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds request_delay{0};
};

struct HttpRequest {
    std::string url;
    long timeout_s = 30;
    std::string user_agent;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    bool ok = false;
    long status = 0;
    std::string body;
    std::string error;
};

HttpResponse curl_transport(const HttpRequest& req);
std::string redact_url(const std::string& url);

class HttpClient {
public:
    using Transport = std::function<HttpResponse(const HttpRequest& req)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit HttpClient(RetryPolicy policy = {}, HttpOptions options = {},
                        Transport transport = curl_transport,
                        Sleeper sleeper = nullptr);

    HttpResponse get(const std::string& url, long timeout_s);

    const RetryPolicy& policy() const { return policy_; }
    int requests_sent() const { return requests_sent_; }

private:
    RetryPolicy policy_;
    HttpOptions options_;
    Transport transport_;
    Sleeper sleeper_;
    int requests_sent_ = 0;
};
