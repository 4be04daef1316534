#include "http_client.h"
#include "log.h"
#include <curl/curl.h>
#include <cmath>
#include <thread>

static size_t write_body(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (attempt < 1) attempt = 1;
    double factor = backoff > 0.0 ? std::pow(backoff, attempt - 1) : 1.0;
    double ms = static_cast<double>(delay.count()) * factor;
    if (ms > static_cast<double>(max_delay.count()))
        return max_delay;
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

std::string redact_url(const std::string& url) {
    auto q = url.find('?');
    if (q == std::string::npos) return url;

    std::string out = url.substr(0, q);
    auto action = url.find("action=", q);
    if (action != std::string::npos) {
        auto end = url.find('&', action);
        out += " [" + url.substr(action, end == std::string::npos ? std::string::npos : end - action) + "]";
    }
    return out;
}

HttpResponse curl_transport(const HttpRequest& req) {
    HttpResponse resp;

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_s);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    for (auto& [k, v] : req.headers) {
        std::string h = k + ": " + v;
        headers = curl_slist_append(headers, h.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
        resp.ok = resp.status >= 200 && resp.status < 300;
        if (!resp.ok)
            resp.error = "HTTP status " + std::to_string(resp.status);
    } else {
        resp.error = curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

HttpClient::HttpClient(RetryPolicy policy, HttpOptions options,
                       Transport transport, Sleeper sleeper)
    : policy_(policy),
      options_(std::move(options)),
      transport_(std::move(transport)),
      sleeper_(std::move(sleeper)) {
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

HttpResponse HttpClient::get(const std::string& url, long timeout_s) {
    HttpRequest req;
    req.url = url;
    req.timeout_s = timeout_s;
    req.user_agent = options_.user_agent;
    req.headers = options_.headers;

    HttpResponse resp;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (requests_sent_ > 0 && options_.request_delay.count() > 0)
            sleeper_(options_.request_delay);

        ++requests_sent_;
        LOG_DEBUG("GET %s (attempt %d/%d)", redact_url(url).c_str(), attempt, policy_.max_attempts);
        resp = transport_(req);
        if (resp.ok) return resp;

        LOG_WARN("request failed (attempt %d/%d): %s",
                 attempt, policy_.max_attempts, resp.error.c_str());
        if (attempt < policy_.max_attempts)
            sleeper_(policy_.delay_for(attempt));
    }

    LOG_ERROR("giving up after %d attempts", policy_.max_attempts);
    return resp;
}
