#pragma once

#include "channel.h"
#include "config.h"
#include "http_client.h"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ConvertObserver {
    std::function<void(const ServerCredential& server, size_t index, size_t total)> on_server_start;
    std::function<void(const ChannelRecord& ch)> on_channel;
    std::function<void(const std::string& path, int count)> on_file_written;
};

std::string output_path_for(const std::string& output, StreamFormat format, bool primary);

class Converter {
public:
    Converter(const Config& cfg, HttpClient& http, ConvertObserver observer = {});

    int run();

    std::vector<ChannelRecord> collect(StreamFormat format);

private:
    struct ServerData {
        ServerCredential server;
        CategoryMap categories;
        std::vector<nlohmann::json> streams;
    };

    bool load_source();
    void fetch_servers(const XtreamSource& src);

    const Config& cfg_;
    HttpClient& http_;
    ConvertObserver observer_;

    bool loaded_ = false;
    std::vector<std::string> text_lines_;
    std::vector<ServerData> servers_;
};
