#pragma once

#include "channel.h"
#include "http_client.h"
#include "xtream_client.h"
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FlatSource {
    nlohmann::json channels = nlohmann::json::array();
};

struct TextSource {
    std::string path = "channels.txt";
};

struct XtreamSource {
    std::vector<ServerCredential> servers;
};

using ChannelSource = std::variant<FlatSource, TextSource, XtreamSource>;

struct Config {
    std::string output = "output/playlist.m3u";
    std::string log_level = "INFO";
    std::vector<StreamFormat> formats = {StreamFormat::TS};
    HttpOptions http;
    RetryPolicy retry;
    XtreamTimeouts timeouts;
    ChannelSource source;
};

const char* source_name(const ChannelSource& src);

Config config_from_json(const nlohmann::json& j);
Config config_load(const std::string& path);
Config config_for_text(const std::string& path);

// argv[1] if given, else ./config.json, else ./channels.txt.
Config config_resolve(int argc, char* argv[]);
