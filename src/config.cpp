#include "config.h"
#include "fs_util.h"
#include "log.h"
#include <fstream>

using json = nlohmann::json;

const char* source_name(const ChannelSource& src) {
    if (std::holds_alternative<XtreamSource>(src)) return "xtream";
    if (std::holds_alternative<TextSource>(src)) return "text";
    return "channels";
}

static ServerCredential server_from_json(const json& j, size_t index) {
    if (!j.is_object())
        throw ConfigError("servers[" + std::to_string(index) + "] is not an object");

    ServerCredential s;
    for (const char* key : {"host", "username", "password"}) {
        if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty())
            throw ConfigError("servers[" + std::to_string(index) + "] is missing '" + key + "'");
    }
    s.host = strip_trailing_slash(j["host"].get<std::string>());
    s.username = j["username"].get<std::string>();
    s.password = j["password"].get<std::string>();
    s.name = j.value("name", "");
    if (s.name.empty()) s.name = s.host;
    return s;
}

static ChannelSource source_from_json(const json& j) {
    if (j.contains("servers")) {
        const json& arr = j["servers"];
        if (!arr.is_array()) throw ConfigError("'servers' must be an array");
        XtreamSource src;
        for (size_t i = 0; i < arr.size(); ++i)
            src.servers.push_back(server_from_json(arr[i], i));
        return src;
    }

    if (j.contains("channels")) {
        if (!j["channels"].is_array()) throw ConfigError("'channels' must be an array");
        FlatSource src;
        src.channels = j["channels"];
        return src;
    }

    if (j.contains("channels_file")) {
        TextSource src;
        src.path = j["channels_file"].get<std::string>();
        return src;
    }

    throw ConfigError("config has neither 'channels', 'servers' nor 'channels_file'");
}

Config config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    Config cfg;
    try {
        cfg.source = source_from_json(j);

        if (j.contains("output"))    cfg.output    = j["output"].get<std::string>();
        if (j.contains("log_level")) cfg.log_level = j["log_level"].get<std::string>();

        if (j.contains("formats")) {
            cfg.formats.clear();
            for (auto& f : j["formats"]) {
                StreamFormat fmt;
                if (!stream_format_parse(f.get<std::string>(), fmt))
                    throw ConfigError("unknown format '" + f.get<std::string>() + "'");
                cfg.formats.push_back(fmt);
            }
            if (cfg.formats.empty()) cfg.formats.push_back(StreamFormat::TS);
        }

        if (j.contains("user_agent")) cfg.http.user_agent = j["user_agent"].get<std::string>();
        if (j.contains("headers"))
            cfg.http.headers = j["headers"].get<std::map<std::string, std::string>>();
        if (j.contains("request_delay_ms"))
            cfg.http.request_delay = std::chrono::milliseconds(j["request_delay_ms"].get<long long>());

        if (j.contains("retry")) {
            const json& r = j["retry"];
            cfg.retry.max_attempts = r.value("max_attempts", cfg.retry.max_attempts);
            cfg.retry.delay = std::chrono::milliseconds(r.value("delay_ms", 2000LL));
            cfg.retry.backoff = r.value("backoff", cfg.retry.backoff);
            cfg.retry.max_delay = std::chrono::milliseconds(r.value("max_delay_ms", 30000LL));
            if (cfg.retry.max_attempts < 1)
                throw ConfigError("retry.max_attempts must be at least 1");
        }

        if (j.contains("timeouts")) {
            const json& t = j["timeouts"];
            cfg.timeouts.connect_test = t.value("connect_test", cfg.timeouts.connect_test);
            cfg.timeouts.categories   = t.value("categories", cfg.timeouts.categories);
            cfg.timeouts.streams      = t.value("streams", cfg.timeouts.streams);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    if (cfg.output.empty()) throw ConfigError("'output' must not be empty");
    return cfg;
}

Config config_load(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file " + path);

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }

    Config cfg = config_from_json(j);
    LOG_INFO("loaded config from %s (source: %s)", path.c_str(), source_name(cfg.source));
    return cfg;
}

static const char* kDefaultConfig = "config.json";
static const char* kDefaultChannelList = "channels.txt";

Config config_resolve(int argc, char* argv[]) {
    if (argc > 1) return config_load(argv[1]);
    if (!file_exists(kDefaultConfig) && file_exists(kDefaultChannelList)) {
        LOG_INFO("%s not found, converting %s", kDefaultConfig, kDefaultChannelList);
        return config_for_text(kDefaultChannelList);
    }
    return config_load(kDefaultConfig);
}

Config config_for_text(const std::string& path) {
    if (!file_exists(path)) throw ConfigError("cannot open channel list " + path);
    Config cfg;
    cfg.source = TextSource{path};
    return cfg;
}
