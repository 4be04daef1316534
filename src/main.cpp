#include "config.h"
#include "converter.h"
#include "http_client.h"
#include "log.h"
#include <curl/curl.h>
#include <iostream>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [config.json]\n"
              << "\nWithout arguments reads ./config.json, or ./channels.txt"
              << " when no config exists.\n";
}

static ConvertObserver logging_observer() {
    ConvertObserver obs;
    obs.on_server_start = [](const ServerCredential& s, size_t index, size_t total) {
        LOG_INFO("server %zu/%zu: %s (%s)", index + 1, total, s.name.c_str(), s.host.c_str());
    };
    obs.on_channel = [](const ChannelRecord& ch) {
        LOG_DEBUG("  + %s [%s]", ch.name.c_str(), ch.group.c_str());
    };
    obs.on_file_written = [](const std::string& path, int count) {
        LOG_INFO("wrote %s (%d channels)", path.c_str(), count);
    };
    return obs;
}

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && argv[1][0] == '-')) {
        usage(argv[0]);
        return 1;
    }

    log_init("INFO");

    Config cfg;
    try {
        cfg = config_resolve(argc, argv);
    } catch (const ConfigError& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
    log_init(cfg.log_level);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    HttpClient http(cfg.retry, cfg.http);
    Converter converter(cfg, http, logging_observer());
    int rc = converter.run();

    curl_global_cleanup();
    return rc;
}
