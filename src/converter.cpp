#include "converter.h"
#include "channel_normalizer.h"
#include "fs_util.h"
#include "playlist_writer.h"
#include "xtream_client.h"
#include "log.h"
#include <iterator>

std::string output_path_for(const std::string& output, StreamFormat format, bool primary) {
    if (primary) return output;

    std::string suffix = std::string("_") + stream_format_name(format);
    auto slash = output.rfind('/');
    auto dot = output.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
        dot == (slash == std::string::npos ? 0 : slash + 1)) {
        return output + suffix;
    }
    return output.substr(0, dot) + suffix + output.substr(dot);
}

Converter::Converter(const Config& cfg, HttpClient& http, ConvertObserver observer)
    : cfg_(cfg), http_(http), observer_(std::move(observer)) {}

void Converter::fetch_servers(const XtreamSource& src) {
    size_t total = src.servers.size();
    for (size_t i = 0; i < total; ++i) {
        const ServerCredential& server = src.servers[i];
        if (observer_.on_server_start) observer_.on_server_start(server, i, total);

        XtreamClient client(server, http_, cfg_.timeouts);
        if (!client.test_connection()) {
            LOG_ERROR("[%s] cannot connect to %s, skipping server",
                      server.name.c_str(), client.server().host.c_str());
            continue;
        }

        ServerData data;
        data.server = client.server();
        data.categories = XtreamClient::build_category_map(client.get_live_categories());
        data.streams = client.get_live_streams();
        LOG_INFO("[%s] %zu categories, %zu live streams", server.name.c_str(),
                 data.categories.size(), data.streams.size());
        servers_.push_back(std::move(data));
    }
}

bool Converter::load_source() {
    if (loaded_) return true;

    if (auto* text = std::get_if<TextSource>(&cfg_.source)) {
        if (!read_lines(text->path, text_lines_)) return false;
        LOG_INFO("read %zu lines from %s", text_lines_.size(), text->path.c_str());
    } else if (auto* xtream = std::get_if<XtreamSource>(&cfg_.source)) {
        fetch_servers(*xtream);
    }

    loaded_ = true;
    return true;
}

std::vector<ChannelRecord> Converter::collect(StreamFormat format) {
    std::vector<ChannelRecord> channels;
    if (!load_source()) return channels;

    if (auto* flat = std::get_if<FlatSource>(&cfg_.source)) {
        channels = normalize_flat(flat->channels);
    } else if (std::holds_alternative<TextSource>(cfg_.source)) {
        channels = normalize_text(text_lines_, format);
    } else {
        for (auto& data : servers_) {
            XtreamClient client(data.server, http_, cfg_.timeouts);
            auto part = normalize_xtream(data.streams, data.categories, client, format);
            channels.insert(channels.end(),
                            std::make_move_iterator(part.begin()),
                            std::make_move_iterator(part.end()));
        }
    }
    return channels;
}

int Converter::run() {
    LOG_INFO("converting %s source to %s", source_name(cfg_.source), cfg_.output.c_str());

    if (!load_source()) {
        LOG_ERROR("channel source could not be read");
        return 1;
    }

    std::vector<StreamFormat> formats = cfg_.formats;
    if (formats.empty() || std::holds_alternative<FlatSource>(cfg_.source))
        formats.resize(1, StreamFormat::TS);

    int status = 0;
    for (size_t i = 0; i < formats.size(); ++i) {
        bool primary = i == 0;
        auto channels = collect(formats[i]);
        if (primary && observer_.on_channel) {
            for (auto& ch : channels) observer_.on_channel(ch);
        }

        std::string path = output_path_for(cfg_.output, formats[i], primary);
        int written = generate(channels, path);
        if (written < 0) {
            status = 1;
            continue;
        }
        if (observer_.on_file_written) observer_.on_file_written(path, written);
    }
    return status;
}
