#include "playlist_writer.h"
#include "fs_util.h"
#include "log.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>

static std::string single_line(std::string s) {
    for (auto& c : s) {
        if (c == '\r' || c == '\n') c = ' ';
    }
    return s;
}

static std::string attr_value(const std::string& s) {
    std::string v = single_line(s);
    for (auto& c : v) {
        if (c == '"') c = '\'';
    }
    return v;
}

static std::string now_string() {
    std::time_t t = std::time(nullptr);
    struct tm tm;
    localtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string format_extinf(const ChannelRecord& ch) {
    std::string line = "#EXTINF:-1";
    if (!ch.tvg_id.empty()) line += " tvg-id=\"" + attr_value(ch.tvg_id) + "\"";
    if (!ch.logo.empty())   line += " tvg-logo=\"" + attr_value(ch.logo) + "\"";
    if (!ch.group.empty())  line += " group-title=\"" + attr_value(ch.group) + "\"";
    line += "," + single_line(ch.name);
    return line;
}

std::string render_playlist(const std::vector<ChannelRecord>& channels,
                            const std::string& generated_at) {
    std::string body;
    int count = 0;
    for (auto& ch : channels) {
        if (ch.url.empty()) continue;
        body += format_extinf(ch);
        body += '\n';
        body += single_line(ch.url);
        body += '\n';
        ++count;
    }

    std::string out = "#EXTM3U\n";
    out += "# Generated: " + generated_at + " | " + std::to_string(count) + " channels\n";
    out += body;
    return out;
}

int generate(const std::vector<ChannelRecord>& channels, const std::string& path) {
    if (!ensure_parent_dir(path)) return -1;

    std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f) {
        LOG_ERROR("cannot open %s for writing: %s", path.c_str(), strerror(errno));
        return -1;
    }

    int count = 0;
    for (auto& ch : channels) {
        if (!ch.url.empty()) ++count;
    }

    f << render_playlist(channels, now_string());
    f.close();
    if (!f) {
        LOG_ERROR("failed writing %s", path.c_str());
        return -1;
    }

    LOG_DEBUG("wrote %d channels to %s", count, path.c_str());
    return count;
}
