#include "channel_normalizer.h"
#include "xtream_client.h"
#include "log.h"

using json = nlohmann::json;

const char* const kDefaultChannelName = "No name";
const char* const kDefaultGroup = "General";

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// First non-empty string (or numeric id) among the given keys.
static std::string field(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = obj.find(k);
        if (it == obj.end()) continue;
        std::string v = it->is_string() ? it->get<std::string>() : json_id(*it);
        v = trim(v);
        if (!v.empty()) return v;
    }
    return "";
}

std::vector<ChannelRecord> normalize_flat(const json& channels) {
    std::vector<ChannelRecord> out;
    if (!channels.is_array()) return out;

    for (auto& ch : channels) {
        if (!ch.is_object()) {
            LOG_DEBUG("skipping non-object channel entry");
            continue;
        }

        ChannelRecord rec;
        rec.name = field(ch, {"title", "name"});
        if (rec.name.empty()) rec.name = kDefaultChannelName;
        rec.url = field(ch, {"url"});
        if (rec.url.empty()) {
            LOG_DEBUG("skipping '%s': no url", rec.name.c_str());
            continue;
        }
        rec.logo = field(ch, {"logo", "stream_icon"});
        rec.tvg_id = field(ch, {"tvg_id", "tvg-id"});
        rec.group = field(ch, {"group"});
        if (rec.group.empty()) rec.group = kDefaultGroup;
        out.push_back(std::move(rec));
    }
    return out;
}

static bool strip_suffix(std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    if (s.compare(s.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    s.erase(s.size() - suffix.size());
    return true;
}

std::optional<ChannelRecord> parse_text_channel(const std::string& raw,
                                                StreamFormat format) {
    static const std::string scheme = "http://";

    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    auto comma = line.find(',');
    if (comma == std::string::npos) return std::nullopt;

    std::string name = trim(line.substr(0, comma));
    std::string url = trim(line.substr(comma + 1));
    if (url.compare(0, scheme.size(), scheme) != 0) return std::nullopt;

    std::vector<std::string> parts;
    std::string rest = url.substr(scheme.size());
    size_t start = 0;
    while (true) {
        auto slash = rest.find('/', start);
        parts.push_back(rest.substr(start, slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    if (parts.size() != 4) return std::nullopt;
    for (auto& p : parts) {
        if (p.empty()) return std::nullopt;
    }

    std::string id = parts[3];
    if (!strip_suffix(id, ".ts")) strip_suffix(id, ".m3u8");
    if (id.empty()) return std::nullopt;

    ChannelRecord rec;
    rec.name = name.empty() ? kDefaultChannelName : name;
    rec.url = build_stream_url(scheme + parts[0], parts[1], parts[2], id,
                               stream_format_ext(format));
    return rec;
}

std::vector<ChannelRecord> normalize_text(const std::vector<std::string>& lines,
                                          StreamFormat format) {
    std::vector<ChannelRecord> out;
    int lineno = 0;
    for (auto& line : lines) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto rec = parse_text_channel(t, format);
        if (!rec) {
            LOG_WARN("line %d skipped, expected 'name,http://host/user/pass/id': %s",
                     lineno, t.c_str());
            continue;
        }
        out.push_back(std::move(*rec));
    }
    return out;
}

std::vector<ChannelRecord> normalize_xtream(const std::vector<json>& streams,
                                            const CategoryMap& categories,
                                            const XtreamClient& client,
                                            StreamFormat format) {
    std::vector<ChannelRecord> out;
    out.reserve(streams.size());

    for (auto& s : streams) {
        std::string stream_id = field(s, {"stream_id"});
        if (stream_id.empty()) {
            LOG_DEBUG("skipping stream without stream_id");
            continue;
        }

        ChannelRecord rec;
        rec.name = field(s, {"name"});
        if (rec.name.empty()) rec.name = kDefaultChannelName;
        rec.tvg_id = field(s, {"epg_channel_id"});
        rec.logo = field(s, {"stream_icon"});
        rec.url = client.build_stream_url(stream_id, format);

        rec.group = kDefaultGroup;
        std::string cat = field(s, {"category_id"});
        auto it = categories.find(cat);
        if (it != categories.end() && !it->second.empty())
            rec.group = it->second;

        out.push_back(std::move(rec));
    }
    return out;
}
