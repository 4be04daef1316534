#pragma once

#include <map>
#include <string>

struct ChannelRecord {
    std::string name;
    std::string tvg_id;
    std::string logo;
    std::string group = "General";
    std::string url;
};

struct ServerCredential {
    std::string name;
    std::string host;
    std::string username;
    std::string password;
};

// category_id -> category_name
using CategoryMap = std::map<std::string, std::string>;

enum class StreamFormat { TS, M3U8, NONE };

bool stream_format_parse(const std::string& s, StreamFormat& out);
const char* stream_format_name(StreamFormat f);
const char* stream_format_ext(StreamFormat f);
