#include "channel.h"

bool stream_format_parse(const std::string& s, StreamFormat& out) {
    if (s == "ts" || s == ".ts") {
        out = StreamFormat::TS;
    } else if (s == "m3u8" || s == ".m3u8") {
        out = StreamFormat::M3U8;
    } else if (s == "none" || s.empty()) {
        out = StreamFormat::NONE;
    } else {
        return false;
    }
    return true;
}

const char* stream_format_name(StreamFormat f) {
    switch (f) {
        case StreamFormat::TS:   return "ts";
        case StreamFormat::M3U8: return "m3u8";
        case StreamFormat::NONE: return "none";
    }
    return "?";
}

const char* stream_format_ext(StreamFormat f) {
    switch (f) {
        case StreamFormat::TS:   return ".ts";
        case StreamFormat::M3U8: return ".m3u8";
        case StreamFormat::NONE: return "";
    }
    return "";
}
