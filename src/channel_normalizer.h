#pragma once

#include "channel.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class XtreamClient;

extern const char* const kDefaultChannelName;
extern const char* const kDefaultGroup;

std::vector<ChannelRecord> normalize_flat(const nlohmann::json& channels);

std::optional<ChannelRecord> parse_text_channel(const std::string& line,
                                                StreamFormat format);
std::vector<ChannelRecord> normalize_text(const std::vector<std::string>& lines,
                                          StreamFormat format);

std::vector<ChannelRecord> normalize_xtream(const std::vector<nlohmann::json>& streams,
                                            const CategoryMap& categories,
                                            const XtreamClient& client,
                                            StreamFormat format);
