#pragma once

#include "channel.h"
#include <string>
#include <vector>

std::string format_extinf(const ChannelRecord& ch);

std::string render_playlist(const std::vector<ChannelRecord>& channels,
                            const std::string& generated_at);

// Returns the number of channels written, or -1 on failure.
int generate(const std::vector<ChannelRecord>& channels, const std::string& path);
