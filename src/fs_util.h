#pragma once

#include <string>
#include <vector>

bool file_exists(const std::string& path);

bool ensure_parent_dir(const std::string& path);

bool read_lines(const std::string& path, std::vector<std::string>& lines);
