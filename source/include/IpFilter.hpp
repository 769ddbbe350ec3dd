#pragma once

#include "Engine.hpp"

#include <istream>
#include <vector>
#include <filesystem>

// "first - last [# comment]" per line, IPv4 or IPv6; blank and comment lines are skipped.
// throws std::invalid_argument naming the offending line
std::vector<IpRange> parse_ip_filter(std::istream& in);

// throws std::runtime_error when the file cannot be opened
std::vector<IpRange> load_ip_filter(const std::filesystem::path& path);
