#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <filesystem>

std::string read_from_file(const std::filesystem::path& path);

// writes to a sibling temp file, fsyncs, renames over the target, then fsyncs the directory
void write_file_atomic(const std::filesystem::path& path, std::string_view data);

std::string to_hex(std::string_view bytes);
bool is_hex_digest(std::string_view s, size_t bytes = 20);

std::string to_lower(std::string_view s);
std::vector<std::string> split_words(std::string_view line);

std::string human_readable_size(int64_t bytes);
std::string format_speed(double bytes_per_second);
