#pragma once

#include <string>
#include <filesystem>

#include <boost/log/trivial.hpp>

// append-mode file sink, "<timestamp> - <severity> - <message>"
void init_logging(const std::filesystem::path& file, boost::log::trivial::severity_level level);

// throws std::invalid_argument for anything but trace/debug/info/warning/error/fatal
boost::log::trivial::severity_level parse_log_level(const std::string& name);
