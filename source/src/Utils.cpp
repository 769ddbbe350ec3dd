#include "Utils.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <cctype>
#include <cerrno>
#include <format>
#include <iterator>

#include <fcntl.h>
#include <unistd.h>

std::string read_from_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path.string());
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    if (!file.read(data.data(), size)) {
        throw std::runtime_error("Could not read file: " + path.string());
    }

    return data;
}

void write_file_atomic(const std::filesystem::path& path, std::string_view data) {
    auto tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "open " + tmp.string());

    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        auto n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::system_error(err, std::generic_category(), "write " + tmp.string());
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "fsync " + tmp.string());
    }

    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::system_error(ec, "rename " + path.string());
    }

    // the rename itself is only durable once the directory entry is flushed
    auto dir = path.parent_path();
    if (dir.empty()) dir = ".";

    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) throw std::system_error(errno, std::generic_category(), "open " + dir.string());

    if (::fsync(dir_fd) != 0) {
        int err = errno;
        ::close(dir_fd);
        throw std::system_error(err, std::generic_category(), "fsync " + dir.string());
    }
    ::close(dir_fd);
}

std::string to_hex(std::string_view bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.resize(bytes.size() * 2);

    for (size_t i = 0; i < bytes.size(); ++i) {
        auto b = static_cast<unsigned char>(bytes[i]);
        out[2*i]     = hex[(b >> 4) & 0xF];
        out[2*i + 1] = hex[b & 0xF];
    }

    return out;
}

bool is_hex_digest(std::string_view s, size_t bytes) {
    if (s.size() != bytes * 2) return false;

    for (char c: s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c: out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> out;
    size_t pos = 0;

    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos >= line.size()) break;

        size_t end = pos;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) ++end;

        out.emplace_back(line.substr(pos, end - pos));
        pos = end;
    }

    return out;
}

std::string human_readable_size(int64_t bytes) {
    if (bytes <= 0) return "0B";

    static constexpr const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    size_t i = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1024.0 && i < std::size(units) - 1) {
        value /= 1024.0;
        ++i;
    }

    return std::format("{:.2f}{}", value, units[i]);
}

std::string format_speed(double s) {
    if (s < 1024.0) return std::format("{:.0f} B/s", s);
    if (s < 1024.0 * 1024.0) return std::format("{:.1f} KB/s", s / 1024.0);
    return std::format("{:.2f} MB/s", s / (1024.0 * 1024.0));
}
