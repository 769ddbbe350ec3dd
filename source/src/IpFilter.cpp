#include "IpFilter.hpp"

#include <fstream>
#include <stdexcept>

#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>

namespace {

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return std::string(s.substr(first, last - first + 1));
}

boost::asio::ip::address parse_address(const std::string& text, size_t line_no) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(text, ec);
    if (ec) throw std::invalid_argument("line " + std::to_string(line_no) + ": bad address '" + text + "'");
    return addr;
}

}

std::vector<IpRange> parse_ip_filter(std::istream& in) {
    std::vector<IpRange> out;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;

        auto body = trim(std::string_view(line).substr(0, line.find('#')));
        if (body.empty()) continue;

        auto dash = body.find('-');
        if (dash == std::string::npos) {
            BOOST_LOG_TRIVIAL(warning) << "IP filter line " << line_no << " has no range, skipped";
            continue;
        }

        IpRange range{ trim(std::string_view(body).substr(0, dash)), trim(std::string_view(body).substr(dash + 1)) };

        auto first = parse_address(range.first, line_no);
        auto last = parse_address(range.last, line_no);

        if (first.is_v4() != last.is_v4()) {
            throw std::invalid_argument("line " + std::to_string(line_no) + ": range mixes IPv4 and IPv6");
        }
        if (last < first) {
            throw std::invalid_argument("line " + std::to_string(line_no) + ": range end is before its start");
        }

        out.push_back(std::move(range));
    }

    return out;
}

std::vector<IpRange> load_ip_filter(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("IP filter file not found: " + path.string());

    return parse_ip_filter(file);
}
