#include "Logging.hpp"

#include <stdexcept>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void init_logging(const std::filesystem::path& file, logging::trivial::severity_level level) {
    logging::add_file_log(
        keywords::file_name = file.string(),
        keywords::open_mode = std::ios_base::out | std::ios_base::app,
        keywords::auto_flush = true,
        keywords::format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
                << " - " << logging::trivial::severity
                << " - " << expr::smessage
        )
    );

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

logging::trivial::severity_level parse_log_level(const std::string& name) {
    logging::trivial::severity_level level;
    if (!logging::trivial::from_string(name.data(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}
