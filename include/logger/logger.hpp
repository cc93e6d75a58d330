#ifndef GUIDSTORE_LOGGER_HPP
#define GUIDSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace guidstore::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink writing "<timestamp> [<severity>] <message>"
void init_logging(const std::string& log_file = "guidstore.log",
                  severity_level min_level = boost::log::trivial::info);

// Installs a console sink on std::clog with the same format
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// Adjusts the global severity filter
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal", throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace guidstore::logging

#endif // GUIDSTORE_LOGGER_HPP
