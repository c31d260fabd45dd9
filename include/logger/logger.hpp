#ifndef DISTORE_LOGGER_HPP
#define DISTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace distore::logging {

using severity_level = boost::log::trivial::severity_level;

// Routes all BOOST_LOG_TRIVIAL output to log_file (rotated at 10 MB) with
// timestamp, severity and thread id
void init_logging(const std::string& log_file = "distore.log",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity written by the installed sinks
void set_min_severity(severity_level min_level);

// Keeps only records at or above min_level and installs no sink, for tests
void silence(severity_level min_level = severity_level::fatal);

} // namespace distore::logging

#endif // DISTORE_LOGGER_HPP
