#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace distore::logging {

void init_logging(const std::string& log_file, severity_level min_level) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        logging::add_common_attributes();

        logging::add_file_log(
            keywords::file_name = log_path.string(),
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = (
                expr::stream
                    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                    << " [" << logging::trivial::severity << "]"
                    << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
                    << " " << expr::smessage
            ),
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );

        set_min_severity(min_level);
        logging::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_min_severity(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void silence(severity_level min_level) {
    boost::log::core::get()->remove_all_sinks();
    set_min_severity(min_level);
}

} // namespace distore::logging
