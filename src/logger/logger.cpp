#include "logger/logger.hpp"
#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace vault::logger {

namespace {

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

// Shared by both sinks
logging::formatter make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " [" << logging::trivial::severity << "] "
        << expr::smessage;
}

} // namespace

void init_logging(const LogOptions& options) {
    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        if (options.console) {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
            auto sink = boost::make_shared<console_sink>(backend);
            sink->set_formatter(make_formatter());
            logging::core::get()->add_sink(sink);
        }

        if (options.log_file) {
            auto backend = boost::make_shared<sinks::text_file_backend>();

            // Convert to absolute path
            std::filesystem::path log_path = std::filesystem::absolute(*options.log_file);
            backend->set_file_name_pattern(log_path.string());
            backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
            backend->set_rotation_size(options.rotation_size);
            backend->auto_flush(true);

            using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
            auto sink = boost::make_shared<file_sink>(backend);
            sink->set_formatter(make_formatter());
            logging::core::get()->add_sink(sink);
        }

        logging::add_common_attributes();
        set_min_level(options.min_level);
        logging::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized"
                                 << (options.log_file ? " with file " + options.log_file->string() : "");
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_min_level(boost::log::trivial::severity_level level) {
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

std::optional<boost::log::trivial::severity_level> parse_severity(const std::string& name) {
    boost::log::trivial::severity_level level;
    if (boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
        return level;
    }
    return std::nullopt;
}

} // namespace vault::logger
