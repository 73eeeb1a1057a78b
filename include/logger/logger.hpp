#ifndef VAULT_LOGGER_HPP
#define VAULT_LOGGER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace vault::logger {

struct LogOptions {
    // Console sink on stderr, so it never mixes with CLI output
    bool console = true;
    // Optional text file sink, truncated on start
    std::optional<std::filesystem::path> log_file;
    // Rotate the file sink at this size
    std::size_t rotation_size = 10 * 1024 * 1024;
    boost::log::trivial::severity_level min_level = boost::log::trivial::info;
};

// Replaces any existing sinks. Call once at startup.
void init_logging(const LogOptions& options);

// Changes the severity filter without touching the sinks
void set_min_level(boost::log::trivial::severity_level level);

// Accepts trace, debug, info, warning, error, fatal
std::optional<boost::log::trivial::severity_level> parse_severity(const std::string& name);

} // namespace vault::logger

#endif // VAULT_LOGGER_HPP
