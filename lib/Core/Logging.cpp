#include <iostream>
#include <mutex>
#include <string>
#include <algorithm>
#include <cctype>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include "CanVss/Core/Logging.hpp"

namespace CanVss {

    namespace logging = boost::log;
    namespace expr = boost::log::expressions;

    void init_logging(LogLevel level) {
        static std::once_flag console_once;
        std::call_once(console_once, [] {
            logging::add_common_attributes();
            logging::add_console_log(
                std::clog,
                logging::keywords::format = (
                    expr::stream << "[" << logging::trivial::severity << "] " << expr::smessage
                )
            );
        });

        logging::core::get()->set_filter(logging::trivial::severity >= level);
    }

    std::optional<LogLevel> parse_log_level(std::string_view text) {
        std::string lower(text);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace") return LogLevel::trace;
        if (lower == "debug") return LogLevel::debug;
        if (lower == "info") return LogLevel::info;
        if (lower == "warning" || lower == "warn") return LogLevel::warning;
        if (lower == "error") return LogLevel::error;
        if (lower == "fatal") return LogLevel::fatal;
        return std::nullopt;
    }

}
