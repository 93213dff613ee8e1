#pragma once

#include <optional>
#include <string_view>

#include <boost/log/trivial.hpp>

namespace CanVss {

    using LogLevel = boost::log::trivial::severity_level;

    // Installs a single console sink on first call; later calls only move the
    // severity threshold.
    void init_logging(LogLevel level = LogLevel::info);

    std::optional<LogLevel> parse_log_level(std::string_view text);

}

#define CANVSS_LOG(lvl) BOOST_LOG_TRIVIAL(lvl) << "[canvss] "
