#include <cstdio>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>

#include "CanVss/Sinks/LoggingSink.hpp"

namespace CanVss {

    void LoggingSink::publish(canid_t id, const SignalMap& signals) {
        char head[16];
        std::snprintf(head, sizeof(head), "[0x%03X] ", id);

        for (const auto& [destination, value] : signals) {
            BOOST_LOG_SEV(boost::log::trivial::logger::get(), _level)
                << "[canvss] " << head << destination << " = " << to_string(value);
        }
        _published.fetch_add(signals.size(), std::memory_order_relaxed);
    }

}
