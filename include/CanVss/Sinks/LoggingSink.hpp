#pragma once

#include <atomic>
#include <cstdint>

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/Definitions.hpp"
#include "CanVss/Core/Logging.hpp"

namespace CanVss {

    // Writes each converted value as "destination = value" to the log.
    class LoggingSink {
        LogLevel _level;
        std::atomic<uint64_t> _published{ 0 };

    public:
        explicit LoggingSink(LogLevel level = LogLevel::info) : _level(level) {}

        void publish(canid_t id, const SignalMap& signals);

        uint64_t published() const { return _published.load(std::memory_order_relaxed); }
    };

}
