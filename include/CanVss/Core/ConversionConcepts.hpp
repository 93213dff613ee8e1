#pragma once

#include <concepts>

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/Definitions.hpp"

namespace CanVss {

    template<typename T>
    concept IsFrameReceivable = requires(T t, const CANFrame& frame) {
        { t.receive_frame(frame) } -> std::same_as<void>;
    };

    template<typename T>
    concept IsSignalSink = requires(T t, canid_t id, const SignalMap& signals) {
        { t.publish(id, signals) } -> std::same_as<void>;
    };

}
