#pragma once

#include <chrono>
#include <cstdint>

#include <linux/can.h>

namespace CanVss {

    using CANFrame = struct can_frame;
    using CANTime = std::chrono::system_clock::time_point;

    constexpr canid_t MAX_STANDARD_ID = CAN_SFF_MASK;
    constexpr canid_t MAX_EXTENDED_ID = CAN_EFF_MASK;

    // identifier without the EFF/RTR/ERR flag bits
    constexpr canid_t frame_id(const CANFrame& frame) {
        return frame.can_id & CAN_EFF_MASK;
    }

    constexpr bool is_extended(const CANFrame& frame) {
        return (frame.can_id & CAN_EFF_FLAG) != 0;
    }

}
