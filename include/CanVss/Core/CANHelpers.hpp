#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "CanVss/Core/CANKernelTypes.hpp"

namespace CanVss {

    // Payload bytes beyond the first 8 are dropped. Identifiers above the
    // 11-bit range get the EFF flag.
    CANFrame make_frame(canid_t id, std::span<const uint8_t> payload);
    CANFrame make_frame(canid_t id, std::initializer_list<uint8_t> payload);

    inline std::span<const uint8_t> payload(const CANFrame& frame) {
        return { frame.data, frame.len <= CAN_MAX_DLEN ? frame.len : static_cast<size_t>(CAN_MAX_DLEN) };
    }

    bool same_frame(const CANFrame& a, const CANFrame& b);

    // "0x100 |   8 | 01 00 00 00 00 00 00 00"
    std::string format_frame(const CANFrame& frame);
    std::string frame_table_header();

    std::optional<std::string> read_file(const std::string& path);

}
