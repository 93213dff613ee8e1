#include <algorithm>
#include <cstdio>
#include <cstring>

#include "CanVss/Core/CANHelpers.hpp"

namespace CanVss {

    CANFrame make_frame(canid_t id, std::span<const uint8_t> payload) {
        CANFrame frame;
        std::memset(&frame, 0, sizeof(frame));

        frame.can_id = id & CAN_EFF_MASK;
        if (frame.can_id > MAX_STANDARD_ID)
            frame.can_id |= CAN_EFF_FLAG;

        const size_t len = std::min(payload.size(), static_cast<size_t>(CAN_MAX_DLEN));
        std::copy_n(payload.begin(), len, frame.data);
        frame.len = static_cast<uint8_t>(len);
        return frame;
    }

    CANFrame make_frame(canid_t id, std::initializer_list<uint8_t> payload) {
        return make_frame(id, std::span<const uint8_t>(payload.begin(), payload.size()));
    }

    bool same_frame(const CANFrame& a, const CANFrame& b) {
        if (a.can_id != b.can_id || a.len != b.len)
            return false;
        auto pa = CanVss::payload(a);
        auto pb = CanVss::payload(b);
        return std::equal(pa.begin(), pa.end(), pb.begin(), pb.end());
    }

    std::string format_frame(const CANFrame& frame) {
        char head[32];
        std::snprintf(head, sizeof(head), "0x%03X | %3u |", frame_id(frame), static_cast<unsigned>(frame.len));

        std::string rv(head);
        for (uint8_t byte : payload(frame)) {
            char hex[4];
            std::snprintf(hex, sizeof(hex), " %02X", byte);
            rv += hex;
        }
        return rv;
    }

    std::string frame_table_header() {
        char line[32];
        std::snprintf(line, sizeof(line), "%5s | %3s | %s", "ID", "DLC", "Data");
        return line;
    }

    std::optional<std::string> read_file(const std::string& path) {
        FILE* file = std::fopen(path.c_str(), "rb");
        if (!file)
            return std::nullopt;

        std::fseek(file, 0, SEEK_END);
        long file_size = std::ftell(file);
        std::fseek(file, 0, SEEK_SET);

        if (file_size < 0) {
            std::fclose(file);
            return std::nullopt;
        }

        std::string content(static_cast<size_t>(file_size), '\0');
        size_t n = std::fread(content.data(), 1, content.size(), file);
        std::fclose(file);

        if (n != content.size())
            return std::nullopt;
        return content;
    }

}
