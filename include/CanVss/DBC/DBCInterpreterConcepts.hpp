#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>

namespace CanVss {

    template<typename T>
    concept HasBo = requires(T t, uint32_t id, const std::string& name, size_t size, const std::string& sender) {
        { t.bo(id, name, size, sender) } -> std::same_as<void>;
    };

    template<typename T>
    concept HasSg = requires(
        T t,
        uint32_t id,
        std::optional<unsigned> mux_val,
        bool is_mux_switch,
        const std::string& name,
        unsigned start,
        unsigned size,
        char byte_order,
        char value_type,
        double factor,
        double offset,
        double min,
        double max,
        const std::string& unit
    ) {
        { t.sg(id, mux_val, is_mux_switch, name, start, size, byte_order, value_type, factor, offset, min, max, unit) } -> std::same_as<void>;
    };

}
