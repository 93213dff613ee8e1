#pragma once

#include <cstdint>
#include <optional>

namespace CanVss {

    int64_t sign_extend(uint64_t raw, unsigned bits);

    class NumericValue {
        double _factor;
        double _offset;
        std::optional<double> _min;
        std::optional<double> _max;

    public:
        NumericValue(double scale_factor, double offset_value,
                     std::optional<double> min_value = std::nullopt,
                     std::optional<double> max_value = std::nullopt);

        // raw * factor + offset, clamped afterwards
        double convert(double raw) const;

        double clamp(double physical) const;

        // Inverse of convert, rounded half away from zero and saturated to
        // what a field of the given width can hold.
        int64_t to_raw(double physical, unsigned bits, bool is_signed) const;
    };

}
