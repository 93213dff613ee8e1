#include <algorithm>
#include <cmath>
#include <limits>

#include "CanVss/Core/Signal/NumericValue.hpp"

namespace CanVss {

    int64_t sign_extend(uint64_t raw, unsigned bits) {
        if (bits == 0 || bits >= 64)
            return static_cast<int64_t>(raw);

        const uint64_t sign_bit = uint64_t{1} << (bits - 1);
        const uint64_t field = raw & ((uint64_t{1} << bits) - 1);
        if (field & sign_bit)
            return static_cast<int64_t>(field) - static_cast<int64_t>(uint64_t{1} << bits);
        return static_cast<int64_t>(field);
    }

    NumericValue::NumericValue(double scale_factor, double offset_value,
                               std::optional<double> min_value, std::optional<double> max_value)
        : _factor(scale_factor), _offset(offset_value), _min(min_value), _max(max_value) {}

    double NumericValue::convert(double raw) const {
        return clamp(raw * _factor + _offset);
    }

    double NumericValue::clamp(double physical) const {
        if (_min)
            physical = std::max(physical, *_min);
        if (_max)
            physical = std::min(physical, *_max);
        return physical;
    }

    int64_t NumericValue::to_raw(double physical, unsigned bits, bool is_signed) const {
        bits = std::clamp(bits, 1u, 63u);

        const double lo = is_signed ? -std::ldexp(1.0, bits - 1) : 0.0;
        const double hi = is_signed ? std::ldexp(1.0, bits - 1) - 1.0 : std::ldexp(1.0, bits) - 1.0;

        double raw = (clamp(physical) - _offset) / _factor;
        if (std::isnan(raw))
            return 0;
        raw = std::clamp(std::round(raw), lo, hi);
        return static_cast<int64_t>(raw);
    }

}
