#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace CanVss {

    // Local to one signal; the frame carries on without it.
    enum class DecodeError {
        truncated,
        zero_length,
        too_wide,
        zero_scale      // encode only; a zero factor has no inverse
    };

    constexpr std::string_view to_string(DecodeError err) {
        switch (err) {
            case DecodeError::truncated: return "truncated";
            case DecodeError::zero_length: return "zero_length";
            case DecodeError::too_wide: return "too_wide";
            case DecodeError::zero_scale: return "zero_scale";
        }
        return "unknown";
    }

    // Malformed configuration payload or an invalid definition.
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

}
