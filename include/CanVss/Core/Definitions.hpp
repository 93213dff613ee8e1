#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "CanVss/Core/CANKernelTypes.hpp"

namespace CanVss {

    constexpr unsigned MAX_SIGNAL_BITS = 32;

    enum class SignalKind : uint8_t {
        boolean,
        u8,
        u16,
        u32,
        i8,
        i16,
        i32,
        f32
    };

    std::optional<SignalKind> parse_signal_kind(std::string_view text);
    std::string_view to_string(SignalKind kind);

    constexpr bool is_signed(SignalKind kind) {
        return kind == SignalKind::i8 || kind == SignalKind::i16 || kind == SignalKind::i32;
    }

    using SignalValue = std::variant<bool, double>;
    using SignalMap = std::unordered_map<std::string, SignalValue>;

    double as_double(const SignalValue& value);
    std::string to_string(const SignalValue& value);

    struct SignalDefinition {
        std::string name;
        unsigned start_bit = 0;
        unsigned bit_length = 0;
        SignalKind kind = SignalKind::u8;
        double scale = 1.0;
        double offset = 0.0;
        std::optional<double> min;
        std::optional<double> max;
        std::string unit;
        std::string description;
    };

    struct MessageDefinition {
        canid_t id = 0;
        std::string name;
        unsigned dlc = CAN_MAX_DLEN;
        std::vector<SignalDefinition> signals;
        unsigned cycle_time = 0;
        std::string description;

        // A signal with a name already present replaces it in place. Returns
        // false on replacement.
        bool add_signal(SignalDefinition signal);

        std::optional<const SignalDefinition*> get_signal(std::string_view signal_name) const;

        size_t signal_count() const { return signals.size(); }
    };

    // Empty when the definition is usable, otherwise the reason it is not.
    std::optional<std::string> validate(const MessageDefinition& def);

}
