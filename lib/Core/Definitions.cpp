#include <algorithm>
#include <cstdint>
#include <sstream>
#include <unordered_set>

#include "CanVss/Core/Definitions.hpp"

namespace CanVss {

    std::optional<SignalKind> parse_signal_kind(std::string_view text) {
        if (text == "boolean" || text == "bool") return SignalKind::boolean;
        if (text == "uint8") return SignalKind::u8;
        if (text == "uint16") return SignalKind::u16;
        if (text == "uint32") return SignalKind::u32;
        if (text == "int8") return SignalKind::i8;
        if (text == "int16") return SignalKind::i16;
        if (text == "int32") return SignalKind::i32;
        if (text == "float") return SignalKind::f32;
        return std::nullopt;
    }

    std::string_view to_string(SignalKind kind) {
        switch (kind) {
            case SignalKind::boolean: return "boolean";
            case SignalKind::u8: return "uint8";
            case SignalKind::u16: return "uint16";
            case SignalKind::u32: return "uint32";
            case SignalKind::i8: return "int8";
            case SignalKind::i16: return "int16";
            case SignalKind::i32: return "int32";
            case SignalKind::f32: return "float";
        }
        return "unknown";
    }

    double as_double(const SignalValue& value) {
        if (const bool* b = std::get_if<bool>(&value))
            return *b ? 1.0 : 0.0;
        return std::get<double>(value);
    }

    std::string to_string(const SignalValue& value) {
        if (const bool* b = std::get_if<bool>(&value))
            return *b ? "true" : "false";

        std::ostringstream os;
        os << std::get<double>(value);
        return os.str();
    }

    bool MessageDefinition::add_signal(SignalDefinition signal) {
        auto it = std::find_if(signals.begin(), signals.end(),
            [&](const auto& sig) { return sig.name == signal.name; });

        if (it != signals.end()) {
            *it = std::move(signal);
            return false;
        }
        signals.push_back(std::move(signal));
        return true;
    }

    std::optional<const SignalDefinition*> MessageDefinition::get_signal(std::string_view signal_name) const {
        for (const auto& sig : signals) {
            if (sig.name == signal_name)
                return &sig;
        }
        return std::nullopt;
    }

    std::optional<std::string> validate(const MessageDefinition& def) {
        if (def.id > MAX_EXTENDED_ID)
            return "identifier does not fit 29 bits";
        if (def.dlc > CAN_MAX_DLEN)
            return "dlc " + std::to_string(def.dlc) + " exceeds " + std::to_string(CAN_MAX_DLEN);

        std::unordered_set<std::string_view> seen;
        const unsigned frame_bits = def.dlc * 8;

        for (const auto& sig : def.signals) {
            if (sig.name.empty())
                return "signal without a name";
            if (!seen.insert(sig.name).second)
                return "duplicate signal '" + sig.name + "'";
            if (sig.bit_length == 0)
                return "signal '" + sig.name + "' has zero length";
            if (sig.bit_length > MAX_SIGNAL_BITS)
                return "signal '" + sig.name + "' is wider than " + std::to_string(MAX_SIGNAL_BITS) + " bits";
            // 64-bit so a huge start_bit cannot wrap back inside the frame
            const uint64_t end_bit = uint64_t{ sig.start_bit } + sig.bit_length;
            if (end_bit > frame_bits)
                return "signal '" + sig.name + "' ends at bit " + std::to_string(end_bit)
                    + ", past the " + std::to_string(frame_bits) + " bits of the frame";
            if (sig.min && sig.max && *sig.min > *sig.max)
                return "signal '" + sig.name + "' has min above max";
        }
        return std::nullopt;
    }

}
