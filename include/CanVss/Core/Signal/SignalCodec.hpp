#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <variant>

#include "CanVss/Core/Definitions.hpp"
#include "CanVss/Core/Errors.hpp"

namespace CanVss {

    // Little-endian (Intel) bit field of a frame payload, LSB-0 numbering.
    class SignalCodec {
        unsigned _start_bit, _bit_size;
        unsigned _byte_pos, _bit_pos, _nbytes;

    public:
        SignalCodec(unsigned sb, unsigned bs);

        std::variant<uint64_t, DecodeError> operator()(std::span<const uint8_t> data) const;
        std::optional<DecodeError> operator()(uint64_t raw, std::span<uint8_t> buffer) const;

        unsigned start_bit() const { return _start_bit; }
        unsigned bit_size() const { return _bit_size; }

        // bytes touched, starting at start_bit / 8
        unsigned byte_span() const { return _nbytes; }

        uint64_t mask() const;

    private:
        std::optional<DecodeError> check(size_t available) const;
    };

    using DecodeResult = std::variant<SignalValue, DecodeError>;

    inline bool is_error(const DecodeResult& rv) {
        return std::holds_alternative<DecodeError>(rv);
    }

    // decode -> sign-extend -> scale/offset -> clamp
    DecodeResult extract(std::span<const uint8_t> data, unsigned start_bit, unsigned bit_length,
                         SignalKind kind, double scale = 1.0, double offset = 0.0,
                         std::optional<double> min = std::nullopt, std::optional<double> max = std::nullopt);

    DecodeResult extract(std::span<const uint8_t> data, const SignalDefinition& sig);

    // Writes the physical value into its bits of data, leaving the other bits alone.
    std::optional<DecodeError> encode(std::span<uint8_t> data, const SignalDefinition& sig, const SignalValue& value);

}
