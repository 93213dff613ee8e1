#include <cmath>
#include <limits>

#include "CanVss/Core/Signal/SignalCodec.hpp"
#include "CanVss/Core/Signal/NumericValue.hpp"

namespace CanVss {

    SignalCodec::SignalCodec(unsigned sb, unsigned bs) :
        _start_bit(sb), _bit_size(bs),
        _byte_pos(sb / 8), _bit_pos(sb % 8),
        _nbytes((sb % 8 + bs + 7) / 8)
    {}

    uint64_t SignalCodec::mask() const {
        return _bit_size >= 64 ? ~uint64_t{0} : (uint64_t{1} << _bit_size) - 1;
    }

    std::optional<DecodeError> SignalCodec::check(size_t available) const {
        if (_bit_size == 0)
            return DecodeError::zero_length;
        if (_bit_size > MAX_SIGNAL_BITS)
            return DecodeError::too_wide;
        if (static_cast<size_t>(_byte_pos) + _nbytes > available)
            return DecodeError::truncated;
        return std::nullopt;
    }

    std::variant<uint64_t, DecodeError> SignalCodec::operator()(std::span<const uint8_t> data) const {
        if (auto err = check(data.size()))
            return *err;

        uint64_t raw = 0;
        for (unsigned i = 0; i < _nbytes; ++i)
            raw |= uint64_t{data[_byte_pos + i]} << (8 * i);

        // whole bytes from bit 0 need neither
        if (_bit_pos != 0 || _bit_size != _nbytes * 8)
            raw = (raw >> _bit_pos) & mask();

        return raw;
    }

    std::optional<DecodeError> SignalCodec::operator()(uint64_t raw, std::span<uint8_t> buffer) const {
        if (auto err = check(buffer.size()))
            return err;

        uint64_t word = 0;
        for (unsigned i = 0; i < _nbytes; ++i)
            word |= uint64_t{buffer[_byte_pos + i]} << (8 * i);

        const uint64_t field_mask = mask() << _bit_pos;
        word = (word & ~field_mask) | ((raw << _bit_pos) & field_mask);

        for (unsigned i = 0; i < _nbytes; ++i)
            buffer[_byte_pos + i] = static_cast<uint8_t>(word >> (8 * i));

        return std::nullopt;
    }

    DecodeResult extract(std::span<const uint8_t> data, unsigned start_bit, unsigned bit_length,
                         SignalKind kind, double scale, double offset,
                         std::optional<double> min, std::optional<double> max) {
        auto decoded = SignalCodec(start_bit, bit_length)(data);
        if (auto* err = std::get_if<DecodeError>(&decoded))
            return *err;

        const uint64_t raw = std::get<uint64_t>(decoded);
        const NumericValue numeric(scale, offset, min, max);

        switch (kind) {
            case SignalKind::boolean:
                return SignalValue{ raw != 0 };
            case SignalKind::i8:
            case SignalKind::i16:
            case SignalKind::i32:
                return SignalValue{ numeric.convert(static_cast<double>(sign_extend(raw, bit_length))) };
            case SignalKind::u8:
            case SignalKind::u16:
            case SignalKind::u32:
            case SignalKind::f32:
                return SignalValue{ numeric.convert(static_cast<double>(raw)) };
        }
        return SignalValue{ numeric.convert(static_cast<double>(raw)) };
    }

    DecodeResult extract(std::span<const uint8_t> data, const SignalDefinition& sig) {
        return extract(data, sig.start_bit, sig.bit_length, sig.kind, sig.scale, sig.offset, sig.min, sig.max);
    }

    std::optional<DecodeError> encode(std::span<uint8_t> data, const SignalDefinition& sig, const SignalValue& value) {
        const SignalCodec codec(sig.start_bit, sig.bit_length);

        uint64_t raw = 0;
        if (sig.kind == SignalKind::boolean) {
            raw = as_double(value) != 0.0 ? 1 : 0;
        }
        else {
            if (std::abs(sig.scale) <= std::numeric_limits<double>::epsilon())
                return DecodeError::zero_scale;
            const NumericValue numeric(sig.scale, sig.offset, sig.min, sig.max);
            raw = static_cast<uint64_t>(numeric.to_raw(as_double(value), sig.bit_length, is_signed(sig.kind)));
        }
        return codec(raw & codec.mask(), data);
    }

}
