#include "CanVss/Core/CANHelpers.hpp"
#include "CanVss/Core/Logging.hpp"
#include "CanVss/DBC/DBCImporter.hpp"

namespace CanVss {

    // DBC pseudo-message that collects unassigned signals
    constexpr uint32_t INDEPENDENT_SIG_MSG = 0xC0000000;

    std::optional<SignalKind> kind_for(unsigned size, bool is_signed) {
        if (size == 0 || size > MAX_SIGNAL_BITS)
            return std::nullopt;
        if (size == 1 && !is_signed)
            return SignalKind::boolean;
        if (size <= 8)
            return is_signed ? SignalKind::i8 : SignalKind::u8;
        if (size <= 16)
            return is_signed ? SignalKind::i16 : SignalKind::u16;
        return is_signed ? SignalKind::i32 : SignalKind::u32;
    }

    void DBCImporter::bo(uint32_t id, const std::string& name, size_t size, const std::string&) {
        if (id == INDEPENDENT_SIG_MSG)
            return;

        MessageDefinition def;
        def.id = id & CAN_EFF_MASK;
        def.name = name;
        def.dlc = static_cast<unsigned>(size);
        _pending[def.id] = std::move(def);
    }

    void DBCImporter::sg(uint32_t msg_id, std::optional<unsigned> mux_val, bool, const std::string& name,
                         unsigned start_bit, unsigned size, char byte_order, char value_type,
                         double factor, double offset, double min, double max, const std::string& unit) {
        auto it = _pending.find(msg_id & CAN_EFF_MASK);
        if (msg_id == INDEPENDENT_SIG_MSG || it == _pending.end())
            return;

        auto skip = [&](const char* why) {
            ++_skipped;
            CANVSS_LOG(warning) << "DBC signal " << it->second.name << "." << name << " skipped: " << why;
        };

        if (mux_val) {
            skip("multiplexed");
            return;
        }
        if (byte_order == '0') {
            skip("big-endian");
            return;
        }
        auto kind = kind_for(size, value_type == '-');
        if (!kind) {
            skip("wider than 32 bits");
            return;
        }

        SignalDefinition sig;
        sig.name = name;
        sig.start_bit = start_bit;
        sig.bit_length = size;
        sig.kind = *kind;
        sig.scale = factor;
        sig.offset = offset;
        // [0|0] means the range is unspecified
        if (min != 0.0 || max != 0.0) {
            sig.min = min;
            sig.max = max;
        }
        sig.unit = unit;
        it->second.add_signal(std::move(sig));
    }

    bool DBCImporter::import(std::string_view dbc_src) {
        _pending.clear();
        _imported = 0;
        _skipped = 0;

        bool expected = parse_dbc(dbc_src);

        for (auto& [id, def] : _pending) {
            try {
                _table.register_message(std::move(def));
                ++_imported;
            }
            catch (const ConfigError& e) {
                CANVSS_LOG(error) << "DBC " << e.what();
                expected = false;
            }
        }
        _pending.clear();

        CANVSS_LOG(info) << "DBC import: " << _imported << " messages, " << _skipped << " signals skipped";
        return expected;
    }

    bool DBCImporter::import_file(const std::string& path) {
        auto src = read_file(path);
        if (!src) {
            CANVSS_LOG(error) << "Cannot read DBC file " << path;
            return false;
        }
        return import(*src);
    }

}
