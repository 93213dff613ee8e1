#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "CanVss/Core/Definitions.hpp"
#include "CanVss/DBC/DBCInterpreter.hpp"
#include "CanVss/Mapping/MappingTable.hpp"

namespace CanVss {

    // Turns the BO_/SG_ sections of a DBC file into message definitions.
    // Only little-endian signals up to 32 bits are taken; multiplexed signals,
    // big-endian signals and wider fields are skipped with a warning.
    // Destinations are not part of a DBC and still come from add_mapping or
    // the JSON payload.
    class DBCImporter : public DBCInterpreter<DBCImporter> {
        MappingTable& _table;
        std::map<canid_t, MessageDefinition> _pending;
        size_t _imported = 0;
        size_t _skipped = 0;

    public:
        explicit DBCImporter(MappingTable& table) : _table(table) {}

        void bo(uint32_t id, const std::string& name, size_t size, const std::string& sender);
        void sg(uint32_t msg_id, std::optional<unsigned> mux_val, bool is_mux_switch, const std::string& name,
                unsigned start_bit, unsigned size, char byte_order, char value_type,
                double factor, double offset, double min, double max, const std::string& unit);

        // false on a syntax error or a message the table rejects; every
        // message that did parse and validate is registered either way.
        bool import(std::string_view dbc_src);
        bool import_file(const std::string& path);

        size_t imported_messages() const { return _imported; }
        size_t skipped_signals() const { return _skipped; }
    };

    // Signal kind for a DBC field width and sign; empty above 32 bits.
    std::optional<SignalKind> kind_for(unsigned size, bool is_signed);

}
