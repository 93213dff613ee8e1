#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/Errors.hpp"
#include "CanVss/Core/Logging.hpp"
#include "CanVss/Mapping/MappingTable.hpp"

namespace CanVss {

    enum class LoadMode {
        merge,      // per item, last write wins; items before an error stay applied
        replace     // all or nothing; the table is swapped only on success
    };

    struct LoadSummary {
        size_t messages = 0;
        size_t mappings = 0;
    };

    struct RuntimeSettings {
        size_t rx_buffer_size = 1000;
        LogLevel log_level = LogLevel::info;
        bool default_mappings = false;
    };

    // Identifier text is base 16 with an optional 0x prefix: "0x1A0" and "1A0" both name frame 0x1A0.
    std::optional<canid_t> parse_identifier(std::string_view text);

    // Reads the JSON payload:
    //   { "message_definitions": [ {id, name, dlc, description?, cycle_time?, signals: [...]} ],
    //     "mappings": [ {id, signals: [ {name, destination} ]} ] }
    // An id (or can_id) is identifier text or a JSON integer taken as is.
    // Every failure is reported as ConfigError.
    class ConfigLoader {
        MappingTable& _table;

    public:
        explicit ConfigLoader(MappingTable& table) : _table(table) {}

        LoadSummary load_string(std::string_view text, LoadMode mode = LoadMode::merge);
        LoadSummary load_file(const std::string& path, LoadMode mode = LoadMode::merge);
    };

    // The optional "settings" object of the same payload.
    RuntimeSettings load_settings(std::string_view text);

}
