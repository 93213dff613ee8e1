#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/Definitions.hpp"
#include "CanVss/Mapping/ConfigLoader.hpp"
#include "CanVss/Mapping/MappingTable.hpp"

namespace CanVss {

    struct ConversionStatistics {
        uint64_t received = 0;
        uint64_t converted = 0;
        uint64_t signals_emitted = 0;
        uint64_t errors = 0;
    };

    // Frame -> destination/value map through a MappingTable. Safe to call
    // from several threads at once.
    class ConversionEngine {
        MappingTable& _table;

        std::atomic<uint64_t> _received{ 0 };
        std::atomic<uint64_t> _converted{ 0 };
        std::atomic<uint64_t> _signals_emitted{ 0 };
        std::atomic<uint64_t> _errors{ 0 };

        SignalMap decode(const CANFrame& frame) const;

    public:
        explicit ConversionEngine(MappingTable& table) : _table(table) {}

        ConversionEngine(const ConversionEngine&) = delete;
        ConversionEngine& operator=(const ConversionEngine&) = delete;

        // Never throws. Unknown ids and frames with no routed signals give an
        // empty map; a signal that fails to decode is left out.
        SignalMap convert(const CANFrame& frame);

        void receive_frame(const CANFrame& frame) {
            convert(frame);
        }

        // Builds a dlc-sized frame from physical values keyed by signal name.
        // Signals not given stay zero.
        std::optional<CANFrame> encode(canid_t id, const std::unordered_map<std::string, SignalValue>& values) const;

        ConversionStatistics statistics() const;
        void reset_statistics();

        void register_message(MessageDefinition def) {
            _table.register_message(std::move(def));
        }

        void add_mapping(canid_t id, const std::string& signal_name, const std::string& destination) {
            _table.add_mapping(id, signal_name, destination);
        }

        LoadSummary load(std::string_view text, LoadMode mode = LoadMode::merge) {
            return ConfigLoader(_table).load_string(text, mode);
        }

        LoadSummary load_file(const std::string& path, LoadMode mode = LoadMode::merge) {
            return ConfigLoader(_table).load_file(path, mode);
        }

        MappingTable& table() { return _table; }
        const MappingTable& table() const { return _table; }
    };

    std::string format_statistics(const ConversionStatistics& stats);

}
