#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/Definitions.hpp"
#include "CanVss/Core/Errors.hpp"

namespace CanVss {

    // signal name -> destination path, for one frame id
    using SignalRoutes = std::unordered_map<std::string, std::string>;

    // What the engine needs for one frame id. Both halves are immutable
    // snapshots; a later register/add_mapping swaps in new ones.
    struct MessageBinding {
        std::shared_ptr<const MessageDefinition> definition;
        std::shared_ptr<const SignalRoutes> routes;
    };

    class MappingTable {
        mutable std::shared_mutex _mtx;
        std::unordered_map<canid_t, std::shared_ptr<const MessageDefinition>> _messages;
        std::unordered_map<canid_t, std::shared_ptr<const SignalRoutes>> _routes;

    public:
        MappingTable() = default;
        virtual ~MappingTable() = default;

        MappingTable(const MappingTable&) = delete;
        MappingTable& operator=(const MappingTable&) = delete;

        // Throws ConfigError if the definition does not validate; the table
        // is left as it was.
        void register_message(MessageDefinition def);
        void add_mapping(canid_t id, const std::string& signal_name, const std::string& destination);

        bool remove_message(canid_t id);
        bool remove_mapping(canid_t id, const std::string& signal_name);
        void clear();

        // Takes over other's contents; other is left empty.
        void replace_with(MappingTable& other);

        // The engine's only read on the conversion path.
        virtual std::optional<MessageBinding> lookup(canid_t id) const;

        std::optional<MessageDefinition> message(canid_t id) const;
        std::optional<std::string> destination(canid_t id, std::string_view signal_name) const;

        std::vector<canid_t> message_ids() const;
        size_t message_count() const;
        size_t mapping_count() const;
    };

    // HeadlampControl (0x100), LampPowerStatus (0x101) and
    // AmbientLightSensor (0x102) with their VSS destinations.
    void install_default_mappings(MappingTable& table);

}
