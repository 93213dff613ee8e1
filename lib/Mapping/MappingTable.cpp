#include <algorithm>
#include <mutex>

#include "CanVss/Core/Logging.hpp"
#include "CanVss/Mapping/MappingTable.hpp"

namespace CanVss {

    void MappingTable::register_message(MessageDefinition def) {
        if (auto reason = validate(def))
            throw ConfigError("message " + std::to_string(def.id) + " (" + def.name + "): " + *reason);

        const canid_t id = def.id;
        auto ptr = std::make_shared<const MessageDefinition>(std::move(def));

        std::unique_lock lock(_mtx);
        _messages[id] = std::move(ptr);
    }

    void MappingTable::add_mapping(canid_t id, const std::string& signal_name, const std::string& destination) {
        std::unique_lock lock(_mtx);

        auto& slot = _routes[id];
        auto routes = slot ? std::make_shared<SignalRoutes>(*slot) : std::make_shared<SignalRoutes>();
        (*routes)[signal_name] = destination;
        slot = std::move(routes);
    }

    bool MappingTable::remove_message(canid_t id) {
        std::unique_lock lock(_mtx);
        return _messages.erase(id) > 0;
    }

    bool MappingTable::remove_mapping(canid_t id, const std::string& signal_name) {
        std::unique_lock lock(_mtx);

        auto it = _routes.find(id);
        if (it == _routes.end() || !it->second->contains(signal_name))
            return false;

        auto routes = std::make_shared<SignalRoutes>(*it->second);
        routes->erase(signal_name);
        if (routes->empty())
            _routes.erase(it);
        else
            it->second = std::move(routes);
        return true;
    }

    void MappingTable::clear() {
        std::unique_lock lock(_mtx);
        _messages.clear();
        _routes.clear();
    }

    void MappingTable::replace_with(MappingTable& other) {
        if (&other == this)
            return;

        std::scoped_lock lock(_mtx, other._mtx);
        _messages = std::move(other._messages);
        _routes = std::move(other._routes);
        other._messages.clear();
        other._routes.clear();
    }

    std::optional<MessageBinding> MappingTable::lookup(canid_t id) const {
        std::shared_lock lock(_mtx);

        auto mi = _messages.find(id);
        if (mi == _messages.end())
            return std::nullopt;

        auto ri = _routes.find(id);
        if (ri == _routes.end() || ri->second->empty())
            return std::nullopt;

        return MessageBinding{ mi->second, ri->second };
    }

    std::optional<MessageDefinition> MappingTable::message(canid_t id) const {
        std::shared_lock lock(_mtx);

        auto mi = _messages.find(id);
        if (mi == _messages.end())
            return std::nullopt;
        return *mi->second;
    }

    std::optional<std::string> MappingTable::destination(canid_t id, std::string_view signal_name) const {
        std::shared_lock lock(_mtx);

        auto ri = _routes.find(id);
        if (ri == _routes.end())
            return std::nullopt;

        auto si = ri->second->find(std::string(signal_name));
        if (si == ri->second->end())
            return std::nullopt;
        return si->second;
    }

    std::vector<canid_t> MappingTable::message_ids() const {
        std::shared_lock lock(_mtx);

        std::vector<canid_t> ids;
        ids.reserve(_messages.size());
        for (const auto& [id, _] : _messages)
            ids.push_back(id);

        std::sort(ids.begin(), ids.end());
        return ids;
    }

    size_t MappingTable::message_count() const {
        std::shared_lock lock(_mtx);
        return _messages.size();
    }

    size_t MappingTable::mapping_count() const {
        std::shared_lock lock(_mtx);

        size_t total = 0;
        for (const auto& [_, routes] : _routes)
            total += routes->size();
        return total;
    }

    static MessageDefinition single_signal_message(canid_t id, std::string name, std::string description,
                                                   SignalDefinition sig) {
        MessageDefinition def;
        def.id = id;
        def.name = std::move(name);
        def.dlc = 8;
        def.description = std::move(description);
        def.add_signal(std::move(sig));
        return def;
    }

    void install_default_mappings(MappingTable& table) {
        SignalDefinition headlamp;
        headlamp.name = "HeadlampStatus";
        headlamp.start_bit = 0;
        headlamp.bit_length = 8;
        headlamp.kind = SignalKind::u8;

        SignalDefinition power;
        power.name = "LampPower";
        power.start_bit = 0;
        power.bit_length = 16;
        power.kind = SignalKind::u16;
        power.unit = "W";

        SignalDefinition ambient;
        ambient.name = "AmbientLight";
        ambient.start_bit = 0;
        ambient.bit_length = 16;
        ambient.kind = SignalKind::u16;
        ambient.unit = "lux";

        table.register_message(single_signal_message(0x100, "HeadlampControl", "Headlamp control message", std::move(headlamp)));
        table.add_mapping(0x100, "HeadlampStatus", "Vehicle.Body.Lights.IsHighBeamOn");

        table.register_message(single_signal_message(0x101, "LampPowerStatus", "Lamp power status", std::move(power)));
        table.add_mapping(0x101, "LampPower", "Vehicle.Body.Lighting.Power");

        table.register_message(single_signal_message(0x102, "AmbientLightSensor", "", std::move(ambient)));
        table.add_mapping(0x102, "AmbientLight", "Vehicle.Body.Lights.AmbientLight");

        CANVSS_LOG(debug) << "installed " << table.message_count() << " default message definitions";
    }

}
