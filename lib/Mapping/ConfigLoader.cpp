#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>

#include "CanVss/Core/CANHelpers.hpp"
#include "CanVss/Core/ParserUtils.hpp"
#include "CanVss/Mapping/ConfigLoader.hpp"

using json = nlohmann::json;

namespace CanVss {

    std::optional<canid_t> parse_identifier(std::string_view text) {
        std::string trimmed(text);
        boost::algorithm::trim(trimmed);

        unsigned value = 0;
        auto iter = trimmed.cbegin();
        if (!x3::parse(iter, trimmed.cend(), identifier_, value) || iter != trimmed.cend())
            return std::nullopt;
        if (value > MAX_EXTENDED_ID)
            return std::nullopt;
        return static_cast<canid_t>(value);
    }

    namespace {

        json parse_json(std::string_view text) {
            try {
                return json::parse(text.begin(), text.end());
            }
            catch (const json::parse_error& e) {
                throw ConfigError("malformed configuration at byte " + std::to_string(e.byte) + ": " + e.what());
            }
        }

        const json* find(const json& node, const std::string& key) {
            auto it = node.find(key);
            return it == node.end() ? nullptr : &*it;
        }

        template <typename T>
        T value_of(const json& value, const std::string& key, const std::string& where) {
            auto bad = [&](const char* expected) {
                return ConfigError(where + ": '" + key + "' must be " + expected + ", got " + value.dump());
            };

            if constexpr (std::is_same_v<T, bool>) {
                if (!value.is_boolean())
                    throw bad("a boolean");
                return value.get<bool>();
            }
            else if constexpr (std::is_integral_v<T>) {
                // negative numbers are stored signed and never reach the unsigned fields
                if (!value.is_number_unsigned())
                    throw bad("a non-negative integer");
                auto raw = value.get<uint64_t>();
                if (raw > std::numeric_limits<T>::max())
                    throw bad("in range");
                return static_cast<T>(raw);
            }
            else if constexpr (std::is_floating_point_v<T>) {
                if (!value.is_number())
                    throw bad("a number");
                return value.get<T>();
            }
            else {
                if (!value.is_string())
                    throw bad("a string");
                return value.get<std::string>();
            }
        }

        template <typename T>
        T required(const json& node, const std::string& key, const std::string& where) {
            auto child = find(node, key);
            if (!child)
                throw ConfigError(where + ": missing '" + key + "'");
            return value_of<T>(*child, key, where);
        }

        template <typename T>
        std::optional<T> optional_value(const json& node, const std::string& key, const std::string& where) {
            auto child = find(node, key);
            if (!child)
                return std::nullopt;
            return value_of<T>(*child, key, where);
        }

        // first key present wins
        std::pair<const json*, std::string> either(const json& node, const std::string& key, const std::string& alias,
                                                   const std::string& where) {
            if (auto child = find(node, key))
                return { child, key };
            if (auto child = find(node, alias))
                return { child, alias };
            throw ConfigError(where + ": missing '" + key + "'");
        }

        std::string required_either(const json& node, const std::string& key, const std::string& alias,
                                    const std::string& where) {
            auto [child, found] = either(node, key, alias, where);
            return value_of<std::string>(*child, found, where);
        }

        // text is always base 16, a JSON integer is taken as is
        canid_t required_id(const json& node, const std::string& where) {
            auto [child, found] = either(node, "id", "can_id", where);

            std::optional<canid_t> id;
            if (child->is_string())
                id = parse_identifier(child->get<std::string>());
            else if (child->is_number_unsigned() && child->get<uint64_t>() <= MAX_EXTENDED_ID)
                id = static_cast<canid_t>(child->get<uint64_t>());

            if (!id)
                throw ConfigError(where + ": bad identifier " + child->dump() + " for '" + found + "'");
            return *id;
        }

        const json* array_child(const json& node, const std::string& key, const std::string& where, bool must_exist) {
            auto child = find(node, key);
            if (!child) {
                if (must_exist)
                    throw ConfigError(where + ": missing '" + key + "'");
                return nullptr;
            }
            if (!child->is_array())
                throw ConfigError(where + ": '" + key + "' must be an array");
            return child;
        }

        SignalDefinition read_signal(const json& node, const std::string& where) {
            SignalDefinition sig;
            sig.name = required<std::string>(node, "name", where);

            const std::string sig_where = where + " signal '" + sig.name + "'";
            sig.start_bit = required<unsigned>(node, "start_bit", sig_where);
            sig.bit_length = required<unsigned>(node, "bit_length", sig_where);

            auto kind_text = required_either(node, "kind", "type", sig_where);
            auto kind = parse_signal_kind(kind_text);
            if (!kind)
                throw ConfigError(sig_where + ": unknown kind '" + kind_text + "'");
            sig.kind = *kind;

            sig.scale = optional_value<double>(node, "scale", sig_where).value_or(1.0);
            sig.offset = optional_value<double>(node, "offset", sig_where).value_or(0.0);
            sig.min = optional_value<double>(node, "min", sig_where);
            sig.max = optional_value<double>(node, "max", sig_where);
            sig.unit = optional_value<std::string>(node, "unit", sig_where).value_or("");
            sig.description = optional_value<std::string>(node, "description", sig_where).value_or("");
            return sig;
        }

        MessageDefinition read_message(const json& node, size_t index) {
            const std::string where = "message_definitions[" + std::to_string(index) + "]";

            MessageDefinition def;
            def.id = required_id(node, where);
            def.name = required<std::string>(node, "name", where);
            def.dlc = required<unsigned>(node, "dlc", where);
            def.description = optional_value<std::string>(node, "description", where).value_or("");
            def.cycle_time = optional_value<unsigned>(node, "cycle_time", where).value_or(0);

            for (const auto& sig_node : *array_child(node, "signals", where, true))
                def.add_signal(read_signal(sig_node, where));
            return def;
        }

        LoadSummary apply(const json& root, MappingTable& table) {
            LoadSummary summary;

            if (auto defs = array_child(root, "message_definitions", "configuration", false)) {
                size_t index = 0;
                for (const auto& node : *defs) {
                    table.register_message(read_message(node, index++));
                    ++summary.messages;
                }
            }

            if (auto groups = array_child(root, "mappings", "configuration", false)) {
                size_t index = 0;
                for (const auto& node : *groups) {
                    const std::string where = "mappings[" + std::to_string(index++) + "]";
                    const canid_t id = required_id(node, where);

                    for (const auto& sig_node : *array_child(node, "signals", where, true)) {
                        auto name = required<std::string>(sig_node, "name", where);
                        auto dest = required_either(sig_node, "destination", "vss_path", where + " signal '" + name + "'");
                        table.add_mapping(id, name, dest);
                        ++summary.mappings;
                    }
                }
            }

            return summary;
        }

        json parse_root(std::string_view text) {
            json root = parse_json(text);
            if (!root.is_object())
                throw ConfigError("configuration: top level must be an object");
            return root;
        }

    }

    LoadSummary ConfigLoader::load_string(std::string_view text, LoadMode mode) {
        const json root = parse_root(text);

        LoadSummary summary;
        if (mode == LoadMode::replace) {
            MappingTable fresh;
            summary = apply(root, fresh);
            _table.replace_with(fresh);
        }
        else {
            summary = apply(root, _table);
        }

        CANVSS_LOG(info) << "loaded " << summary.messages << " message definitions and "
                         << summary.mappings << " mappings";
        return summary;
    }

    LoadSummary ConfigLoader::load_file(const std::string& path, LoadMode mode) {
        auto content = read_file(path);
        if (!content)
            throw ConfigError("cannot read configuration file " + path);
        return load_string(*content, mode);
    }

    RuntimeSettings load_settings(std::string_view text) {
        const json root = parse_root(text);

        RuntimeSettings settings;
        auto node = find(root, "settings");
        if (!node)
            return settings;

        if (auto size = optional_value<size_t>(*node, "rx_buffer_size", "settings")) {
            if (*size == 0)
                throw ConfigError("settings: rx_buffer_size must be positive");
            settings.rx_buffer_size = *size;
        }

        if (auto level_text = optional_value<std::string>(*node, "log_level", "settings")) {
            auto level = parse_log_level(*level_text);
            if (!level)
                throw ConfigError("settings: unknown log_level '" + *level_text + "'");
            settings.log_level = *level;
        }

        settings.default_mappings = optional_value<bool>(*node, "default_mappings", "settings").value_or(false);
        return settings;
    }

}
