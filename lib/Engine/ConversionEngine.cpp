#include <array>
#include <exception>

#include "CanVss/Core/CANHelpers.hpp"
#include "CanVss/Core/Logging.hpp"
#include "CanVss/Core/Signal/SignalCodec.hpp"
#include "CanVss/Engine/ConversionEngine.hpp"

namespace CanVss {

    SignalMap ConversionEngine::decode(const CANFrame& frame) const {
        SignalMap out;

        const canid_t id = frame_id(frame);
        auto binding = _table.lookup(id);
        if (!binding)
            return out;

        const auto& routes = *binding->routes;
        const auto data = payload(frame);

        for (const auto& sig : binding->definition->signals) {
            auto route = routes.find(sig.name);
            if (route == routes.end())
                continue;

            auto rv = extract(data, sig);
            if (is_error(rv)) {
                CANVSS_LOG(debug) << "0x" << std::hex << id << std::dec << " " << sig.name << ": "
                                  << to_string(std::get<DecodeError>(rv));
                continue;
            }
            out[route->second] = std::get<SignalValue>(rv);
        }
        return out;
    }

    SignalMap ConversionEngine::convert(const CANFrame& frame) {
        _received.fetch_add(1, std::memory_order_relaxed);

        try {
            auto out = decode(frame);
            if (!out.empty()) {
                _converted.fetch_add(1, std::memory_order_relaxed);
                _signals_emitted.fetch_add(out.size(), std::memory_order_relaxed);
            }
            return out;
        }
        catch (const std::exception& e) {
            _errors.fetch_add(1, std::memory_order_relaxed);
            CANVSS_LOG(error) << "Conversion of frame 0x" << std::hex << frame_id(frame) << std::dec
                              << " failed: " << e.what();
        }
        catch (...) {
            _errors.fetch_add(1, std::memory_order_relaxed);
            CANVSS_LOG(error) << "Conversion of frame 0x" << std::hex << frame_id(frame) << std::dec
                              << " failed with a non-standard exception";
        }
        return {};
    }

    std::optional<CANFrame> ConversionEngine::encode(canid_t id, const std::unordered_map<std::string, SignalValue>& values) const {
        auto def = _table.message(id);
        if (!def) {
            CANVSS_LOG(warning) << "No definition for 0x" << std::hex << id << std::dec << ", frame not built";
            return std::nullopt;
        }

        std::array<uint8_t, CAN_MAX_DLEN> data{};
        std::span<uint8_t> buffer{ data.data(), def->dlc };

        for (const auto& [name, value] : values) {
            auto sig = def->get_signal(name);
            if (!sig) {
                CANVSS_LOG(warning) << def->name << " has no signal " << name;
                continue;
            }
            if (auto err = CanVss::encode(buffer, **sig, value)) {
                CANVSS_LOG(warning) << def->name << "." << name << ": " << to_string(*err);
                return std::nullopt;
            }
        }

        return make_frame(id, std::span<const uint8_t>{ buffer.data(), buffer.size() });
    }

    // Each counter is loaded on its own, so under concurrent convert() calls
    // the snapshot is not one consistent state (converted may briefly lead received).
    ConversionStatistics ConversionEngine::statistics() const {
        return {
            _received.load(std::memory_order_relaxed),
            _converted.load(std::memory_order_relaxed),
            _signals_emitted.load(std::memory_order_relaxed),
            _errors.load(std::memory_order_relaxed)
        };
    }

    void ConversionEngine::reset_statistics() {
        _received.store(0, std::memory_order_relaxed);
        _converted.store(0, std::memory_order_relaxed);
        _signals_emitted.store(0, std::memory_order_relaxed);
        _errors.store(0, std::memory_order_relaxed);
    }

    std::string format_statistics(const ConversionStatistics& stats) {
        std::string out = "=== CAN to VSS Converter Statistics ===\n";
        out += "Messages received: " + std::to_string(stats.received) + "\n";
        out += "Messages converted: " + std::to_string(stats.converted) + "\n";
        out += "Signals sent: " + std::to_string(stats.signals_emitted) + "\n";
        out += "Errors: " + std::to_string(stats.errors) + "\n";
        return out;
    }

}
