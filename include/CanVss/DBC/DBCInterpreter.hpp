#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "CanVss/DBC/DBCInterpreterConcepts.hpp"
#include "CanVss/Core/ParserUtils.hpp"

namespace CanVss {

    // Reads the BO_ and SG_ entries of a DBC source and hands them to Derived.
    // Every other section is passed over.
    template <typename Derived>
    class DBCInterpreter {
    protected:
        void bo_vrtl(uint32_t id, const std::string& name, size_t size, const std::string& sender) {
            if constexpr (HasBo<Derived>) {
                static_cast<Derived&>(*this).bo(id, name, size, sender);
            }
        }

        void sg_vrtl(uint32_t msg_id, std::optional<unsigned> mux_val, bool is_mux_switch, const std::string& name,
                    unsigned start_bit, unsigned size, char byte_order, char value_type,
                    double factor, double offset, double min, double max, const std::string& unit) {
            if constexpr (HasSg<Derived>) {
                static_cast<Derived&>(*this).sg(msg_id, mux_val, is_mux_switch, name, start_bit, size, byte_order,
                                                value_type, factor, offset, min, max, unit);
            }
        }

    public:
        ParseResult parse_bo_(std::string_view line, uint32_t& can_id);
        ParseResult parse_sg_(std::string_view line, uint32_t can_id);

        bool parse_dbc(std::string_view dbc_src);
    };

}
