#include <string>
#include <string_view>

#include "CanVss/Core/Logging.hpp"
#include "CanVss/DBC/DBCImporter.hpp"
#include "CanVss/DBC/DBCInterpreter.hpp"

namespace CanVss {

    namespace {

        bool starts_with_keyword(std::string_view line, std::string_view keyword) {
            return line.starts_with(keyword) && line.size() > keyword.size() &&
                (line[keyword.size()] == ' ' || line[keyword.size()] == '\t');
        }

        std::string_view trim_left(std::string_view line) {
            auto first = line.find_first_not_of(" \t");
            return first == std::string_view::npos ? std::string_view{} : line.substr(first);
        }

    }

    bool syntax_error(std::string_view where, std::string_view what) {
        auto eol = where.find('\n');
        std::string_view line{
            where.begin(),
            eol != std::string_view::npos ? where.begin() + eol : where.end()
        };
        CANVSS_LOG(error) << "DBC syntax error: " << what << " => " << line;
        return false;
    }

    template<typename T>
    ParseResult DBCInterpreter<T>::parse_bo_(std::string_view rng, uint32_t& can_id) {
        std::string msg_name;
        unsigned msg_size = 0;
        std::string transmitter;

        const auto bo_ = x3::omit[x3::lexeme[x3::lit("BO_") >> +x3::blank]] >>
            x3::uint_[to(can_id)] >> name_[to(msg_name)] >> od(':') >>
            x3::uint_[to(msg_size)] >> -name_[to(transmitter)];

        auto iter = rng.begin();
        if (!phrase_parse(iter, rng.end(), bo_, skipper_) || iter != rng.end())
            return make_rv(iter, rng.end(), false);

        bo_vrtl(can_id, msg_name, msg_size, transmitter);
        return make_rv(iter, rng.end(), true);
    }

    template<typename T>
    ParseResult DBCInterpreter<T>::parse_sg_(std::string_view rng, uint32_t can_id) {
        std::optional<unsigned> sg_mux_switch_val;
        std::optional<char> sg_mux_switch;
        std::string sg_name;
        unsigned sg_start_bit = 0, sg_size = 0;
        char sg_byte_order = '1', sg_sign = '+';
        double sg_factor = 1.0, sg_offset = 0.0;
        double sg_min = 0.0, sg_max = 0.0;
        std::string sg_unit;

        const auto mux_ = -(x3::char_('m') >> x3::uint_[to(sg_mux_switch_val)]) >>
            -x3::char_('M')[to(sg_mux_switch)];

        const auto sg_ = x3::omit[x3::lexeme[x3::lit("SG_") >> +x3::blank]] >>
            name_[to(sg_name)] >> mux_ >>
            od(':') >> x3::uint_[to(sg_start_bit)] >> od('|') >>
            x3::uint_[to(sg_size)] >> od('@') >> as<char>(x3::char_('0') | x3::char_('1'))[to(sg_byte_order)] >>
            as<char>(x3::char_('+') | x3::char_('-'))[to(sg_sign)] >>
            od('(') >> x3::double_[to(sg_factor)] >> od(',') >> x3::double_[to(sg_offset)] >> od(')') >>
            od('[') >> x3::double_[to(sg_min)] >> od('|') >> x3::double_[to(sg_max)] >> od(']') >>
            quoted_name_[to(sg_unit)] >> receivers_;

        auto iter = rng.begin();
        if (!phrase_parse(iter, rng.end(), sg_, skipper_) || iter != rng.end())
            return make_rv(iter, rng.end(), false);

        sg_vrtl(can_id, sg_mux_switch_val, sg_mux_switch.value_or(' ') == 'M', sg_name, sg_start_bit, sg_size,
                sg_byte_order, sg_sign, sg_factor, sg_offset, sg_min, sg_max, sg_unit);
        return make_rv(iter, rng.end(), true);
    }

    template<typename T>
    bool DBCInterpreter<T>::parse_dbc(std::string_view dbc_src) {
        bool expected = true;
        bool in_message = false;
        uint32_t can_id = 0;

        while (!dbc_src.empty()) {
            auto eol = dbc_src.find('\n');
            auto line = dbc_src.substr(0, eol);
            dbc_src = eol == std::string_view::npos ? std::string_view{} : dbc_src.substr(eol + 1);

            if (line.ends_with('\r'))
                line.remove_suffix(1);
            line = trim_left(line);

            if (starts_with_keyword(line, "BO_")) {
                in_message = parse_bo_(line, can_id).second;
                if (!in_message)
                    expected = syntax_error(line, "(expected correct BO_)");
            }
            else if (starts_with_keyword(line, "SG_")) {
                if (!in_message)
                    expected = syntax_error(line, "(SG_ outside of a BO_ block)");
                else if (!parse_sg_(line, can_id).second)
                    expected = syntax_error(line, "(expected correct SG_)");
            }
            else {
                in_message = false;
            }
        }

        return expected;
    }

    template class DBCInterpreter<DBCImporter>;

}
