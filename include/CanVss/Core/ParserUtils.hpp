#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <boost/spirit/home/x3.hpp>

namespace x3 = boost::spirit::x3;

namespace CanVss {
    template <typename T>
    constexpr auto to(T& arg) {
        return [&](auto& ctx) { arg = x3::_attr(ctx); };
    }

    template <typename T, typename Parser>
    constexpr auto as(Parser&& p) {
        return x3::rule<struct _, T>{} = std::forward<Parser>(p);
    }

    constexpr auto skipper_ = x3::lexeme[
        x3::blank |
            "//" >> *(x3::char_ - x3::eol) |
            ("/*" >> *(x3::char_ - "*/")) >> "*/"
    ];

    constexpr auto od(char c) {
        return x3::omit[x3::char_(c)];
    }

    const auto name_ = as<std::string>(
        x3::lexeme[x3::char_("a-zA-Z_") >> *x3::char_("a-zA-Z_0-9")]
    );

    const auto quoted_name_ = as<std::string>(
        x3::lexeme['"' >> *(('\\' >> x3::char_("\\\"")) | ~x3::char_('"')) >> '"']
    );

    // base 16, "0x" prefix optional
    const auto identifier_ = -x3::no_case[x3::lit("0x")] >> x3::hex;

    // trailing receiver list of an SG_ line, possibly empty
    const auto receivers_ = x3::omit[-(name_ % ',')];

    using ParseResult = std::pair<std::string_view, bool>;

    inline auto make_rv(std::string_view::iterator b, std::string_view::iterator e, bool v) {
        return std::make_pair(std::string_view{ b, e }, v);
    }

    inline auto make_rv(std::string_view s, bool v) {
        return std::make_pair(s, v);
    }

    // Logs the offending line at error level and returns false.
    bool syntax_error(std::string_view where, std::string_view what = "");
}
