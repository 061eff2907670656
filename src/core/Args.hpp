//
// Created by Malik T on 07/09/2025.
//

#ifndef FLIP7_ARGS_HPP
#define FLIP7_ARGS_HPP

#include <charconv>
#include <format>
#include <string_view>
#include <system_error>

#include "Exception.hpp"

namespace flip7::core
{
    // Parses a whole CLI value; throws ConfigError unless every character is consumed.
    template <typename T>
    auto ParseNumber(std::string_view flag, std::string_view s) -> T
    {
        T v{};
        auto const res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (s.empty() || res.ec != std::errc{} || res.ptr != s.data() + s.size())
            F7_THROW(error::Code::Config, std::format("Bad value '{}' for {}", s, flag));
        return v;
    }
}

#endif //FLIP7_ARGS_HPP
