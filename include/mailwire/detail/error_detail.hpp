/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder for the structured `error_info::detail` string.
Each entry is formatted as key=value\n to ease parsing and redaction.

*/

#pragma once

#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <mailwire/detail/redact.hpp>

namespace mailwire::detail
{

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    error_detail& add_int(std::string_view key, std::int64_t value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        if (ec)
            std::format_to(std::back_inserter(out_), "{}={} {}\n", key, ec.value(), ec.message());
        return *this;
    }

    /// Numbered keys: prefix0=..., prefix1=...
    error_detail& add_lines(std::string_view key_prefix, const std::vector<std::string>& lines, bool redact = false)
    {
        for (std::size_t i = 0; i < lines.size(); ++i)
            std::format_to(std::back_inserter(out_), "{}{}={}\n", key_prefix, i, redact_if_needed(lines[i], redact));
        return *this;
    }

    [[nodiscard]] const std::string& str() const noexcept
    {
        return out_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

private:
    std::string out_;
};

} // namespace mailwire::detail
