/*

header_parser.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailview/detail/ascii.hpp>


namespace mailview::mime
{


/**
Header fields of one message, keyed by lower-cased name.

Lookups are case insensitive. Setting an existing name replaces its value.
**/
class header_map
{
public:

    using container_t = std::map<std::string, std::string, std::less<>>;
    using const_iterator = container_t::const_iterator;

    void set(std::string_view name, std::string value)
    {
        fields_.insert_or_assign(detail::to_lower_ascii(name), std::move(value));
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const
    {
        auto it = fields_.find(detail::to_lower_ascii(name));
        if (it == fields_.end())
            return std::nullopt;
        return it->second;
    }

    /**
    Value of the given header, or an empty string if absent.
    **/
    [[nodiscard]] std::string_view value_or_empty(std::string_view name) const
    {
        auto it = fields_.find(detail::to_lower_ascii(name));
        if (it == fields_.end())
            return {};
        return it->second;
    }

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return fields_.find(detail::to_lower_ascii(name)) != fields_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }

    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

private:

    container_t fields_;
};


/**
Outcome of parsing one header block.
**/
struct header_block
{
    header_map headers;

    /// Physical lines dropped because they were neither a field nor a continuation.
    std::size_t skipped_lines = 0;

    /// Offset just past the blank line ending the block, or the input size if there is none.
    std::size_t body_offset = 0;

    /// False if the input ended before a blank line was seen.
    bool terminated = false;
};


/**
Parser of an RFC 2822 header block with line folding.

It never fails: lines which cannot be understood are skipped and counted.
**/
class header_parser
{
public:

    /**
    Parsing the headers at the start of the given text.

    The text is read line by line until the first empty line, which is consumed.

    @param text Message text starting with its first header line.
    @return     Parsed headers and the position of the body.
    **/
    [[nodiscard]] static header_block parse(std::string_view text)
    {
        header_block block;
        std::string name;
        std::string value;
        // Cleared by a skipped line, so that its own continuations are dropped as well.
        bool have_field = false;

        auto commit = [&]() {
            if (have_field)
                block.headers.set(name, std::move(value));
            have_field = false;
            name.clear();
            value.clear();
        };

        std::size_t pos = 0;
        while (pos < text.size())
        {
            auto eol = text.find('\n', pos);
            auto raw = eol == std::string_view::npos ? text.substr(pos) : text.substr(pos, eol - pos);
            pos = eol == std::string_view::npos ? text.size() : eol + 1;
            auto line = detail::chomp_cr(raw);

            if (line.empty())
            {
                block.terminated = true;
                break;
            }

            if (detail::is_wsp(line.front()))
            {
                if (have_field)
                    append_folded(value, line);
                else
                    ++block.skipped_lines;
                continue;
            }

            std::string_view field_name, field_value;
            if (!split_field(line, field_name, field_value))
            {
                commit();
                ++block.skipped_lines;
                continue;
            }

            commit();
            name.assign(field_name);
            value.assign(field_value);
            have_field = true;
        }
        commit();

        block.body_offset = pos;
        return block;
    }

    /**
    Splitting a field line into its name and trimmed value.

    @param line  Physical line without terminator.
    @param name  Field name on success.
    @param value Trimmed field value on success.
    @return      False if the line has no colon or an invalid name.
    **/
    static bool split_field(std::string_view line, std::string_view& name, std::string_view& value) noexcept
    {
        auto colon = line.find(HEADER_SEPARATOR_CHAR);
        if (colon == std::string_view::npos)
            return false;
        auto candidate = line.substr(0, colon);
        if (!detail::is_valid_header_name(candidate))
            return false;
        name = candidate;
        value = detail::trim_view(line.substr(colon + 1));
        return true;
    }

private:

    inline static constexpr char HEADER_SEPARATOR_CHAR = ':';

    static void append_folded(std::string& value, std::string_view line)
    {
        auto part = detail::trim_view(line);
        if (part.empty())
            return;
        if (!value.empty())
            value.push_back(' ');
        value.append(part);
    }
};


} // namespace mailview::mime
