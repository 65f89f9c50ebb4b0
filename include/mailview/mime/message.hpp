/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailview/detail/ascii.hpp>
#include <mailview/detail/regex.hpp>
#include <mailview/mime/header_parser.hpp>
#include <mailview/storage/mbox_splitter.hpp>


namespace mailview::mime
{


/**
Sender and date written by the delivery agent on the "From " separator line.
**/
struct envelope
{
    std::string sender;
    std::string date;
};


/**
One message of a mailbox.

Headers and body are fixed at construction and only exposed through const accessors.
**/
class message
{
public:

    inline static const std::string FROM_HEADER{"From"};
    inline static const std::string SUBJECT_HEADER{"Subject"};
    inline static const std::string DATE_HEADER{"Date"};

    message() = default;

    message(header_map headers, std::vector<std::string> body, envelope env = {})
        : headers_(std::move(headers)), body_(std::move(body)), envelope_(std::move(env))
    {
    }

    /**
    Building a message from one mbox record.

    Anomalies in the record never fail the construction: unknown header lines are skipped, and a
    record without a blank line has headers only.

    @param record        Record yielded by the splitter.
    @param skipped_lines Receives the number of header lines which could not be parsed.
    @return              The message.
    **/
    [[nodiscard]] static message from_record(const storage::mbox_record& record, std::size_t* skipped_lines = nullptr)
    {
        auto content = record.content();
        auto block = header_parser::parse(content);
        if (skipped_lines != nullptr)
            *skipped_lines = block.skipped_lines;
        return message(std::move(block.headers), split_body(content.substr(block.body_offset)),
            parse_envelope(record.from_line()));
    }

    [[nodiscard]] const header_map& headers() const noexcept
    {
        return headers_;
    }

    [[nodiscard]] const std::vector<std::string>& body() const noexcept
    {
        return body_;
    }

    /**
    Value of the `From` header, empty if absent.
    **/
    [[nodiscard]] std::string_view sender() const
    {
        return headers_.value_or_empty(FROM_HEADER);
    }

    [[nodiscard]] std::string_view subject() const
    {
        return headers_.value_or_empty(SUBJECT_HEADER);
    }

    [[nodiscard]] std::string_view date() const
    {
        return headers_.value_or_empty(DATE_HEADER);
    }

    [[nodiscard]] const envelope& envelope_info() const noexcept
    {
        return envelope_;
    }

    /**
    Splitting body text into lines.

    Line terminators are removed, and trailing empty lines are dropped since they separate the record
    from the next one.

    @param text Body text.
    @return     Body lines.
    **/
    [[nodiscard]] static std::vector<std::string> split_body(std::string_view text)
    {
        std::vector<std::string> lines;
        std::size_t pos = 0;
        while (pos < text.size())
        {
            auto eol = text.find('\n', pos);
            auto raw = eol == std::string_view::npos ? text.substr(pos) : text.substr(pos, eol - pos);
            lines.emplace_back(detail::chomp_cr(raw));
            pos = eol == std::string_view::npos ? text.size() : eol + 1;
        }
        while (!lines.empty() && lines.back().empty())
            lines.pop_back();
        return lines;
    }

    /**
    Parsing the "From sender date" separator line.

    @param from_line Separator line without terminator.
    @return          Its sender and date, empty if the line has another shape.
    **/
    [[nodiscard]] static envelope parse_envelope(std::string_view from_line)
    {
        static const detail::regex FROM_LINE_REGEX{R"(From\s+(\S+)\s*(.*?)\s*)"};
        detail::smatch match;
        std::string line(from_line);
        if (!detail::regex_match(line, match, FROM_LINE_REGEX))
            return {};
        return envelope{match[1].str(), match[2].str()};
    }

private:

    header_map headers_;
    std::vector<std::string> body_;
    envelope envelope_;
};


} // namespace mailview::mime
