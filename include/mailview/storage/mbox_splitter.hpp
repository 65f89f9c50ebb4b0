/*

mbox_splitter.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Splits the raw text of an mbox file into message records without copying.

*/

#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>

namespace mailview::storage
{

/**
One message of an mbox file, from its "From " separator line up to the next separator.

The span views into the buffer given to the splitter and must not outlive it.
**/
struct mbox_record
{
    /// Byte offset of the record inside the mailbox text.
    std::size_t offset = 0;

    /// Record text, including the separator line and any trailing blank lines.
    std::string_view text;

    /**
    The separator line without its line terminator.
    **/
    [[nodiscard]] std::string_view from_line() const noexcept
    {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        return line;
    }

    /**
    Everything after the separator line: headers, blank line and body.
    **/
    [[nodiscard]] std::string_view content() const noexcept
    {
        auto eol = text.find('\n');
        if (eol == std::string_view::npos)
            return {};
        return text.substr(eol + 1);
    }
};

/**
Lazy, restartable range of records over an mbox buffer.

Every line starting with "From " is a separator, so a body line beginning with "From " which was not
quoted by the writer starts a new record. Lines quoted as ">From " are left untouched.
**/
class mbox_splitter
{
public:
    inline static constexpr std::string_view SEPARATOR{"From "};

    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = mbox_record;
        using difference_type = std::ptrdiff_t;
        using pointer = const mbox_record*;
        using reference = const mbox_record&;

        iterator() = default;

        iterator(std::string_view text, std::size_t start) : text_(text)
        {
            load(start);
        }

        reference operator*() const noexcept { return record_; }

        pointer operator->() const noexcept { return &record_; }

        iterator& operator++()
        {
            load(record_.offset + record_.text.size());
            return *this;
        }

        iterator operator++(int)
        {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept
        {
            return a.at_end_ == b.at_end_ && (a.at_end_ || a.record_.offset == b.record_.offset);
        }

    private:
        void load(std::size_t start)
        {
            if (start >= text_.size())
            {
                at_end_ = true;
                record_ = {};
                return;
            }
            auto next = find_separator(text_, start + 1);
            auto end = next == std::string_view::npos ? text_.size() : next;
            record_ = mbox_record{start, text_.substr(start, end - start)};
            at_end_ = false;
        }

        std::string_view text_;
        mbox_record record_;
        bool at_end_ = true;
    };

    explicit mbox_splitter(std::string_view text) noexcept : text_(text)
    {
    }

    /**
    Starts a new scan from the first separator.
    **/
    [[nodiscard]] iterator begin() const
    {
        auto first = find_separator(text_, 0);
        if (first == std::string_view::npos)
            return end();
        return iterator(text_, first);
    }

    [[nodiscard]] iterator end() const
    {
        return iterator();
    }

    /**
    Text before the first separator. It is not a message and is discarded by the mailbox.
    **/
    [[nodiscard]] std::string_view preamble() const noexcept
    {
        auto first = find_separator(text_, 0);
        if (first == std::string_view::npos)
            return text_;
        return text_.substr(0, first);
    }

    /**
    Finds the first separator starting a line at or after `from`.

    @param text Mailbox text.
    @param from Offset where the search starts.
    @return     Offset of the separator, or npos.
    **/
    [[nodiscard]] static std::size_t find_separator(std::string_view text, std::size_t from) noexcept
    {
        if (from == 0 && text.starts_with(SEPARATOR))
            return 0;
        if (from > 0)
            --from;
        while (true)
        {
            auto nl = text.find('\n', from);
            if (nl == std::string_view::npos)
                return std::string_view::npos;
            if (text.substr(nl + 1).starts_with(SEPARATOR))
                return nl + 1;
            from = nl + 1;
        }
    }

private:
    std::string_view text_;
};

} // namespace mailview::storage
