/*

navigation.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Cursor over the messages of a loaded mailbox.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <mailview/mime/message.hpp>
#include <mailview/storage/mailbox.hpp>

namespace mailview::view
{

/// Navigation command kinds
enum class command_kind : std::uint8_t
{
    next,
    previous,
    first,
    last,
    jump_to,     ///< Uses the command argument as a 0-based index
    line_down,
    line_up,
    page_down,   ///< Uses the command argument as the page height
    page_up      ///< Uses the command argument as the page height
};

struct command
{
    command_kind kind;
    std::int64_t argument = 0;
};

/**
Message and line position inside one mailbox.

All moves saturate at the bounds; none of them wraps around or fails. On an empty mailbox every move is
a no-op and `current()` returns nullptr.

The mailbox must outlive the navigation state.
**/
class navigation_state
{
public:
    explicit navigation_state(const storage::mailbox& box) noexcept
        : box_(&box)
    {
    }

    [[nodiscard]] const storage::mailbox& mailbox() const noexcept
    {
        return *box_;
    }

    /**
    Message on display, or nullptr if the mailbox has no message.
    **/
    [[nodiscard]] const mime::message* current() const noexcept
    {
        if (box_->empty())
            return nullptr;
        return &(*box_)[index_];
    }

    [[nodiscard]] std::optional<std::size_t> current_index() const noexcept
    {
        if (box_->empty())
            return std::nullopt;
        return index_;
    }

    /// First body line on display.
    [[nodiscard]] std::size_t top_line() const noexcept
    {
        return top_line_;
    }

    void next() noexcept
    {
        if (box_->empty())
            return;
        select(std::min(index_ + 1, box_->size() - 1));
    }

    void previous() noexcept
    {
        if (box_->empty() || index_ == 0)
            return;
        select(index_ - 1);
    }

    void first() noexcept
    {
        if (box_->empty())
            return;
        select(0);
    }

    void last() noexcept
    {
        if (box_->empty())
            return;
        select(box_->size() - 1);
    }

    /**
    Selects the message at `n`, clamped into the valid index range.
    **/
    void jump_to(std::int64_t n) noexcept
    {
        if (box_->empty())
            return;
        const auto max_index = static_cast<std::int64_t>(box_->size() - 1);
        select(static_cast<std::size_t>(std::clamp<std::int64_t>(n, 0, max_index)));
    }

    void line_down(std::size_t count = 1) noexcept
    {
        top_line_ = std::min(top_line_ + count, max_top_line());
    }

    void line_up(std::size_t count = 1) noexcept
    {
        top_line_ = count > top_line_ ? 0 : top_line_ - count;
    }

    void apply(const command& cmd) noexcept
    {
        const std::size_t amount = cmd.argument > 1 ? static_cast<std::size_t>(cmd.argument) : 1;
        switch (cmd.kind)
        {
            case command_kind::next: next(); break;
            case command_kind::previous: previous(); break;
            case command_kind::first: first(); break;
            case command_kind::last: last(); break;
            case command_kind::jump_to: jump_to(cmd.argument); break;
            case command_kind::line_down: line_down(); break;
            case command_kind::line_up: line_up(); break;
            case command_kind::page_down: line_down(amount); break;
            case command_kind::page_up: line_up(amount); break;
        }
    }

private:
    void select(std::size_t index) noexcept
    {
        if (index != index_)
            top_line_ = 0;
        index_ = index;
    }

    std::size_t max_top_line() const noexcept
    {
        const auto* msg = current();
        if (msg == nullptr || msg->body().empty())
            return 0;
        return msg->body().size() - 1;
    }

    const storage::mailbox* box_;
    std::size_t index_ = 0;
    std::size_t top_line_ = 0;
};

} // namespace mailview::view
