/*

keys.hpp
--------

Decoding of raw terminal input into keys, and the key bindings of the viewer.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailview/detail/ascii.hpp>
#include <mailview/view/navigation.hpp>

namespace mailview::term
{

enum class key_code : std::uint8_t
{
    character,
    enter,
    escape,
    backspace,
    up,
    down,
    left,
    right,
    home,
    end,
    page_up,
    page_down,
    interrupt,   ///< Ctrl-C, read as a key since raw mode turns signals off
    unknown
};

struct key_event
{
    key_code code = key_code::unknown;
    char ch = 0;   ///< Set for key_code::character

    friend bool operator==(const key_event&, const key_event&) = default;
};

inline constexpr char ESC_CHAR = '\x1B';
inline constexpr char CTRL_C_CHAR = '\x03';

[[nodiscard]] constexpr key_code csi_final_to_key(char final_byte) noexcept
{
    switch (final_byte)
    {
        case 'A': return key_code::up;
        case 'B': return key_code::down;
        case 'C': return key_code::right;
        case 'D': return key_code::left;
        case 'H': return key_code::home;
        case 'F': return key_code::end;
        default: return key_code::unknown;
    }
}

[[nodiscard]] inline key_code csi_tilde_to_key(std::string_view params) noexcept
{
    auto number = params.substr(0, params.find(';'));
    if (number == "1" || number == "7") return key_code::home;
    if (number == "4" || number == "8") return key_code::end;
    if (number == "5") return key_code::page_up;
    if (number == "6") return key_code::page_down;
    return key_code::unknown;
}

/**
Decodes one batch of bytes read from the terminal.

A lone ESC, or one followed by anything but `[` or `O`, is the Escape key. Escape sequences cut off by
the end of the batch decode as key_code::unknown.
**/
[[nodiscard]] inline std::vector<key_event> decode_keys(std::string_view bytes)
{
    std::vector<key_event> keys;
    std::size_t k = 0;
    while (k < bytes.size())
    {
        const char c = bytes[k++];
        if (c == ESC_CHAR)
        {
            if (k >= bytes.size() || (bytes[k] != '[' && bytes[k] != 'O'))
            {
                keys.push_back({key_code::escape});
                continue;
            }
            const char intro = bytes[k++];
            std::size_t params_start = k;
            while (k < bytes.size() && ((bytes[k] >= '0' && bytes[k] <= '9') || bytes[k] == ';'))
                ++k;
            if (k >= bytes.size())
            {
                keys.push_back({key_code::unknown});
                break;
            }
            const char final_byte = bytes[k++];
            auto params = bytes.substr(params_start, k - 1 - params_start);
            if (intro == '[' && final_byte == '~')
                keys.push_back({csi_tilde_to_key(params)});
            else
                keys.push_back({csi_final_to_key(final_byte)});
        }
        else if (c == '\r' || c == '\n')
            keys.push_back({key_code::enter});
        else if (c == CTRL_C_CHAR)
            keys.push_back({key_code::interrupt});
        else if (c == '\x7F' || c == '\b')
            keys.push_back({key_code::backspace});
        else if (static_cast<unsigned char>(c) >= 0x20)
            keys.push_back({key_code::character, c});
        else
            keys.push_back({key_code::unknown});
    }
    return keys;
}

/// What the session does after a key
enum class action_kind : std::uint8_t
{
    none,
    navigate,
    leave,      ///< Close this mailbox and go on with the next one
    quit        ///< Stop browsing altogether
};

struct key_action
{
    action_kind kind = action_kind::none;
    view::command cmd{view::command_kind::next};
};

/**
Maps keys to navigation commands.

Digits followed by Enter jump to that 1-based message number; Backspace edits the number and Escape drops
it. Any other key drops a number being typed. Ctrl-C always quits.
**/
class key_bindings
{
public:
    inline static constexpr std::size_t MAX_DIGITS = 9;

    /**
    @param page_rows Lines scrolled by a page command.
    **/
    [[nodiscard]] key_action feed(const key_event& key, std::size_t page_rows)
    {
        using view::command_kind;
        const auto page = static_cast<std::int64_t>(page_rows > 0 ? page_rows : 1);

        if (key.code == key_code::interrupt)
        {
            pending_.clear();
            return {action_kind::quit};
        }

        if (key.code == key_code::character && mailview::detail::is_ascii_digit(key.ch))
        {
            if (pending_.size() < MAX_DIGITS)
                pending_.push_back(key.ch);
            return {};
        }
        if (!pending_.empty())
        {
            if (key.code == key_code::backspace)
            {
                pending_.pop_back();
                return {};
            }
            if (key.code == key_code::escape)
            {
                pending_.clear();
                return {};
            }
            if (key.code == key_code::enter)
            {
                const auto number = std::stoll(pending_);
                pending_.clear();
                return navigate({command_kind::jump_to, number - 1});
            }
            pending_.clear();
        }

        switch (key.code)
        {
            case key_code::page_down:
            case key_code::right:
                return navigate({command_kind::next});
            case key_code::page_up:
            case key_code::left:
                return navigate({command_kind::previous});
            case key_code::home:
                return navigate({command_kind::first});
            case key_code::end:
                return navigate({command_kind::last});
            case key_code::down:
                return navigate({command_kind::line_down});
            case key_code::up:
                return navigate({command_kind::line_up});
            case key_code::escape:
                return {action_kind::quit};
            case key_code::character:
                break;
            default:
                return {};
        }

        switch (key.ch)
        {
            case 'n': return navigate({command_kind::next});
            case 'p': return navigate({command_kind::previous});
            case 'g': return navigate({command_kind::first});
            case 'G': return navigate({command_kind::last});
            case 'j': return navigate({command_kind::line_down});
            case 'k': return navigate({command_kind::line_up});
            case ' ': return navigate({command_kind::page_down, page});
            case 'b': return navigate({command_kind::page_up, page});
            case 'q': return {action_kind::leave};
            default: return {};
        }
    }

    /// Message number being typed, empty if none.
    [[nodiscard]] const std::string& pending_number() const noexcept
    {
        return pending_;
    }

private:
    static key_action navigate(view::command cmd) noexcept
    {
        return {action_kind::navigate, cmd};
    }

    std::string pending_;
};

} // namespace mailview::term
