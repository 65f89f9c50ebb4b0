/*

screen.hpp
----------

ANSI painter of a render view.

*/

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include <mailview/detail/ascii.hpp>
#include <mailview/view/render.hpp>

namespace mailview::term
{

class screen
{
public:
    /// Help shown when browsing one mailbox
    inline static constexpr std::string_view HELP{
        "PgUp/PgDn=prev/next mail  Up/Down=prev/next line  NUM Enter=go to  q/Esc=quit"};

    /// Help shown while other mailboxes wait to be browsed
    inline static constexpr std::string_view HELP_MORE_MAILBOXES{
        "PgUp/PgDn=prev/next mail  Up/Down=prev/next line  NUM Enter=go to  q=next mailbox  Esc=quit"};

    explicit screen(std::ostream& out, std::string_view help = HELP) : out_(&out), help_(help)
    {
    }

    /**
    Paints the whole screen.

    @param frame   What to show.
    @param cols    Terminal width; longer lines are cut.
    @param pending Message number being typed, shown in the status line.
    **/
    void paint(const view::render_view& frame, std::size_t cols, std::string_view pending = {})
    {
        std::ostream& out = *out_;
        out << CLEAR << goto_row(1) << UNDERLINE_ON;
        std::string status = frame.status + "    ";
        if (!pending.empty())
            status += "Go to: " + std::string(pending) + "    ";
        status += help_;
        out << fit(status, cols) << UNDERLINE_OFF;

        if (frame.has_message)
        {
            out << goto_row(2) << fit("From: " + frame.sender, cols);
            out << goto_row(3) << fit("Subject: " + frame.subject, cols);
            out << goto_row(4) << fit("Date: " + frame.date, cols);
            out << goto_row(5) << std::string(cols, '-');

            std::size_t row = view::render_view::HEADER_ROWS + 1;
            for (const auto& line : frame.body)
                out << goto_row(row++) << fit(line, cols);
        }
        out.flush();
    }

    /**
    Printable form of a line cut to at most `cols` bytes, never inside a UTF-8 sequence.
    **/
    [[nodiscard]] static std::string fit(std::string_view line, std::size_t cols)
    {
        std::string out = mailview::detail::printable_copy(line);
        if (out.size() <= cols)
            return out;
        std::size_t cut = cols;
        while (cut > 0 && is_utf8_continuation(out[cut]))
            --cut;
        out.resize(cut);
        return out;
    }

private:
    inline static constexpr std::string_view CLEAR{"\x1B[2J"};
    inline static constexpr std::string_view UNDERLINE_ON{"\x1B[4m"};
    inline static constexpr std::string_view UNDERLINE_OFF{"\x1B[24m"};

    static constexpr bool is_utf8_continuation(char ch) noexcept
    {
        return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    }

    static std::string goto_row(std::size_t row)
    {
        return "\x1B[" + std::to_string(row) + ";1H";
    }

    std::ostream* out_;
    std::string_view help_;
};

} // namespace mailview::term
