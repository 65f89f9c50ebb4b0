/*

render.hpp
----------

Render-ready data for the message on display. Painting belongs to the terminal layer.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <mailview/codec/encoded_word.hpp>
#include <mailview/view/navigation.hpp>

namespace mailview::view
{

struct render_view
{
    /// Rows used above the body: status, From, Subject, Date and a separator.
    static constexpr std::size_t HEADER_ROWS = 5;

    std::string status;
    std::string sender;
    std::string subject;
    std::string date;

    /// Body lines visible in the viewport.
    std::vector<std::string> body;

    /// Index of the first visible body line.
    std::size_t first_line = 0;

    /// Number of body lines of the message.
    std::size_t total_lines = 0;

    /// False when the mailbox has no message to show.
    bool has_message = false;
};

/**
First six words of a Date header, or "Unknown".
**/
[[nodiscard]] inline std::string short_date(std::string_view date)
{
    std::istringstream words{std::string(date)};
    std::string word;
    std::string out;
    for (int i = 0; i < 6 && words >> word; ++i)
    {
        if (!out.empty())
            out.push_back(' ');
        out += word;
    }
    return out.empty() ? std::string("Unknown") : out;
}

/**
Builds what the screen shows for the current position.

@param nav  Navigation state.
@param rows Terminal height; the body gets what the header rows leave.
@return     Render-ready view.
**/
[[nodiscard]] inline render_view make_render_view(const navigation_state& nav, std::size_t rows)
{
    render_view view;
    const auto* msg = nav.current();
    if (msg == nullptr)
    {
        view.status = std::format("No messages in {}", nav.mailbox().path().string());
        return view;
    }

    const auto index = *nav.current_index();
    view.has_message = true;
    view.status = std::format("Reading mail {}/{}    {}", index + 1, nav.mailbox().size(), short_date(msg->date()));
    view.sender = codec::encoded_word::decode_all(msg->sender());
    view.subject = codec::encoded_word::decode_all(msg->subject());
    view.date = std::string(msg->date());

    const auto& body = msg->body();
    const std::size_t page = rows > render_view::HEADER_ROWS ? rows - render_view::HEADER_ROWS : 0;
    const std::size_t first = std::min(nav.top_line(), body.size());
    const std::size_t last = std::min(body.size(), first + page);
    view.body.assign(body.begin() + static_cast<std::ptrdiff_t>(first), body.begin() + static_cast<std::ptrdiff_t>(last));
    view.first_line = first;
    view.total_lines = body.size();
    return view;
}

} // namespace mailview::view
