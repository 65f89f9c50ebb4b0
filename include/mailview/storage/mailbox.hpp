/*

mailbox.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Read-only, fully loaded view of one mbox file.

*/

#pragma once

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <mailview/detail/log.hpp>
#include <mailview/detail/result.hpp>
#include <mailview/mime/message.hpp>
#include <mailview/storage/mbox_splitter.hpp>

namespace mailview::storage
{

class mailbox
{
public:
    mailbox() = default;

    mailbox(std::filesystem::path path, std::vector<mime::message> messages)
        : path_(std::move(path)), messages_(std::move(messages))
    {
    }

    /**
    Reads and parses the whole file.

    Fails with `errc::not_found` if the path does not exist or is not a regular file, and with
    `errc::io_error` if it cannot be opened or read. Malformed messages never fail the load.
    **/
    [[nodiscard]] static result<mailbox> load(const std::filesystem::path& path)
    {
        auto text = read_file(path);
        if (!text)
            return detail::make_unexpected(std::move(text.error()));
        return parse(*text, path);
    }

    /**
    Builds a mailbox from text already in memory.
    **/
    [[nodiscard]] static mailbox parse(std::string_view text, std::filesystem::path path = {})
    {
        mbox_splitter splitter(text);
        if (!splitter.preamble().empty())
            MAILVIEW_DEBUG(std::format("{}: discarding {} bytes before the first separator",
                path.string(), splitter.preamble().size()));

        std::vector<mime::message> messages;
        for (const auto& record : splitter)
        {
            std::size_t skipped = 0;
            messages.push_back(mime::message::from_record(record, &skipped));
            if (skipped > 0)
                MAILVIEW_DEBUG(std::format("{}: {}: message {} at offset {}: {} header line(s) skipped",
                    path.string(), to_string(errc::parse_anomaly), messages.size(), record.offset, skipped));
        }

        MAILVIEW_INFO(std::format("{}: loaded {} message(s)", path.string(), messages.size()));
        return mailbox(std::move(path), std::move(messages));
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return path_;
    }

    /**
    Mailbox owner, which is the file name for a spool file.
    **/
    [[nodiscard]] std::string user() const
    {
        return path_.filename().string();
    }

    [[nodiscard]] const std::vector<mime::message>& messages() const noexcept
    {
        return messages_;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return messages_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return messages_.empty();
    }

    [[nodiscard]] const mime::message& operator[](std::size_t index) const
    {
        return messages_[index];
    }

private:
    class file_descriptor
    {
    public:
        explicit file_descriptor(int fd) noexcept : fd_(fd) {}

        file_descriptor(const file_descriptor&) = delete;
        file_descriptor& operator=(const file_descriptor&) = delete;

        ~file_descriptor()
        {
            if (fd_ >= 0)
                ::close(fd_);
        }

        [[nodiscard]] int get() const noexcept { return fd_; }

    private:
        int fd_;
    };

    static result<std::string> read_file(const std::filesystem::path& path)
    {
        std::error_code ec;
        auto st = std::filesystem::status(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
            return fail<std::string>(errc::io_error, "cannot access mailbox", path.string(), ec);
        if (!std::filesystem::exists(st))
            return fail<std::string>(errc::not_found, "mailbox does not exist", path.string(),
                std::make_error_code(std::errc::no_such_file_or_directory));
        if (!std::filesystem::is_regular_file(st))
            return fail<std::string>(errc::not_found, "mailbox is not a regular file", path.string());

        file_descriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (fd.get() < 0)
        {
            const std::error_code sys(errno, std::generic_category());
            if (sys == std::errc::no_such_file_or_directory)
                return fail<std::string>(errc::not_found, "mailbox does not exist", path.string(), sys);
            return fail<std::string>(errc::io_error, "cannot open mailbox", path.string(), sys);
        }

        std::string content;
        char buffer[64 * 1024];
        while (true)
        {
            auto n = ::read(fd.get(), buffer, sizeof(buffer));
            if (n == 0)
                break;
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return fail<std::string>(errc::io_error, "cannot read mailbox", path.string(),
                    std::error_code(errno, std::generic_category()));
            }
            content.append(buffer, static_cast<std::size_t>(n));
        }
        return content;
    }

    std::filesystem::path path_;
    std::vector<mime::message> messages_;
};

} // namespace mailview::storage
