/*

spool.hpp
---------

Mail spool directory accessors: one mbox file per user.

*/

#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <mailview/detail/result.hpp>

namespace mailview::storage
{

struct spool_selection
{
    /// Browse only this user's mailbox.
    std::optional<std::string> user;

    /// User names skipped when browsing the whole spool.
    std::set<std::string> exclude;
};

class spool
{
public:
    inline static const std::filesystem::path DEFAULT_ROOT{"/var/mail"};

    explicit spool(std::filesystem::path root = DEFAULT_ROOT)
        : root_(std::move(root))
    {
    }

    [[nodiscard]] const std::filesystem::path& root() const noexcept
    {
        return root_;
    }

    /**
    Regular files directly under the spool root, sorted by name.
    **/
    [[nodiscard]] result<std::vector<std::filesystem::path>> list() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(root_, ec))
        {
            if (ec)
                return fail<std::vector<std::filesystem::path>>(errc::io_error, "cannot access spool", root_.string(), ec);
            return fail<std::vector<std::filesystem::path>>(errc::not_found, "spool does not exist", root_.string());
        }

        std::vector<std::filesystem::path> out;
        std::filesystem::directory_iterator it(root_, ec);
        if (ec)
            return fail<std::vector<std::filesystem::path>>(errc::io_error, "cannot list spool", root_.string(), ec);
        for (; it != std::filesystem::directory_iterator(); it.increment(ec))
        {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec))
                continue;
            out.push_back(it->path());
        }
        if (ec)
            return fail<std::vector<std::filesystem::path>>(errc::io_error, "cannot list spool", root_.string(), ec);

        std::sort(out.begin(), out.end());
        return out;
    }

    /**
    Mailbox files to browse.

    A target user selects `root / user` whether or not it was listed, so that loading it reports
    the failure. Otherwise every candidate whose file name is not excluded is kept, in order.
    **/
    [[nodiscard]] std::vector<std::filesystem::path> select(const std::vector<std::filesystem::path>& candidates,
        const spool_selection& selection) const
    {
        if (selection.user)
            return {root_ / *selection.user};

        std::vector<std::filesystem::path> out;
        for (const auto& path : candidates)
        {
            if (selection.exclude.count(path.filename().string()) == 0)
                out.push_back(path);
        }
        return out;
    }

private:
    std::filesystem::path root_;
};

} // namespace mailview::storage
