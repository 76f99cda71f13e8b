#ifndef LOGGING_H
#define LOGGING_H

#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace utility
{
    // everything goes to stderr so stdout stays free for the serialised graphs
    class Logger
    {
    public:
        explicit Logger(bool verbose)
            : m_verbose{verbose} {}

        // only printed with --verbose
        template <typename... Args>
        auto info(fmt::format_string<Args...> format, Args &&...args) const -> void
        {
            if (m_verbose)
            {
                fmt::print(stderr, "[info] {}\n", fmt::format(format, std::forward<Args>(args)...));
            }
        }

        // results that are text rather than graphs
        template <typename... Args>
        auto note(fmt::format_string<Args...> format, Args &&...args) const -> void
        {
            fmt::print(stderr, "{}\n", fmt::format(format, std::forward<Args>(args)...));
        }

        template <typename... Args>
        auto warn(fmt::format_string<Args...> format, Args &&...args) const -> void
        {
            fmt::print(stderr, "[warning] {}\n", fmt::format(format, std::forward<Args>(args)...));
        }

    private:
        bool m_verbose;
    };
}

#endif
