#include "../include/utility.hpp"

#include <algorithm>

namespace utility
{
    static constexpr std::string_view whitespace = " \t\r\n";

    static auto utf8_length(unsigned char lead) -> std::size_t
    {
        if (lead < 0x80) return 1;
        if ((lead >> 5) == 0x6) return 2;
        if ((lead >> 4) == 0xE) return 3;
        if ((lead >> 3) == 0x1E) return 4;
        return 1;
    }

    auto trim(std::string_view str) -> std::string
    {
        auto first = str.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        auto last = str.find_last_not_of(whitespace);
        return std::string(str.substr(first, last - first + 1));
    }

    auto split(std::string_view str, char delim) -> std::vector<std::string>
    {
        std::vector<std::string> pieces;
        for (auto piece : str | views::split(delim))
        {
            pieces.push_back(trim(std::string_view(piece.begin(), piece.end())));
        }
        return pieces;
    }

    auto split_any(std::string_view str, std::string_view delims) -> std::vector<std::string>
    {
        std::vector<std::string> pieces;
        std::size_t pos = 0;
        while (pos <= str.size())
        {
            auto next = str.find_first_of(delims, pos);
            if (next == std::string_view::npos)
            {
                next = str.size();
            }
            if (auto piece = trim(str.substr(pos, next - pos)); !piece.empty())
            {
                pieces.push_back(std::move(piece));
            }
            pos = next + 1;
        }
        return pieces;
    }

    auto tokenize(std::string_view text, const std::vector<std::string> &vocabulary) -> std::vector<std::string>
    {
        std::string trimmed = trim(text);
        if (trimmed.find_first_of(", \t") != std::string::npos)
        {
            return split_any(trimmed, ", \t");
        }

        std::vector<std::string> symbols;
        std::string_view rest{trimmed};
        while (!rest.empty())
        {
            std::size_t best = 0;
            for (const auto &symbol : vocabulary)
            {
                if (symbol.size() > best && rest.starts_with(symbol))
                {
                    best = symbol.size();
                }
            }
            if (best == 0)
            {
                best = std::min(utf8_length(static_cast<unsigned char>(rest.front())), rest.size());
            }
            symbols.emplace_back(rest.substr(0, best));
            rest.remove_prefix(best);
        }
        return symbols;
    }
}
