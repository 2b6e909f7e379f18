#include "text.hpp"

#include <cctype>

namespace utils
{

    static inline bool is_word_char(unsigned char c)
    {
        return std::isalnum(c) || c == '_';
    }

    std::string to_lower(std::string s)
    {
        for (auto &c : s)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    std::string clean_sensor_name(const std::string &name)
    {
        if (name.empty())
            return "unknown_sensor";

        std::string out;
        out.reserve(name.size());
        for (char ch : name)
        {
            const unsigned char c = static_cast<unsigned char>(ch);
            const char mapped = is_word_char(c) ? ch : '_';
            if (mapped == '_' && !out.empty() && out.back() == '_')
                continue;
            out.push_back(mapped);
        }

        const size_t first = out.find_first_not_of('_');
        if (first == std::string::npos)
            return "";
        const size_t last = out.find_last_not_of('_');
        return to_lower(out.substr(first, last - first + 1));
    }

    bool parse_hex_u32(const std::string &s, uint32_t &out)
    {
        size_t pos = 0;
        if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
            pos = 2;
        if (pos == s.size())
            return false;

        uint64_t value = 0;
        for (; pos < s.size(); ++pos)
        {
            const unsigned char c = static_cast<unsigned char>(s[pos]);
            if (!std::isxdigit(c))
                return false;
            const int digit = std::isdigit(c) ? (c - '0') : (std::tolower(c) - 'a' + 10);
            value = (value << 4) | static_cast<uint64_t>(digit);
            if (value > 0xFFFFFFFFULL)
                return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    }

} // namespace utils
