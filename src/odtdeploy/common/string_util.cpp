#include "odtdeploy/common/string_util.hpp"
#include <cctype>

namespace odtdeploy
{

std::string to_lower_ascii(std::string_view text)
{
    std::string result(text);
    for (auto& c : result)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && to_lower_ascii(a) == to_lower_ascii(b);
}

bool icontains(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
    {
        return true;
    }
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::string trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> split_list(std::string_view text, char delimiter)
{
    std::vector<std::string> result;
    size_t pos = 0;
    while (pos <= text.size())
    {
        size_t next = text.find(delimiter, pos);
        if (next == std::string_view::npos)
        {
            next = text.size();
        }
        std::string piece = trim(text.substr(pos, next - pos));
        if (!piece.empty())
        {
            result.push_back(std::move(piece));
        }
        pos = next + 1;
    }
    return result;
}

} // namespace odtdeploy
