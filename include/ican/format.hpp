#pragma once

#include <string> // string, to_string
#include <ican/error.hpp>
#include <ican/structure.hpp>

namespace ican {

/*!
 * @brief electronic format: strip everything but [A-Za-z0-9] and uppercase
 * @param[in] text any text, e.g. "de89 3704 0044 0532 0130 00"
 * @return normalized string, e.g. "DE89370400440532013000"
 */
inline std::string electronic_format(const std::string& text)
{
    std::string result;
    result.reserve(text.size());

    for (const char c : text)
    {
        if (detail::is_lower(c))
        {
            result += static_cast<char>(c - 'a' + 'A');
        }
        else if (detail::is_upper(c) or detail::is_digit(c))
        {
            result += c;
        }
    }

    return result;
}

/*!
 * @brief print format: separator after every four characters
 * @param[in] ican identifier in any format
 * @param[in] separator text inserted between groups
 * @return e.g. "DE89 3704 0044 0532 0130 00"
 */
inline std::string print_format(const std::string& ican, const std::string& separator = " ")
{
    const std::string str = electronic_format(ican);

    std::string result;
    for (std::size_t i = 0; i < str.size(); ++i)
    {
        if (i != 0 and i % 4 == 0)
        {
            result += separator;
        }
        result += str[i];
    }
    return result;
}

/*!
 * @brief short format: leading and trailing characters around a separator
 * @param[in] ican identifier in any format
 * @param[in] separator text between both parts (default: ellipsis)
 * @param[in] front_count number of leading characters
 * @param[in] back_count number of trailing characters
 * @return e.g. "DE89…3000"
 * @throw invalid_format_arguments if a count is negative or both counts
 *        exceed the length of the electronic format
 */
inline std::string short_format(const std::string& ican, const std::string& separator = "\xE2\x80\xA6",
                                int front_count = 4, int back_count = 4)
{
    const std::string str = electronic_format(ican);

    if (front_count < 0 or back_count < 0 or
        static_cast<std::size_t>(front_count) + static_cast<std::size_t>(back_count) > str.size())
    {
        throw invalid_format_arguments("invalid front_count (" + std::to_string(front_count) + ") or back_count (" +
                                       std::to_string(back_count) + ") for length " + std::to_string(str.size()));
    }

    const auto front = static_cast<std::size_t>(front_count);
    const auto back = static_cast<std::size_t>(back_count);
    return str.substr(0, front) + separator + str.substr(str.size() - back);
}

} // namespace ican
