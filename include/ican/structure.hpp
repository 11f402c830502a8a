#pragma once

#include <cstddef> // size_t
#include <string>  // string
#include <vector>  // vector
#include <ican/error.hpp>

namespace ican {

/// character class tags used in structure patterns
enum class char_class : char
{
    alnum = 'A',        ///< digits, upper and lower letters
    upper_alnum = 'B',  ///< digits, upper letters
    alpha = 'C',        ///< upper and lower letters
    hex = 'H',          ///< 0-9, A-F, a-f
    digit = 'F',        ///< digits only
    lower = 'L',        ///< lower letters
    upper = 'U',        ///< upper letters
    lower_alnum = 'W'   ///< digits, lower letters
};

namespace detail {

inline bool is_digit(char c) noexcept
{
    return c >= '0' and c <= '9';
}

inline bool is_upper(char c) noexcept
{
    return c >= 'A' and c <= 'Z';
}

inline bool is_lower(char c) noexcept
{
    return c >= 'a' and c <= 'z';
}

} // namespace detail

/*!
 * @brief map a pattern tag to its character class
 * @param[in] tag one of A, B, C, H, F, L, U, W
 * @param[out] cls the class when the tag is known
 * @return whether @a tag is a known tag
 */
inline bool char_class_from_tag(char tag, char_class& cls) noexcept
{
    switch (tag)
    {
        case 'A':
        case 'B':
        case 'C':
        case 'H':
        case 'F':
        case 'L':
        case 'U':
        case 'W':
            cls = static_cast<char_class>(tag);
            return true;
        default:
            return false;
    }
}

/*!
 * @brief check whether a character belongs to a class (ASCII only)
 * @param[in] cls character class
 * @param[in] c character to check
 * @return whether @a c is allowed by @a cls
 */
inline bool accepts(char_class cls, char c) noexcept
{
    using namespace detail;

    switch (cls)
    {
        case char_class::alnum:
            return is_digit(c) or is_upper(c) or is_lower(c);
        case char_class::upper_alnum:
            return is_digit(c) or is_upper(c);
        case char_class::alpha:
            return is_upper(c) or is_lower(c);
        case char_class::hex:
            return is_digit(c) or (c >= 'A' and c <= 'F') or (c >= 'a' and c <= 'f');
        case char_class::digit:
            return is_digit(c);
        case char_class::lower:
            return is_lower(c);
        case char_class::upper:
            return is_upper(c);
        case char_class::lower_alnum:
            return is_digit(c) or is_lower(c);
    }
    return false;
}

/// a run of characters of one class with an exact width
struct segment
{
    char_class cls;
    std::size_t width;
};

inline bool operator==(const segment& lhs, const segment& rhs) noexcept
{
    return lhs.cls == rhs.cls and lhs.width == rhs.width;
}

/*!
 * @brief compiled structure pattern: a positional matcher
 *
 * A pattern such as "F08F10" is a concatenation of triples, each a class tag
 * followed by a two-digit width. Compiling it yields one segment per triple;
 * matching consumes the segments left to right with fixed widths, so no
 * backtracking is ever needed.
 */
class structure
{
  public:
    structure() = default;

    /*!
     * @brief compile a structure pattern
     * @param[in] pattern pattern string, e.g. "U04A20"
     * @return the compiled structure or errc::invalid_structure
     */
    static result<structure> compile(const std::string& pattern)
    {
        if (pattern.empty() or pattern.size() % 3 != 0)
        {
            return errc::invalid_structure;
        }

        structure compiled;
        for (std::size_t i = 0; i < pattern.size(); i += 3)
        {
            char_class cls;
            const char tens = pattern[i + 1];
            const char ones = pattern[i + 2];

            if (not char_class_from_tag(pattern[i], cls) or not detail::is_digit(tens) or not detail::is_digit(ones))
            {
                return errc::invalid_structure;
            }

            const auto width = static_cast<std::size_t>((tens - '0') * 10 + (ones - '0'));
            compiled.segments_.push_back({cls, width});
            compiled.width_ += width;
        }

        return compiled;
    }

    /// the segments in declaration order
    const std::vector<segment>& segments() const noexcept
    {
        return segments_;
    }

    /// sum of all segment widths
    std::size_t width() const noexcept
    {
        return width_;
    }

    /// render the structure back to its pattern string
    std::string pattern() const
    {
        std::string result;
        for (const auto& seg : segments_)
        {
            result += static_cast<char>(seg.cls);
            result += static_cast<char>('0' + seg.width / 10);
            result += static_cast<char>('0' + seg.width % 10);
        }
        return result;
    }

    /*!
     * @brief check whether a string matches the structure in full
     * @param[in] value string to match
     * @param[in] offset index of the first character to match
     * @return whether value[offset..] has exactly the structure's width and
     *         every character lies in its segment's class
     */
    bool match(const std::string& value, std::size_t offset = 0) const noexcept
    {
        if (offset > value.size() or value.size() - offset != width_)
        {
            return false;
        }

        std::size_t pos = offset;
        for (const auto& seg : segments_)
        {
            for (std::size_t end = pos + seg.width; pos < end; ++pos)
            {
                if (not accepts(seg.cls, value[pos]))
                {
                    return false;
                }
            }
        }
        return true;
    }

    /*!
     * @brief match a string and split it into one group per segment
     * @param[in] value string to match
     * @param[in] offset index of the first character to match
     * @return the groups, or errc::structure_mismatch
     */
    result<std::vector<std::string>> capture(const std::string& value, std::size_t offset = 0) const
    {
        if (not match(value, offset))
        {
            return errc::structure_mismatch;
        }

        std::vector<std::string> groups;
        groups.reserve(segments_.size());

        std::size_t pos = offset;
        for (const auto& seg : segments_)
        {
            groups.push_back(value.substr(pos, seg.width));
            pos += seg.width;
        }
        return groups;
    }

  private:
    std::vector<segment> segments_;
    std::size_t width_ = 0;
};

} // namespace ican
