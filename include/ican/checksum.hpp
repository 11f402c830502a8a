#pragma once

#include <string> // string
#include <ican/structure.hpp>

namespace ican {

/*!
 * @brief ISO 13616 preparation of an identifier for the MOD 97-10 check
 *
 * Moves the leading code and check digits (the first four characters) to the
 * end, uppercases, and replaces every letter by its two-digit value (A=10,
 * ..., Z=35). Identifiers shorter than four characters are not rotated.
 * Characters that are neither letters nor digits are skipped.
 *
 * @param[in] ican identifier, e.g. "DE89370400440532013000"
 * @return digit string, e.g. "370400440532013000131489"
 */
inline std::string iso13616_prepare(const std::string& ican)
{
    const std::size_t head = ican.size() >= 4 ? 4 : 0;

    std::string digits;
    digits.reserve(ican.size() * 2);

    for (std::size_t i = 0; i < ican.size(); ++i)
    {
        const char c = ican[(i + head) % ican.size()];

        if (detail::is_digit(c))
        {
            digits += c;
        }
        else if (detail::is_upper(c) or detail::is_lower(c))
        {
            const int value = (detail::is_lower(c) ? c - 'a' : c - 'A') + 10;
            digits += static_cast<char>('0' + value / 10);
            digits += static_cast<char>('0' + value % 10);
        }
    }

    return digits;
}

/*!
 * @brief ISO 7064 MOD 97-10 remainder of a decimal digit string
 *
 * The number is reduced digit by digit, so the accumulator never exceeds
 * 96 * 10 + 9 regardless of the length of @a digits.
 *
 * @param[in] digits decimal digits; other characters are ignored
 * @return remainder in [0, 96]
 */
inline unsigned iso7064_mod97(const std::string& digits) noexcept
{
    unsigned acc = 0;
    for (const char c : digits)
    {
        if (detail::is_digit(c))
        {
            acc = (acc * 10 + static_cast<unsigned>(c - '0')) % 97;
        }
    }
    return acc;
}

/// whether the checksum of a full identifier is correct
inline bool has_valid_checksum(const std::string& ican)
{
    return iso7064_mod97(iso13616_prepare(ican)) == 1;
}

/*!
 * @brief compute the two check digits for a code and a local payload
 * @param[in] code two-letter code
 * @param[in] bcan local payload
 * @return check digits in "02".."98"
 */
inline std::string check_digits(const std::string& code, const std::string& bcan)
{
    const unsigned check = 98 - iso7064_mod97(iso13616_prepare(code + "00" + bcan));

    std::string result(2, '0');
    result[0] = static_cast<char>('0' + check / 10);
    result[1] = static_cast<char>('0' + check % 10);
    return result;
}

} // namespace ican
