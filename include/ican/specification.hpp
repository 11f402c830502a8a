#pragma once

#include <cstddef>           // size_t
#include <string>            // string
#include <utility>           // move
#include <vector>            // vector
#include <nlohmann/json.hpp> // nlohmann::json
#include <ican/checksum.hpp>
#include <ican/crypto.hpp>
#include <ican/error.hpp>
#include <ican/format.hpp>
#include <ican/structure.hpp>

namespace ican {

/*!
 * @brief whether a string is a two-letter upper-case code
 * @param[in] code the code to check
 */
inline bool is_valid_code(const std::string& code) noexcept
{
    return code.size() == 2 and detail::is_upper(code[0]) and detail::is_upper(code[1]);
}

/*!
 * @brief layout of the identifiers of one country or asset
 *
 * An identifier is the two-letter code, two check digits, and the local
 * payload (BCAN) described by the structure. Instances are immutable; the
 * structure pattern is compiled once on construction.
 */
class specification
{
  public:
    /// length of code and check digits
    static constexpr std::size_t prefix_length = 4;

    /*!
     * @brief create a specification
     * @param[in] code two upper-case letters
     * @param[in] length total length of an identifier
     * @param[in] pattern structure pattern of the local payload
     * @param[in] variant crypto variant (any is rejected)
     * @param[in] example a valid identifier
     * @throw invalid_specification if the code, length, pattern or variant
     *        is malformed
     */
    specification(std::string code, std::size_t length, const std::string& pattern, crypto variant,
                  std::string example)
        : code_(std::move(code))
        , length_(length)
        , crypto_(variant)
        , example_(std::move(example))
    {
        if (not is_valid_code(code_))
        {
            throw invalid_specification(errc::registry_miss, "invalid code '" + code_ + "'");
        }

        if (length_ < prefix_length)
        {
            throw invalid_specification(errc::length_mismatch,
                                        code_ + ": length " + std::to_string(length_) + " is shorter than the prefix");
        }

        if (crypto_ == crypto::any)
        {
            throw invalid_specification(errc::crypto_variant_mismatch, code_ + ": 'any' is not a concrete variant");
        }

        auto compiled = ican::structure::compile(pattern);
        if (not compiled)
        {
            throw invalid_specification(compiled.code, code_ + ": invalid structure '" + pattern + "'");
        }
        structure_ = std::move(compiled.value);
    }

    const std::string& code() const noexcept
    {
        return code_;
    }

    std::size_t length() const noexcept
    {
        return length_;
    }

    const ican::structure& structure() const noexcept
    {
        return structure_;
    }

    crypto variant() const noexcept
    {
        return crypto_;
    }

    const std::string& example() const noexcept
    {
        return example_;
    }

    /*!
     * @brief validate a full identifier and report the first failing check
     *
     * Checks length, code, crypto filter, structure and checksum in this
     * order. The input is brought to electronic format first.
     *
     * @param[in] ican identifier in any format
     * @param[in] filter crypto filter
     * @return errc::none for a valid identifier
     */
    errc validate(const std::string& ican, crypto filter = crypto::none) const
    {
        const std::string str = electronic_format(ican);

        if (str.size() != length_)
        {
            return errc::length_mismatch;
        }
        if (str.compare(0, 2, code_) != 0)
        {
            return errc::registry_miss;
        }
        if (not satisfies(crypto_, filter))
        {
            return errc::crypto_variant_mismatch;
        }
        if (not structure_.match(str, prefix_length))
        {
            return errc::structure_mismatch;
        }
        if (not has_valid_checksum(str))
        {
            return errc::checksum_invalid;
        }
        return errc::none;
    }

    bool is_valid(const std::string& ican, crypto filter = crypto::none) const
    {
        return validate(ican, filter) == errc::none;
    }

    /*!
     * @brief extract the local payload, one group per structure segment
     * @param[in] ican identifier in any format; the checksum is not verified
     * @param[in] separator text between groups
     * @return e.g. "37040044 0532013000", or errc::structure_mismatch
     */
    result<std::string> to_bcan(const std::string& ican, const std::string& separator = " ") const
    {
        const std::string str = electronic_format(ican);

        if (str.size() < prefix_length)
        {
            return errc::structure_mismatch;
        }

        auto groups = structure_.capture(str, prefix_length);
        if (not groups)
        {
            return groups.code;
        }

        std::string bcan;
        for (std::size_t i = 0; i < groups.value.size(); ++i)
        {
            if (i != 0)
            {
                bcan += separator;
            }
            bcan += groups.value[i];
        }
        return bcan;
    }

    /*!
     * @brief build a full identifier from a local payload
     * @param[in] bcan local payload in any format
     * @return code, check digits and payload, or errc::invalid_local_payload
     */
    result<std::string> from_bcan(const std::string& bcan) const
    {
        const std::string str = electronic_format(bcan);

        if (validate_bcan(str) != errc::none)
        {
            return errc::invalid_local_payload;
        }
        return code_ + check_digits(code_, str) + str;
    }

    /*!
     * @brief check a local payload without checksum
     * @return errc::none, errc::crypto_variant_mismatch or
     *         errc::invalid_local_payload
     */
    errc validate_bcan(const std::string& bcan, crypto filter = crypto::none) const
    {
        const std::string str = electronic_format(bcan);

        if (str.size() != length_ - prefix_length or not structure_.match(str))
        {
            return errc::invalid_local_payload;
        }
        if (not satisfies(crypto_, filter))
        {
            return errc::crypto_variant_mismatch;
        }
        return errc::none;
    }

    bool is_valid_bcan(const std::string& bcan, crypto filter = crypto::none) const
    {
        return validate_bcan(bcan, filter) == errc::none;
    }

  private:
    std::string code_;
    std::size_t length_;
    ican::structure structure_;
    crypto crypto_;
    std::string example_;
};

/// serialize a specification including its compiled segments
inline void to_json(nlohmann::json& j, const specification& spec)
{
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& seg : spec.structure().segments())
    {
        segments.push_back({{"class", std::string(1, static_cast<char>(seg.cls))}, {"width", seg.width}});
    }

    j = {{"code", spec.code()},
         {"length", spec.length()},
         {"structure", spec.structure().pattern()},
         {"crypto", spec.variant()},
         {"example", spec.example()},
         {"segments", std::move(segments)}};
}

} // namespace ican
