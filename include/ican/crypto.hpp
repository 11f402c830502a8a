#pragma once

#include <string>            // string
#include <nlohmann/json.hpp> // nlohmann::json
#include <ican/error.hpp>

namespace ican {

/*!
 * @brief crypto variant of a specification, or a filter over variants
 *
 * Specifications only ever hold none, main, test or enterprise. The value
 * any is a query filter matching every variant except none.
 */
enum class crypto
{
    none,
    main,
    test,
    enterprise,
    any
};

inline const char* to_string(crypto variant) noexcept
{
    switch (variant)
    {
        case crypto::none:
            return "none";
        case crypto::main:
            return "main";
        case crypto::test:
            return "test";
        case crypto::enterprise:
            return "enterprise";
        case crypto::any:
            return "any";
    }
    return "unknown";
}

/*!
 * @brief parse a textual crypto variant or filter
 *
 * Accepted spellings: "main"/"mainnet", "test"/"testnet",
 * "enter"/"enterprise", "any"/"crypto"/"true" and "none"/"false"/"".
 *
 * @param[in] text the text to parse (case-sensitive)
 * @param[out] variant the parsed value
 * @return false for unknown text, leaving @a variant untouched
 */
inline bool crypto_from_string(const std::string& text, crypto& variant)
{
    if (text == "main" or text == "mainnet")
    {
        variant = crypto::main;
    }
    else if (text == "test" or text == "testnet")
    {
        variant = crypto::test;
    }
    else if (text == "enter" or text == "enterprise")
    {
        variant = crypto::enterprise;
    }
    else if (text == "any" or text == "crypto" or text == "true")
    {
        variant = crypto::any;
    }
    else if (text.empty() or text == "none" or text == "false")
    {
        variant = crypto::none;
    }
    else
    {
        return false;
    }
    return true;
}

/*!
 * @brief whether a specification's variant satisfies a filter
 * @param[in] variant the stored variant (never any)
 * @param[in] filter none matches everything, any matches every variant but
 *            none, a concrete filter must be equal
 */
inline bool satisfies(crypto variant, crypto filter) noexcept
{
    switch (filter)
    {
        case crypto::none:
            return true;
        case crypto::any:
            return variant != crypto::none;
        default:
            return variant == filter;
    }
}

/// serialize a variant; none is written as null
inline void to_json(nlohmann::json& j, crypto variant)
{
    if (variant == crypto::none)
    {
        j = nullptr;
    }
    else
    {
        j = to_string(variant);
    }
}

/*!
 * @brief deserialize a variant from null or any spelling accepted by
 *        crypto_from_string
 * @throw invalid_specification for unknown text or a value of another type
 */
inline void from_json(const nlohmann::json& j, crypto& variant)
{
    if (j.is_null())
    {
        variant = crypto::none;
        return;
    }

    if (not j.is_string() or not crypto_from_string(j.get<std::string>(), variant))
    {
        throw invalid_specification(errc::crypto_variant_mismatch, "unknown crypto variant " + j.dump());
    }
}

} // namespace ican
