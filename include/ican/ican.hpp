#pragma once

#include <string> // string
#include <ican/checksum.hpp>
#include <ican/crypto.hpp>
#include <ican/error.hpp>
#include <ican/format.hpp>
#include <ican/registry.hpp>
#include <ican/specification.hpp>
#include <ican/structure.hpp>

/*!
 * ICAN (International Crypto Account Number) validation, formatting and
 * conversion to and from BCAN (Basic Crypto Account Number).
 *
 * All functions take an optional registry and default to the built-in one.
 */
namespace ican {

/*!
 * @brief validate an identifier and report the first failing check
 * @param[in] identifier identifier in any format
 * @param[in] filter crypto filter
 * @param[in] reg registry to look the code up in
 * @return errc::none for a valid identifier
 */
inline errc validate(const std::string& identifier, crypto filter = crypto::none,
                     const registry& reg = registry::builtin())
{
    const std::string str = electronic_format(identifier);

    const specification* spec = str.size() >= 2 ? reg.find(str.substr(0, 2)) : nullptr;
    if (spec == nullptr)
    {
        return errc::registry_miss;
    }
    return spec->validate(str, filter);
}

/// whether an identifier is valid
inline bool is_valid(const std::string& identifier, crypto filter = crypto::none,
                     const registry& reg = registry::builtin())
{
    return validate(identifier, filter, reg) == errc::none;
}

/*!
 * @brief convert an identifier to its local payload
 * @param[in] identifier identifier in any format
 * @param[in] separator text between the structure groups
 * @param[in] reg registry to look the code up in
 * @return the payload, errc::registry_miss or errc::structure_mismatch
 */
inline result<std::string> to_bcan(const std::string& identifier, const std::string& separator = " ",
                                   const registry& reg = registry::builtin())
{
    const std::string str = electronic_format(identifier);

    const specification* spec = str.size() >= 2 ? reg.find(str.substr(0, 2)) : nullptr;
    if (spec == nullptr)
    {
        return errc::registry_miss;
    }
    return spec->to_bcan(str, separator);
}

/*!
 * @brief create an identifier from a code and a local payload
 * @param[in] code two-letter code (exact, upper case)
 * @param[in] bcan local payload in any format
 * @param[in] reg registry to look the code up in
 * @return the identifier, errc::registry_miss or errc::invalid_local_payload
 */
inline result<std::string> from_bcan(const std::string& code, const std::string& bcan,
                                     const registry& reg = registry::builtin())
{
    const specification* spec = reg.find(code);
    if (spec == nullptr)
    {
        return errc::registry_miss;
    }
    return spec->from_bcan(bcan);
}

/// validate a local payload against a code's specification
inline errc validate_bcan(const std::string& code, const std::string& bcan, crypto filter = crypto::none,
                          const registry& reg = registry::builtin())
{
    const specification* spec = reg.find(code);
    if (spec == nullptr)
    {
        return errc::registry_miss;
    }
    return spec->validate_bcan(bcan, filter);
}

inline bool is_valid_bcan(const std::string& code, const std::string& bcan, crypto filter = crypto::none,
                          const registry& reg = registry::builtin())
{
    return validate_bcan(code, bcan, filter, reg) == errc::none;
}

} // namespace ican
