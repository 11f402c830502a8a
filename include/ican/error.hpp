#pragma once

#include <stdexcept> // runtime_error
#include <string>    // string
#include <utility>   // move

namespace ican {

/// error kinds reported by the engine
enum class errc
{
    none = 0,
    registry_miss,
    invalid_structure,
    length_mismatch,
    crypto_variant_mismatch,
    structure_mismatch,
    checksum_invalid,
    invalid_local_payload,
    invalid_format_arguments
};

/*!
 * @brief stable name of an error kind
 * @param[in] code error kind
 * @return lower-case name, "none" for success
 */
inline const char* to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::none:
            return "none";
        case errc::registry_miss:
            return "registry_miss";
        case errc::invalid_structure:
            return "invalid_structure";
        case errc::length_mismatch:
            return "length_mismatch";
        case errc::crypto_variant_mismatch:
            return "crypto_variant_mismatch";
        case errc::structure_mismatch:
            return "structure_mismatch";
        case errc::checksum_invalid:
            return "checksum_invalid";
        case errc::invalid_local_payload:
            return "invalid_local_payload";
        case errc::invalid_format_arguments:
            return "invalid_format_arguments";
    }
    return "unknown";
}

/*!
 * @brief value or error kind returned by the conversion operations
 * @tparam T type of the value; default-constructed when an error is set
 */
template <class T>
struct result
{
    T value{};
    errc code = errc::none;

    result() = default;

    result(T v)
        : value(std::move(v))
    {}

    result(errc c)
        : code(c)
    {}

    bool ok() const noexcept
    {
        return code == errc::none;
    }

    explicit operator bool() const noexcept
    {
        return ok();
    }
};

/// base class for errors that indicate a programming or packaging bug
class exception : public std::runtime_error
{
  public:
    exception(errc c, const std::string& what_arg)
        : std::runtime_error(std::string("[ican.") + to_string(c) + "] " + what_arg)
        , code(c)
    {}

    /// the error kind
    const errc code;
};

/// a registry entry is malformed (bad code, length or structure grammar)
class invalid_specification : public exception
{
  public:
    invalid_specification(errc c, const std::string& what_arg)
        : exception(c, what_arg)
    {}
};

/// short_format was called with negative or oversized counts
class invalid_format_arguments : public exception
{
  public:
    explicit invalid_format_arguments(const std::string& what_arg)
        : exception(errc::invalid_format_arguments, what_arg)
    {}
};

} // namespace ican
