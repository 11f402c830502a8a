#pragma once

#include <cstddef>           // size_t
#include <map>               // map
#include <string>            // string
#include <vector>            // vector
#include <nlohmann/json.hpp> // nlohmann::json
#include <ican/crypto.hpp>
#include <ican/error.hpp>
#include <ican/specification.hpp>

namespace ican {

/// raw registry data of one country or asset
struct entry
{
    std::string code;
    std::size_t length;
    std::string structure;
    crypto variant;
    std::string example;
};

namespace detail {

/// the ICAN registry: countries (IBAN layouts) and crypto assets
inline const std::vector<entry>& builtin_entries()
{
    static const std::vector<entry> entries = {
        {"AB", 44, "H40", crypto::test, "AB841234567890ABCDEF1234567890ABCDEF12345678"},
        {"AD", 24, "F04F04A12", crypto::none, "AD1200012030200359100100"},
        {"AE", 23, "F03F16", crypto::none, "AE070331234567890123456"},
        {"AL", 28, "F08A16", crypto::none, "AL47212110090000000235698741"},
        {"AO", 25, "F21", crypto::none, "AO69123456789012345678901"},
        {"AT", 20, "F05F11", crypto::none, "AT611904300234573201"},
        {"AZ", 28, "U04A20", crypto::none, "AZ21NABZ00000000137010001944"},
        {"BA", 20, "F03F03F08F02", crypto::none, "BA391290079401028494"},
        {"BE", 16, "F03F07F02", crypto::none, "BE68539007547034"},
        {"BF", 27, "F23", crypto::none, "BF2312345678901234567890123"},
        {"BG", 22, "U04F04F02A08", crypto::none, "BG80BNBG96611020345678"},
        {"BH", 22, "U04A14", crypto::none, "BH67BMAG00001299123456"},
        {"BI", 16, "F12", crypto::none, "BI41123456789012"},
        {"BJ", 28, "F24", crypto::none, "BJ39123456789012345678901234"},
        {"BL", 27, "F05F05A11F02", crypto::none, "BL391234512345123456789AB13"},
        {"BR", 29, "F08F05F10U01A01", crypto::none, "BR9700360305000010009795493P1"},
        {"BY", 28, "A04F04A16", crypto::none, "BY13NBRB3600900000002Z00AB00"},
        {"CB", 44, "H40", crypto::main, "CB661234567890ABCDEF1234567890ABCDEF12345678"},
        {"CE", 44, "H40", crypto::enterprise, "CE571234567890ABCDEF1234567890ABCDEF12345678"},
        {"CH", 21, "F05A12", crypto::none, "CH9300762011623852957"},
        {"CI", 28, "U02F22", crypto::none, "CI70CI1234567890123456789012"},
        {"CM", 27, "F23", crypto::none, "CM9012345678901234567890123"},
        {"CR", 22, "F04F14", crypto::none, "CR72012300000171549015"},
        {"CV", 25, "F21", crypto::none, "CV30123456789012345678901"},
        {"CY", 28, "F03F05A16", crypto::none, "CY17002001280000001200527600"},
        {"CZ", 24, "F04F06F10", crypto::none, "CZ6508000000192000145399"},
        {"DE", 22, "F08F10", crypto::none, "DE89370400440532013000"},
        {"DK", 18, "F04F09F01", crypto::none, "DK5000400440116243"},
        {"DO", 28, "U04F20", crypto::none, "DO28BAGR00000001212453611324"},
        {"DZ", 24, "F20", crypto::none, "DZ8612345678901234567890"},
        {"EE", 20, "F02F02F11F01", crypto::none, "EE382200221020145685"},
        {"EG", 29, "F04F04F17", crypto::none, "EG800002000156789012345180002"},
        {"ES", 24, "F04F04F01F01F10", crypto::none, "ES9121000418450200051332"},
        {"FI", 18, "F06F07F01", crypto::none, "FI2112345600000785"},
        {"FO", 18, "F04F09F01", crypto::none, "FO6264600001631634"},
        {"FR", 27, "F05F05A11F02", crypto::none, "FR1420041010050500013M02606"},
        {"GB", 22, "U04F06F08", crypto::none, "GB29NWBK60161331926819"},
        {"GE", 22, "U02F16", crypto::none, "GE29NB0000000101904917"},
        {"GF", 27, "F05F05A11F02", crypto::none, "GF121234512345123456789AB13"},
        {"GI", 23, "U04A15", crypto::none, "GI75NWBK000000007099453"},
        {"GL", 18, "F04F09F01", crypto::none, "GL8964710001000206"},
        {"GP", 27, "F05F05A11F02", crypto::none, "GP791234512345123456789AB13"},
        {"GR", 27, "F03F04A16", crypto::none, "GR1601101250000000012300695"},
        {"GT", 28, "A04A20", crypto::none, "GT82TRAJ01020000001210029690"},
        {"HR", 21, "F07F10", crypto::none, "HR1210010051863000160"},
        {"HU", 28, "F03F04F01F15F01", crypto::none, "HU42117730161111101800000000"},
        {"IE", 22, "U04F06F08", crypto::none, "IE29AIBK93115212345678"},
        {"IL", 23, "F03F03F13", crypto::none, "IL620108000000099999999"},
        {"IQ", 23, "U04F03A12", crypto::none, "IQ98NBIQ850123456789012"},
        {"IR", 26, "F22", crypto::none, "IR861234568790123456789012"},
        {"IS", 26, "F04F02F06F10", crypto::none, "IS140159260076545510730339"},
        {"IT", 27, "U01F05F05A12", crypto::none, "IT60X0542811101000000123456"},
        {"JO", 30, "A04F22", crypto::none, "JO15AAAA1234567890123456789012"},
        {"KW", 30, "U04A22", crypto::none, "KW81CBKU0000000000001234560101"},
        {"KZ", 20, "F03A13", crypto::none, "KZ86125KZT5004100100"},
        {"LB", 28, "F04A20", crypto::none, "LB62099900000001001901229114"},
        {"LC", 32, "U04F24", crypto::none, "LC07HEMM000100010012001200013015"},
        {"LI", 21, "F05A12", crypto::none, "LI21088100002324013AA"},
        {"LT", 20, "F05F11", crypto::none, "LT121000011101001000"},
        {"LU", 20, "F03A13", crypto::none, "LU280019400644750000"},
        {"LV", 21, "U04A13", crypto::none, "LV80BANK0000435195001"},
        {"MC", 27, "F05F05A11F02", crypto::none, "MC5811222000010123456789030"},
        {"MD", 24, "U02A18", crypto::none, "MD24AG000225100013104168"},
        {"ME", 22, "F03F13F02", crypto::none, "ME25505000012345678951"},
        {"MF", 27, "F05F05A11F02", crypto::none, "MF551234512345123456789AB13"},
        {"MG", 27, "F23", crypto::none, "MG1812345678901234567890123"},
        {"MK", 19, "F03A10F02", crypto::none, "MK07250120000058984"},
        {"ML", 28, "U01F23", crypto::none, "ML15A12345678901234567890123"},
        {"MQ", 27, "F05F05A11F02", crypto::none, "MQ221234512345123456789AB13"},
        {"MR", 27, "F05F05F11F02", crypto::none, "MR1300020001010000123456753"},
        {"MT", 31, "U04F05A18", crypto::none, "MT84MALT011000012345MTLCAST001S"},
        {"MU", 30, "U04F02F02F12F03U03", crypto::none, "MU17BOMM0101101030300200000MUR"},
        {"MZ", 25, "F21", crypto::none, "MZ25123456789012345678901"},
        {"NC", 27, "F05F05A11F02", crypto::none, "NC551234512345123456789AB13"},
        {"NL", 18, "U04F10", crypto::none, "NL91ABNA0417164300"},
        {"NO", 15, "F04F06F01", crypto::none, "NO9386011117947"},
        {"PF", 27, "F05F05A11F02", crypto::none, "PF281234512345123456789AB13"},
        {"PK", 24, "U04A16", crypto::none, "PK36SCBL0000001123456702"},
        {"PL", 28, "F08F16", crypto::none, "PL61109010140000071219812874"},
        {"PM", 27, "F05F05A11F02", crypto::none, "PM071234512345123456789AB13"},
        {"PS", 29, "U04A21", crypto::none, "PS92PALS000000000400123456702"},
        {"PT", 25, "F04F04F11F02", crypto::none, "PT50000201231234567890154"},
        {"QA", 29, "U04A21", crypto::none, "QA30AAAA123456789012345678901"},
        {"RE", 27, "F05F05A11F02", crypto::none, "RE131234512345123456789AB13"},
        {"RO", 24, "U04A16", crypto::none, "RO49AAAA1B31007593840000"},
        {"RS", 22, "F03F13F02", crypto::none, "RS35260005601001611379"},
        {"SA", 24, "F02A18", crypto::none, "SA0380000000608010167519"},
        {"SC", 31, "U04F04F16U03", crypto::none, "SC18SSCB11010000000000001497USD"},
        {"SE", 24, "F03F16F01", crypto::none, "SE4550000000058398257466"},
        {"SI", 19, "F05F08F02", crypto::none, "SI56263300012039086"},
        {"SK", 24, "F04F06F10", crypto::none, "SK3112000000198742637541"},
        {"SM", 27, "U01F05F05A12", crypto::none, "SM86U0322509800000000270100"},
        {"SN", 28, "U01F23", crypto::none, "SN52A12345678901234567890123"},
        {"ST", 25, "F08F11F02", crypto::none, "ST68000100010051845310112"},
        {"SV", 28, "U04F20", crypto::none, "SV62CENR00000000000000700025"},
        {"TF", 27, "F05F05A11F02", crypto::none, "TF891234512345123456789AB13"},
        {"TL", 23, "F03F14F02", crypto::none, "TL380080012345678910157"},
        {"TN", 24, "F02F03F13F02", crypto::none, "TN5910006035183598478831"},
        {"TR", 26, "F05F01A16", crypto::none, "TR330006100519786457841326"},
        {"UA", 29, "F25", crypto::none, "UA511234567890123456789012345"},
        {"VA", 22, "F18", crypto::none, "VA59001123000012345678"},
        {"VG", 24, "U04F16", crypto::none, "VG96VPVG0000012345678901"},
        {"WF", 27, "F05F05A11F02", crypto::none, "WF621234512345123456789AB13"},
        {"XK", 20, "F04F10F02", crypto::none, "XK051212012345678906"},
        {"YT", 27, "F05F05A11F02", crypto::none, "YT021234512345123456789AB13"},
    };
    return entries;
}

} // namespace detail

/*!
 * @brief read-only mapping from two-letter code to specification
 *
 * All specifications are built (and their structures compiled) when the
 * registry is constructed; malformed data is rejected there. A registry is
 * never modified afterwards and can be read from any number of threads.
 */
class registry
{
  public:
    using map_type = std::map<std::string, specification>;
    using const_iterator = map_type::const_iterator;

    registry() = default;

    /*!
     * @brief build a registry from raw entries
     * @param[in] entries registry data
     * @throw invalid_specification for a malformed or duplicate entry
     */
    explicit registry(const std::vector<entry>& entries)
    {
        for (const auto& e : entries)
        {
            const auto inserted = specs_.emplace(e.code, specification(e.code, e.length, e.structure, e.variant, e.example));
            if (not inserted.second)
            {
                throw invalid_specification(errc::invalid_structure, "duplicate code '" + e.code + "'");
            }
        }
    }

    /*!
     * @brief the built-in registry
     *
     * Built on first use; a malformed built-in table throws from here.
     */
    static const registry& builtin()
    {
        static const registry instance(detail::builtin_entries());
        return instance;
    }

    /*!
     * @brief build a registry from its JSON representation
     * @param[in] j object mapping codes to objects with the keys "length",
     *            "structure", "crypto" (null or a variant name) and "example"
     * @throw invalid_specification for malformed registry data
     * @throw nlohmann::json::exception for a document of the wrong shape
     */
    static registry from_json(const nlohmann::json& j)
    {
        if (not j.is_object())
        {
            throw invalid_specification(errc::invalid_structure, "registry must be a JSON object");
        }

        std::vector<entry> entries;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const auto& value = it.value();

            const auto& length = value.at("length");
            if (not length.is_number_unsigned())
            {
                throw invalid_specification(errc::invalid_structure, it.key() + ": length must be a non-negative integer");
            }

            crypto variant = crypto::none;
            const auto variant_json = value.find("crypto");
            if (variant_json != value.end() and not variant_json->is_null() and
                not (variant_json->is_string() and crypto_from_string(variant_json->get<std::string>(), variant)))
            {
                throw invalid_specification(errc::crypto_variant_mismatch,
                                            it.key() + ": unknown crypto variant " + variant_json->dump());
            }

            entries.push_back({it.key(),
                               length.get<std::size_t>(),
                               value.at("structure").get<std::string>(),
                               variant,
                               value.value("example", std::string())});
        }

        return registry(entries);
    }

    /// JSON representation, as read by from_json
    nlohmann::json to_json() const
    {
        nlohmann::json result = nlohmann::json::object();
        for (const auto& item : specs_)
        {
            const auto& spec = item.second;
            result[item.first] = {{"length", spec.length()},
                                  {"structure", spec.structure().pattern()},
                                  {"crypto", spec.variant()},
                                  {"example", spec.example()}};
        }
        return result;
    }

    /*!
     * @brief look up a specification (exact, case-sensitive)
     * @param[in] code two-letter code
     * @return the specification or nullptr
     */
    const specification* find(const std::string& code) const
    {
        if (not is_valid_code(code))
        {
            return nullptr;
        }
        const auto it = specs_.find(code);
        return it == specs_.end() ? nullptr : &it->second;
    }

    std::size_t size() const noexcept
    {
        return specs_.size();
    }

    const_iterator begin() const noexcept
    {
        return specs_.begin();
    }

    const_iterator end() const noexcept
    {
        return specs_.end();
    }

    /*!
     * @brief validate every example against its own specification
     * @return codes whose example is not a valid identifier
     */
    std::vector<std::string> self_check() const
    {
        std::vector<std::string> failed;
        for (const auto& item : specs_)
        {
            if (not item.second.is_valid(item.second.example()))
            {
                failed.push_back(item.first);
            }
        }
        return failed;
    }

  private:
    map_type specs_;
};

} // namespace ican
