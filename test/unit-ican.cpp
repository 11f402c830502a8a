#include <doctest/doctest.h>

#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include <ican/ican.hpp>

using ican::crypto;
using ican::errc;

namespace {

const nlohmann::json& samples()
{
    static const nlohmann::json j = []()
    {
        std::ifstream f(ICAN_TEST_DATA_DIRECTORY "/samples.json");
        return nlohmann::json::parse(f);
    }();
    return j;
}

// a character outside the class, or '\0' if normalization would undo any replacement
char outside(ican::char_class cls)
{
    for (const char c : {'A', '0', 'G'})
    {
        if (not ican::accepts(cls, c))
        {
            return c;
        }
    }
    return '\0';
}

} // namespace

TEST_CASE("scenarios")
{
    CHECK(ican::is_valid("DE89370400440532013000"));
    CHECK(ican::is_valid("DE89370400440532013000", crypto::none));
    CHECK_FALSE(ican::is_valid("DE89370400440532013000", crypto::main));
    CHECK(ican::validate("DE89370400440532013000", crypto::main) == errc::crypto_variant_mismatch);

    CHECK(ican::to_bcan("DE89370400440532013000", " ").value == "37040044 0532013000");
    CHECK(ican::to_bcan("DE89370400440532013000").value == "37040044 0532013000");

    CHECK(ican::from_bcan("DE", "370400440532013000").value == "DE89370400440532013000");

    const auto miss = ican::from_bcan("XX", "370400440532013000");
    CHECK_FALSE(miss);
    CHECK(miss.code == errc::registry_miss);

    CHECK(ican::validate("DE89ABCDEFGH0532013000") == errc::structure_mismatch);
    CHECK(ican::from_bcan("DE", "ABCDEFGH0532013000").code == errc::invalid_local_payload);
    CHECK(ican::to_bcan("DE89ABCDEFGH0532013000").code == errc::structure_mismatch);
}

TEST_CASE("registry lookup through the public functions")
{
    CHECK(ican::validate("") == errc::registry_miss);
    CHECK(ican::validate("D") == errc::registry_miss);
    CHECK(ican::validate("XX89370400440532013000") == errc::registry_miss);
    CHECK(ican::to_bcan("X").code == errc::registry_miss);
    CHECK(ican::to_bcan("DE8").code == errc::structure_mismatch);
    CHECK(ican::from_bcan("de", "370400440532013000").code == errc::registry_miss);
    CHECK(ican::validate_bcan("de", "370400440532013000") == errc::registry_miss);
    CHECK(ican::validate_bcan("XX", "370400440532013000") == errc::registry_miss);

    SUBCASE("identifiers are normalized before lookup")
    {
        CHECK(ican::is_valid("de89 3704 0044 0532 0130 00"));
        CHECK(ican::is_valid(" DE89-3704-0044-0532-0130-00 "));
    }

    SUBCASE("custom registry")
    {
        const ican::registry reg({{"DE", 22, "F08F10", crypto::none, "DE89370400440532013000"}});
        CHECK(ican::is_valid("DE89370400440532013000", crypto::none, reg));
        CHECK(ican::validate("GB29NWBK60161331926819", crypto::none, reg) == errc::registry_miss);
        CHECK(ican::from_bcan("DE", "370400440532013000", reg).value == "DE89370400440532013000");
        CHECK(ican::to_bcan("DE89370400440532013000", "-", reg).value == "37040044-0532013000");
        CHECK(ican::is_valid_bcan("DE", "370400440532013000", crypto::none, reg));
    }
}

TEST_CASE("BCAN validation")
{
    CHECK(ican::is_valid_bcan("DE", "370400440532013000"));
    CHECK(ican::is_valid_bcan("DE", "3704 0044 0532 0130 00"));
    CHECK_FALSE(ican::is_valid_bcan("DE", "INVALID"));
    CHECK_FALSE(ican::is_valid_bcan("DE", "370400440532013000", crypto::any));
    CHECK(ican::is_valid_bcan("CB", "1234567890ABCDEF1234567890ABCDEF12345678", crypto::main));
    CHECK(ican::validate_bcan("CB", "1234567890ABCDEF1234567890ABCDEF12345678", crypto::test) ==
          errc::crypto_variant_mismatch);
}

TEST_CASE("samples")
{
    const auto& j = samples();

    SUBCASE("valid")
    {
        for (const auto& sample : j.at("valid"))
        {
            const auto identifier = sample.at("ican").get<std::string>();
            CAPTURE(identifier);
            CHECK(ican::is_valid(identifier));
        }
    }

    SUBCASE("invalid")
    {
        for (const auto& sample : j.at("invalid"))
        {
            const auto identifier = sample.at("ican").get<std::string>();
            CAPTURE(identifier);
            CHECK_FALSE(ican::is_valid(identifier));
        }
    }

    SUBCASE("crypto")
    {
        for (const auto& sample : j.at("validCrypto"))
        {
            CHECK(ican::is_valid(sample.at("ican").get<std::string>(), crypto::any));
        }
        for (const auto& sample : j.at("validMainnetCrypto"))
        {
            CHECK(ican::is_valid(sample.at("ican").get<std::string>(), crypto::main));
        }
        for (const auto& sample : j.at("validTestnetCrypto"))
        {
            CHECK(ican::is_valid(sample.at("ican").get<std::string>(), crypto::test));
        }
        for (const auto& sample : j.at("invalidCrypto"))
        {
            CHECK_FALSE(ican::is_valid(sample.at("ican").get<std::string>(), crypto::any));
        }
    }

    SUBCASE("formatting")
    {
        for (const auto& sample : j.at("print"))
        {
            CHECK(ican::print_format(sample.at("ican").get<std::string>()) == sample.at("pair").get<std::string>());
        }
        for (const auto& sample : j.at("electronic"))
        {
            CHECK(ican::electronic_format(sample.at("ican").get<std::string>()) ==
                  sample.at("pair").get<std::string>());
        }
        for (const auto& sample : j.at("short"))
        {
            CHECK(ican::short_format(sample.at("ican").get<std::string>()) == sample.at("pair").get<std::string>());
        }
    }
}

TEST_CASE("every registry example is valid")
{
    for (const auto& item : ican::registry::builtin())
    {
        CAPTURE(item.first);
        CHECK(ican::validate(item.second.example()) == errc::none);
    }
}

TEST_CASE("characters outside their class are rejected")
{
    for (const auto& item : ican::registry::builtin())
    {
        const auto& example = item.second.example();

        std::size_t pos = 4;
        for (const auto& seg : item.second.structure().segments())
        {
            const char replacement = outside(seg.cls);
            for (std::size_t end = pos + seg.width; pos < end; ++pos)
            {
                if (replacement == '\0')
                {
                    continue;
                }
                auto mutated = example;
                mutated[pos] = replacement;
                CAPTURE(mutated);
                CHECK(ican::validate(mutated) == errc::structure_mismatch);
            }
        }
    }
}

TEST_CASE("changed check digits are detected")
{
    for (const auto& item : ican::registry::builtin())
    {
        for (std::size_t pos = 2; pos < 4; ++pos)
        {
            auto mutated = item.second.example();
            mutated[pos] = static_cast<char>('0' + (mutated[pos] - '0' + 1) % 10);
            CAPTURE(mutated);
            CHECK(ican::validate(mutated) == errc::checksum_invalid);
        }
    }
}

TEST_CASE("BCAN round trip")
{
    for (const auto& item : ican::registry::builtin())
    {
        const auto& spec = item.second;
        const auto& example = spec.example();
        CAPTURE(item.first);

        const auto bcan = example.substr(4);
        const auto built = ican::from_bcan(spec.code(), bcan);
        REQUIRE(built);
        CHECK(built.value == example);

        const auto extracted = ican::to_bcan(built.value, "");
        REQUIRE(extracted);
        CHECK(extracted.value == bcan);

        const auto grouped = ican::to_bcan(built.value, " ");
        REQUIRE(grouped);
        CHECK(grouped.value.size() == bcan.size() + spec.structure().segments().size() - 1);
        CHECK(ican::electronic_format(grouped.value) == bcan);
    }
}

TEST_CASE("single substitutions are detected by the checksum")
{
    const std::string digits = "0123456789";
    const std::string letters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    for (const std::string sample : {"DE89370400440532013000", "GB29NWBK60161331926819", "MT84MALT011000012345MTLCAST001S",
                                     "CB661234567890ABCDEF1234567890ABCDEF12345678", "BR9700360305000010009795493P1"})
    {
        const auto* spec = ican::registry::builtin().find(sample.substr(0, 2));
        REQUIRE(spec != nullptr);

        std::size_t pos = 4;
        for (const auto& seg : spec->structure().segments())
        {
            for (std::size_t end = pos + seg.width; pos < end; ++pos)
            {
                const auto& same_kind = digits.find(sample[pos]) != std::string::npos ? digits : letters;
                for (const char c : same_kind)
                {
                    if (c == sample[pos] or not ican::accepts(seg.cls, c))
                    {
                        continue;
                    }
                    auto mutated = sample;
                    mutated[pos] = c;
                    CAPTURE(mutated);
                    CHECK(ican::validate(mutated) == errc::checksum_invalid);
                }
            }
        }
    }
}
