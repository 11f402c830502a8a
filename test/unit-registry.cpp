#include <doctest/doctest.h>

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <ican/registry.hpp>

using ican::crypto;
using ican::registry;

TEST_CASE("built-in registry")
{
    const auto& reg = registry::builtin();

    CHECK(reg.size() == 105);
    CHECK(&reg == &registry::builtin());

    SUBCASE("every example is valid")
    {
        CHECK(reg.self_check().empty());
    }

    SUBCASE("every declared length covers prefix and structure")
    {
        for (const auto& item : reg)
        {
            CAPTURE(item.first);
            CHECK(item.second.length() == item.second.structure().width() + 4);
            CHECK(item.second.example().size() == item.second.length());
            CHECK(item.second.code() == item.first);
        }
    }

    SUBCASE("crypto entries")
    {
        REQUIRE(reg.find("CB") != nullptr);
        REQUIRE(reg.find("AB") != nullptr);
        REQUIRE(reg.find("CE") != nullptr);
        CHECK(reg.find("CB")->variant() == crypto::main);
        CHECK(reg.find("AB")->variant() == crypto::test);
        CHECK(reg.find("CE")->variant() == crypto::enterprise);

        std::size_t crypto_entries = 0;
        for (const auto& item : reg)
        {
            crypto_entries += item.second.variant() != crypto::none ? 1 : 0;
        }
        CHECK(crypto_entries == 3);
    }

    SUBCASE("lookup is exact")
    {
        REQUIRE(reg.find("DE") != nullptr);
        CHECK(reg.find("DE")->length() == 22);
        CHECK(reg.find("de") == nullptr);
        CHECK(reg.find("De") == nullptr);
        CHECK(reg.find("XX") == nullptr);
        CHECK(reg.find("DEU") == nullptr);
        CHECK(reg.find("") == nullptr);
    }
}

TEST_CASE("registry from entries")
{
    const std::vector<ican::entry> entries = {
        {"DE", 22, "F08F10", crypto::none, "DE89370400440532013000"},
        {"CB", 44, "H40", crypto::main, "CB661234567890ABCDEF1234567890ABCDEF12345678"}};

    const registry reg(entries);
    CHECK(reg.size() == 2);
    CHECK(reg.self_check().empty());

    SUBCASE("duplicate codes")
    {
        auto duplicated = entries;
        duplicated.push_back(entries[0]);
        CHECK_THROWS_AS(registry{duplicated}, ican::invalid_specification);
        try
        {
            const registry dup(duplicated);
            FAIL("duplicate code accepted");
        }
        catch (const ican::invalid_specification& e)
        {
            CHECK(e.code == ican::errc::invalid_structure);
        }
    }

    SUBCASE("malformed entries fail on construction")
    {
        CHECK_THROWS_AS(registry({{"DE", 22, "F08G10", crypto::none, ""}}), ican::invalid_specification);
        CHECK_THROWS_AS(registry({{"D3", 22, "F08F10", crypto::none, ""}}), ican::invalid_specification);
        CHECK_THROWS_AS(registry({{"DE", 2, "F08F10", crypto::none, ""}}), ican::invalid_specification);
    }

    SUBCASE("wrong examples are reported by the self check")
    {
        const registry broken({{"DE", 22, "F08F10", crypto::none, "DE00370400440532013000"}});
        CHECK(broken.self_check() == std::vector<std::string>{"DE"});
    }
}

TEST_CASE("registry JSON")
{
    SUBCASE("round trip of the built-in registry")
    {
        const auto j = registry::builtin().to_json();
        CHECK(j.size() == 105);
        CHECK(j["DE"] == nlohmann::json({{"length", 22},
                                         {"structure", "F08F10"},
                                         {"crypto", nullptr},
                                         {"example", "DE89370400440532013000"}}));
        CHECK(j["CE"]["crypto"] == "enterprise");

        const auto reg = registry::from_json(j);
        CHECK(reg.size() == 105);
        CHECK(reg.to_json() == j);
    }

    SUBCASE("crypto synonyms and defaults")
    {
        const auto reg = registry::from_json(nlohmann::json::parse(R"({
            "AB": {"length": 44, "structure": "H40", "crypto": "testnet"},
            "DE": {"length": 22, "structure": "F08F10"}
        })"));

        REQUIRE(reg.find("AB") != nullptr);
        CHECK(reg.find("AB")->variant() == crypto::test);
        CHECK(reg.find("AB")->example().empty());
        CHECK(reg.find("DE")->variant() == crypto::none);
    }

    SUBCASE("malformed registry data")
    {
        using nlohmann::json;

        CHECK_THROWS_AS(registry::from_json(json::array()), ican::invalid_specification);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": -22, "structure": "F08F10"}})")),
                        ican::invalid_specification);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": 22, "structure": "F08F10", "crypto": "bitcoin"}})")),
                        ican::invalid_specification);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": 22, "structure": "F08F10", "crypto": "any"}})")),
                        ican::invalid_specification);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"de": {"length": 22, "structure": "F08F10"}})")),
                        ican::invalid_specification);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": 22, "structure": "F8F10"}})")),
                        ican::invalid_specification);
    }

    SUBCASE("malformed data is reported as invalid structure")
    {
        using nlohmann::json;

        const auto code_of = [](const json& j) -> ican::errc {
            try
            {
                static_cast<void>(registry::from_json(j));
            }
            catch (const ican::invalid_specification& e)
            {
                return e.code;
            }
            return ican::errc::none;
        };

        CHECK(code_of(json::array()) == ican::errc::invalid_structure);
        CHECK(code_of(json::parse(R"({"DE": {"length": -22, "structure": "F08F10"}})")) ==
              ican::errc::invalid_structure);
        CHECK(code_of(json::parse(R"({"DE": {"length": "22", "structure": "F08F10"}})")) ==
              ican::errc::invalid_structure);
        CHECK(code_of(json::parse(R"({"DE": {"length": 22, "structure": "F08G10"}})")) ==
              ican::errc::invalid_structure);
    }

    SUBCASE("documents of the wrong shape")
    {
        using nlohmann::json;

        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"structure": "F08F10"}})")), json::exception);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": 22}})")), json::exception);
        CHECK_THROWS_AS(registry::from_json(json::parse(R"({"DE": {"length": 22, "structure": 7}})")), json::exception);
    }
}
