#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <ican/fuzz/harness.hpp>
#include <ican/ican.hpp>

/// observable outcome of a conversion: {"value": ...} or {"error": ...}
inline nlohmann::json outcome(const ican::result<std::string>& res)
{
    if (res)
    {
        return {{"value", res.value}};
    }
    return {{"error", ican::to_string(res.code)}};
}

/// either a registry code or two arbitrary characters, to reach past the lookup
inline std::string consume_code(FuzzedDataProvider& data_provider)
{
    const auto& reg = ican::registry::builtin();

    if (data_provider.ConsumeBool())
    {
        return data_provider.ConsumeBytesAsString(2);
    }

    auto it = reg.begin();
    std::advance(it, data_provider.ConsumeIntegralInRange<std::size_t>(0, reg.size() - 1));
    return it->first;
}
