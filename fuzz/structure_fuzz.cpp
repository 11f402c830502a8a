#include <string>
#include "common.hpp"

class structure_fuzz : public ican::fuzz::target<std::string, nlohmann::json>
{
  public:
    input_t input_from_bytes(const std::uint8_t* data, std::size_t size) override
    {
        FuzzedDataProvider data_provider(data, size);
        return data_provider.ConsumeRemainingBytesAsString();
    }

    output_t run(const input_t& input) override
    {
        const auto compiled = ican::structure::compile(input);
        if (not compiled)
        {
            return {{"error", ican::to_string(compiled.code)}};
        }
        return {{"pattern", compiled.value.pattern()}, {"width", compiled.value.width()}};
    }
};

ICAN_FUZZ_MAIN(structure_fuzz)
