#include <string>
#include <tuple>
#include "common.hpp"

class from_bcan_fuzz : public ican::fuzz::target<std::tuple<std::string, std::string>, nlohmann::json>
{
  public:
    input_t input_from_bytes(const std::uint8_t* data, std::size_t size) override
    {
        FuzzedDataProvider data_provider(data, size);
        const auto code = consume_code(data_provider);
        return input_t{code, data_provider.ConsumeRemainingBytesAsString()};
    }

    output_t run(const input_t& input) override
    {
        const auto built = ican::from_bcan(std::get<0>(input), std::get<1>(input));

        // a constructed identifier must pass validation
        if (built and not ican::is_valid(built.value))
        {
            return {{"error", "constructed identifier is invalid"}, {"value", built.value}};
        }
        return outcome(built);
    }
};

ICAN_FUZZ_MAIN(from_bcan_fuzz)
