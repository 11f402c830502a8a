#include <string>
#include <tuple>
#include "common.hpp"

class to_bcan_fuzz : public ican::fuzz::target<std::tuple<std::string, std::string>, nlohmann::json>
{
  public:
    input_t input_from_bytes(const std::uint8_t* data, std::size_t size) override
    {
        FuzzedDataProvider data_provider(data, size);
        const auto separator = data_provider.ConsumeRandomLengthString(3);
        const auto code = consume_code(data_provider);
        return input_t{code + data_provider.ConsumeRemainingBytesAsString(), separator};
    }

    output_t run(const input_t& input) override
    {
        return outcome(ican::to_bcan(std::get<0>(input), std::get<1>(input)));
    }
};

ICAN_FUZZ_MAIN(to_bcan_fuzz)
