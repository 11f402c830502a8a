#include <string>
#include <tuple>
#include "common.hpp"

class validate_fuzz : public ican::fuzz::target<std::tuple<std::string, ican::crypto>, std::string>
{
  public:
    input_t input_from_bytes(const std::uint8_t* data, std::size_t size) override
    {
        FuzzedDataProvider data_provider(data, size);
        const auto filter = static_cast<ican::crypto>(data_provider.ConsumeIntegralInRange(0, 4));
        const auto code = consume_code(data_provider);
        return input_t{code + data_provider.ConsumeRemainingBytesAsString(), filter};
    }

    output_t run(const input_t& input) override
    {
        return ican::to_string(ican::validate(std::get<0>(input), std::get<1>(input)));
    }
};

ICAN_FUZZ_MAIN(validate_fuzz)
