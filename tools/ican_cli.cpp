#include <cstdlib>  // EXIT_SUCCESS, EXIT_FAILURE, strtol
#include <fstream>  // ifstream
#include <iostream> // cerr, cout, endl
#include <string>   // string
#include <vector>   // vector
#include <nlohmann/json.hpp>
#include <ican/ican.hpp>

namespace {

void usage(const char* program)
{
    std::cerr << "usage: " << program << " [--registry FILE] COMMAND ARGUMENTS\n\n"
              << "ICAN validation, formatting and BCAN conversion\n\n"
              << "commands:\n"
                 "  validate ICAN [CRYPTO]              check an ICAN; exit status 0 if valid\n"
                 "  to-bcan ICAN [SEPARATOR]            print the BCAN of an ICAN\n"
                 "  from-bcan CODE BCAN                 print the ICAN for a BCAN\n"
                 "  validate-bcan CODE BCAN [CRYPTO]    check a BCAN; exit status 0 if valid\n"
                 "  print ICAN [SEPARATOR]              print in groups of four\n"
                 "  short ICAN [SEPARATOR [FRONT BACK]] print leading and trailing characters\n"
                 "  electronic TEXT                     print the electronic format\n"
                 "  registry [CODE]                     dump the registry or one specification as JSON\n"
                 "  --help                              show this help message and exit\n"
                 "\n"
                 "  --registry FILE  read the registry from a JSON file instead of the built-in one\n"
                 "  CRYPTO           none, any, main[net], test[net] or enter[prise]"
              << std::endl;
}

bool parse_filter(const std::vector<std::string>& args, std::size_t index, ican::crypto& filter)
{
    filter = ican::crypto::none;
    if (args.size() <= index)
    {
        return true;
    }
    if (not ican::crypto_from_string(args[index], filter))
    {
        std::cerr << "ican: unknown crypto filter '" << args[index] << "'" << std::endl;
        return false;
    }
    return true;
}

bool parse_count(const std::string& text, int& count)
{
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() or *end != '\0' or value < -1000000 or value > 1000000)
    {
        std::cerr << "ican: invalid count '" << text << "'" << std::endl;
        return false;
    }
    count = static_cast<int>(value);
    return true;
}

int report(const ican::errc code)
{
    if (code != ican::errc::none)
    {
        std::cout << "invalid: " << ican::to_string(code) << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "valid" << std::endl;
    return EXIT_SUCCESS;
}

int report(const ican::result<std::string>& res)
{
    if (not res)
    {
        std::cerr << "ican: " << ican::to_string(res.code) << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << res.value << std::endl;
    return EXIT_SUCCESS;
}

int run(const std::vector<std::string>& args, const ican::registry& reg)
{
    const std::string& command = args[0];
    ican::crypto filter;

    if (command == "validate" and args.size() >= 2)
    {
        if (not parse_filter(args, 2, filter))
        {
            return EXIT_FAILURE;
        }
        return report(ican::validate(args[1], filter, reg));
    }

    if (command == "to-bcan" and args.size() >= 2)
    {
        return report(ican::to_bcan(args[1], args.size() >= 3 ? args[2] : " ", reg));
    }

    if (command == "from-bcan" and args.size() >= 3)
    {
        return report(ican::from_bcan(args[1], args[2], reg));
    }

    if (command == "validate-bcan" and args.size() >= 3)
    {
        if (not parse_filter(args, 3, filter))
        {
            return EXIT_FAILURE;
        }
        return report(ican::validate_bcan(args[1], args[2], filter, reg));
    }

    if (command == "print" and args.size() >= 2)
    {
        std::cout << ican::print_format(args[1], args.size() >= 3 ? args[2] : " ") << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "short" and args.size() >= 2)
    {
        int front = 4;
        int back = 4;
        if (args.size() >= 5 and (not parse_count(args[3], front) or not parse_count(args[4], back)))
        {
            return EXIT_FAILURE;
        }

        try
        {
            std::cout << ican::short_format(args[1], args.size() >= 3 ? args[2] : "\xE2\x80\xA6", front, back)
                      << std::endl;
        }
        catch (const ican::invalid_format_arguments& e)
        {
            std::cerr << "ican: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (command == "electronic" and args.size() >= 2)
    {
        std::cout << ican::electronic_format(args[1]) << std::endl;
        return EXIT_SUCCESS;
    }

    if (command == "registry")
    {
        if (args.size() == 1)
        {
            std::cout << reg.to_json().dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        const ican::specification* spec = reg.find(args[1]);
        if (spec == nullptr)
        {
            std::cerr << "ican: " << ican::to_string(ican::errc::registry_miss) << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << nlohmann::json(*spec).dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    std::cerr << "ican: unknown command or missing argument; call 'ican --help' for more information." << std::endl;
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() or args[0] == "--help")
    {
        usage(argv[0]);
        return args.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    ican::registry custom;
    const ican::registry* reg = &ican::registry::builtin();

    if (args[0] == "--registry")
    {
        if (args.size() < 3)
        {
            std::cerr << "ican: --registry needs a file and a command" << std::endl;
            return EXIT_FAILURE;
        }

        std::ifstream in(args[1]);
        if (not in)
        {
            std::cerr << "ican: cannot open registry file '" << args[1] << "'" << std::endl;
            return EXIT_FAILURE;
        }

        try
        {
            custom = ican::registry::from_json(nlohmann::json::parse(in));
        }
        catch (const nlohmann::json::exception& e)
        {
            std::cerr << "ican: " << args[1] << ": " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
        catch (const ican::invalid_specification& e)
        {
            std::cerr << "ican: " << args[1] << ": " << e.what() << std::endl;
            return EXIT_FAILURE;
        }

        reg = &custom;
        args.erase(args.begin(), args.begin() + 2);
    }

    return run(args, *reg);
}
