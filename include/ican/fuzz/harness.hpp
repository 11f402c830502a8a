#pragma once

#include "FuzzedDataProvider.h" // (convenience to targets)
#include <cstddef>              // size_t
#include <cstdint>              // uint8_t
#include <cstdlib>              // EXIT_SUCCESS, EXIT_FAILURE
#include <dirent.h>             // readdir, opendir
#include <fstream>              // ifstream, ofstream
#include <iostream>             // cerr, cout, endl
#include <iterator>             // istreambuf_iterator
#include <string>               // string
#include <vector>               // vector
#include <nlohmann/json.hpp>    // nlohmann::json

#ifndef ICAN_FUZZ_NODOCTEST
#define DOCTEST_CONFIG_IMPLEMENT
#define DOCTEST_CONFIG_SUPER_FAST_ASSERTS
#include <doctest/doctest.h> // TEST_CASE, CAPTURE, CHECK_EQ, doctest::Context
#else
#define TEST_CASE(f) void ican_fuzz_unused_1() { #f; } void ican_fuzz_unused_2()
#define CAPTURE(x)
#define CHECK_EQ(x, y)
#endif

#ifndef ICAN_FUZZ_NOFUZZER
// entry point of libFuzzer
extern "C" int LLVMFuzzerRunDriver(int* argc, char*** argv, int (*UserCb)(const uint8_t* Data, size_t Size));
#endif

namespace ican {
namespace fuzz {

// defined by ICAN_FUZZ_MAIN
int fuzz_entry(const std::uint8_t* data, std::size_t size);

namespace corpus {

/*!
 * @brief list the regular files of a corpus directory
 * @param[in] directory corpus directory
 * @param[out] filenames file names
 * @return whether the directory could be opened
 */
inline bool files(const std::string& directory, std::vector<std::string>& filenames)
{
    DIR* dir = opendir(directory.c_str());
    if (dir == nullptr)
    {
        std::cerr << "ican_fuzz: cannot open corpus directory '" << directory << "'" << std::endl;
        return false;
    }

    filenames.clear();
    while (const struct dirent* item = readdir(dir))
    {
        if (item->d_type == DT_REG)
        {
            filenames.push_back(directory + "/" + item->d_name);
        }
    }
    closedir(dir);

    return true;
}

/*!
 * @brief read a corpus file
 * @param[in] filename file to read
 * @param[out] bytes file content
 * @return whether the file could be read
 */
inline bool read(const std::string& filename, std::vector<std::uint8_t>& bytes)
{
    std::ifstream file(filename, std::ios::binary);
    if (not file)
    {
        std::cerr << "ican_fuzz: cannot open corpus file '" << filename << "'" << std::endl;
        return false;
    }

    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

/// abbreviate a corpus file name (a SHA-1 written by libFuzzer) to 7 characters
inline std::string short_hash(const std::string& filename)
{
    auto slash = filename.find_last_of('/');
    slash = (slash == std::string::npos) ? 0 : slash + 1;
    return filename.substr(slash, 7);
}

} // namespace corpus

/*!
 * @brief a fuzz target over one engine operation
 *
 * A target turns raw fuzzer bytes into a structured input and runs the
 * operation on it. The same target can dump a corpus as JSON records
 * {input, output, hash} and replay such a file as a doctest suite, so a
 * fuzzing session becomes a regression test.
 *
 * @tparam Input input type, convertible from and to nlohmann::json
 * @tparam Output output type, convertible from and to nlohmann::json
 */
template <class Input, class Output>
class target
{
  public:
    using input_t = Input;
    using output_t = Output;

    virtual ~target() = default;

    /*!
     * @brief create an input from fuzzer bytes
     * @param[in] data input bytes
     * @param[in] size number of bytes in @a data
     */
    virtual input_t input_from_bytes(const std::uint8_t* data, std::size_t size) = 0;

    /*!
     * @brief run the operation under test
     * @param[in] input the input
     * @return the observable result
     */
    virtual output_t run(const input_t& input) = 0;

    void fuzz(const std::uint8_t* data, std::size_t size)
    {
        static_cast<void>(run(input_from_bytes(data, size)));
    }

    /*!
     * @brief dispatch the command line
     * @param argc number of arguments
     * @param argv arguments
     * @return process exit code
     */
    int main(int argc, char** argv)
    {
        const std::string command = argc >= 2 ? argv[1] : "";

#ifndef ICAN_FUZZ_NOFUZZER
        if (command == "--fuzz")
        {
            return LLVMFuzzerRunDriver(&argc, &argv, fuzz_entry);
        }
#endif

        std::vector<std::string> filenames;

        if (command == "--test" and argc >= 3)
        {
            return corpus::files(argv[2], filenames) and test(filenames) ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (command == "--dump" and argc >= 3)
        {
            nlohmann::json records;
            if (not corpus::files(argv[2], filenames) or not dump(filenames, records))
            {
                return EXIT_FAILURE;
            }

            if (argc == 3)
            {
                write(records, std::cout);
                return EXIT_SUCCESS;
            }

            std::ofstream out(argv[3]);
            if (not out)
            {
                std::cerr << "ican_fuzz: cannot write '" << argv[3] << "'" << std::endl;
                return EXIT_FAILURE;
            }
            write(records, out);
            return out ? EXIT_SUCCESS : EXIT_FAILURE;
        }

#ifndef ICAN_FUZZ_NODOCTEST
        if (command == "--check" and argc >= 3)
        {
            std::ifstream in(argv[2]);
            if (not in)
            {
                std::cerr << "ican_fuzz: cannot open '" << argv[2] << "'" << std::endl;
                return EXIT_FAILURE;
            }
            recorded() = nlohmann::json::parse(in);

            doctest::Context context;
            context.applyCommandLine(argc, argv);
            return context.run();
        }
#endif

        if (command == "--help")
        {
            usage(argv[0]);
            return EXIT_SUCCESS;
        }

        std::cerr << "ican_fuzz: unknown or missing argument; call '" << argv[0] << " --help' for more information."
                  << std::endl;
        return EXIT_FAILURE;
    }

    /// replay the recorded corpus, checking every output
    void check()
    {
        for (const auto& record : recorded())
        {
            const auto input = record.at("input").get<input_t>();
            const auto expected = record.at("output").get<output_t>();
            CAPTURE(record.at("input").dump());
            CAPTURE(record.at("hash").get<std::string>());
            CHECK_EQ(nlohmann::json(run(input)), nlohmann::json(expected));
        }
    }

  private:
    // corpus parsed for --check
    static nlohmann::json& recorded()
    {
        static nlohmann::json records = nlohmann::json::array();
        return records;
    }

    static void usage(const char* program)
    {
        std::cerr << "usage: " << program << " ARGUMENTS\n\n"
                  << "ICAN fuzz target - fuzzing and corpus regression tests\n\n"
                  << "arguments:\n"
                     "  --help                                   show this help message and exit\n"
#ifndef ICAN_FUZZ_NOFUZZER
                     "  --fuzz [LIBFUZZER_OPTION...]             run libFuzzer\n"
#endif
                     "  --dump CORPUS_DIRECTORY [CORPUS_FILE]    dump the corpus as JSON records\n"
                     "  --test CORPUS_DIRECTORY                  run the target on every corpus file\n"
#ifndef ICAN_FUZZ_NODOCTEST
                     "  --check CORPUS_FILE [DOCTEST_OPTION...]  replay a dumped corpus as test suite\n"
#endif
                  << std::endl;
    }

    bool test(const std::vector<std::string>& filenames)
    {
        std::vector<std::uint8_t> bytes;
        for (const auto& filename : filenames)
        {
            if (not corpus::read(filename, bytes))
            {
                return false;
            }
            static_cast<void>(run(input_from_bytes(bytes.data(), bytes.size())));
        }
        return true;
    }

    // collect all records first so a failed read writes nothing
    bool dump(const std::vector<std::string>& filenames, nlohmann::json& records)
    {
        std::vector<std::uint8_t> bytes;
        records = nlohmann::json::array();

        for (const auto& filename : filenames)
        {
            if (not corpus::read(filename, bytes))
            {
                return false;
            }

            const input_t input = input_from_bytes(bytes.data(), bytes.size());
            const nlohmann::json record = {{"input", input},
                                           {"output", run(input)},
                                           {"hash", corpus::short_hash(filename)}};
            records.push_back(record);
        }
        return true;
    }

    // one record per line
    static void write(const nlohmann::json& records, std::ostream& os)
    {
        os << "[\n";
        for (std::size_t i = 0; i < records.size(); ++i)
        {
            os << "  " << records[i].dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
               << (i + 1 != records.size() ? ",\n" : "\n");
        }
        os << "]" << std::endl;
    }
};

} // namespace fuzz
} // namespace ican

/// define libFuzzer glue, the corpus test case and main() for a target class
#define ICAN_FUZZ_MAIN(CLASS_NAME)                                    \
    namespace ican {                                                  \
    namespace fuzz {                                                  \
    int fuzz_entry(const std::uint8_t* data, std::size_t size)        \
    {                                                                 \
        CLASS_NAME instance;                                          \
        instance.fuzz(data, size);                                    \
        return 0;                                                     \
    }                                                                 \
    }                                                                 \
    }                                                                 \
                                                                      \
    TEST_CASE(#CLASS_NAME)                                            \
    {                                                                 \
        CLASS_NAME instance;                                          \
        instance.check();                                             \
    }                                                                 \
                                                                      \
    int main(int argc, char** argv)                                   \
    {                                                                 \
        CLASS_NAME instance;                                          \
        return instance.main(argc, argv);                             \
    }

#ifdef DOCTEST_CONFIG_IMPLEMENT
#undef DOCTEST_CONFIG_IMPLEMENT
#endif
#ifdef DOCTEST_CONFIG_SUPER_FAST_ASSERTS
#undef DOCTEST_CONFIG_SUPER_FAST_ASSERTS
#endif
