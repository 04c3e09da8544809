#include "options.hpp"
#include "error.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <iostream>

namespace wlgen {
    namespace {
        auto parse_log_level(std::string const &name) -> spdlog::level::level_enum {
            auto level = spdlog::level::from_str(name);

            // from_str maps unknown names to "off"
            enforce(level != spdlog::level::off || name == "off", errc::invalid_argument, fmt::format("unknown log level '{}'", name));

            return level;
        }
    }

    auto parse_command_line(int argc, char const *const *argv) -> std::optional<generator_options> {
        auto options = cxxopts::Options("wordlist_generator", "Generate every fixed-length combination over an alphabet");

        options.add_options()
            ("o,output", "output filename", cxxopts::value<std::string>()->default_value("wordlist.txt"))
            ("l,length", "combination length", cxxopts::value<std::int64_t>()->default_value("8"))
            ("s,sample", "write only the first N combinations", cxxopts::value<std::int64_t>())
            ("start", "rank of the first combination to write", cxxopts::value<std::int64_t>()->default_value("0"))
            ("digits", "symbols to use, in enumeration order", cxxopts::value<std::string>()->default_value("0123456789"))
            ("y,yes", "do not ask for confirmation before large runs")
            ("json", "print the summary as JSON")
            ("log-level", "trace, debug, info, warn, err, critical or off", cxxopts::value<std::string>()->default_value("warn"))
            ("h,help", "print usage")
            ;

        auto cmdline = options.parse(argc, argv);

        if(cmdline.count("help") != 0) {
            std::cout << options.help() << std::endl;
            return std::nullopt;
        }

        auto result = generator_options{};

        result.output = cmdline["output"].as<std::string>();
        result.alphabet = cmdline["digits"].as<std::string>();
        result.length = cmdline["length"].as<std::int64_t>();
        result.start = cmdline["start"].as<std::int64_t>();
        result.assume_yes = cmdline.count("yes") != 0;
        result.json = cmdline.count("json") != 0;
        result.log_level = parse_log_level(cmdline["log-level"].as<std::string>());

        if(cmdline.count("sample") != 0) {
            result.sample = cmdline["sample"].as<std::int64_t>();
        }

        enforce(!result.alphabet.empty(), errc::invalid_argument, "alphabet must not be empty");
        enforce(result.length >= 0, errc::invalid_argument, fmt::format("length must not be negative, got {}", result.length));
        enforce(result.start >= 0, errc::invalid_argument, fmt::format("start offset must not be negative, got {}", result.start));
        enforce(!result.sample || *result.sample >= 0, errc::invalid_argument, fmt::format("sample size must not be negative, got {}", result.sample.value_or(0)));
        enforce(!result.output.empty(), errc::invalid_argument, "output filename must not be empty");

        return result;
    }
}
