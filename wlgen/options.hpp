#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace wlgen {
    struct generator_options {
        std::filesystem::path output = "wordlist.txt";
        std::string alphabet = "0123456789";
        std::int64_t length = 8;
        std::optional<std::int64_t> sample;
        std::int64_t start = 0;
        bool assume_yes = false;
        bool json = false;
        spdlog::level::level_enum log_level = spdlog::level::warn;

        // full runs larger than this ask for confirmation
        std::uint64_t confirm_threshold = 1'000'000;
    };

    /**
     * Parses the command line. Returns nullopt if the help text was requested, in which
     * case it has already been printed to stdout.
     *
     * @throw wlgen_exception invalid_argument for values that are out of range
     */
    auto parse_command_line(int argc, char const *const *argv) -> std::optional<generator_options>;
}
