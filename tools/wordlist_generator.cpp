#include <wlgen/combination_enumerator.hpp>
#include <wlgen/error.hpp>
#include <wlgen/format.hpp>
#include <wlgen/interrupt.hpp>
#include <wlgen/logger.hpp>
#include <wlgen/options.hpp>
#include <wlgen/prompt.hpp>
#include <wlgen/wordlist_writer.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

namespace {
    auto print_banner(wlgen::generator_options const &opts, wlgen::combination_range const &window) -> void {
        auto domain = wlgen::checked_power(opts.alphabet.size(), static_cast<std::size_t>(opts.length));
        auto total_text = domain
            ? wlgen::format_count(*domain)
            : "more than " + wlgen::format_count(std::numeric_limits<std::uint64_t>::max());

        fmt::print("Wordlist Generator\n");
        fmt::print("==================\n");
        fmt::print("Digits: {}\n", opts.alphabet);
        fmt::print("Length: {}\n", opts.length);
        fmt::print("Total combinations: {}\n", total_text);

        if(opts.start != 0 || opts.sample) {
            fmt::print("Writing: {} starting at rank {}\n", wlgen::format_count(window.size_hint()), opts.start);
        }

        fmt::print("Output file: {}\n\n", opts.output.string());

        auto estimated = wlgen::estimated_output_size(window.size_hint(), window.length());
        fmt::print("Estimated file size: {}\n\n", wlgen::format_file_size(estimated));
    }

    auto print_progress(std::uint64_t current, std::uint64_t total) -> void {
        auto percentage = total == 0 ? 100.0 : static_cast<double>(current) * 100.0 / static_cast<double>(total);

        fmt::print("\rProgress: {}/{} ({:.2f}%)", wlgen::format_count(current), wlgen::format_count(total), percentage);
        std::fflush(stdout);
    }

    auto file_size_or_zero(std::filesystem::path const &path) -> std::uintmax_t {
        auto ec = std::error_code{};
        auto size = std::filesystem::file_size(path, ec);

        if(ec) {
            wlgen::logger->warn("unable to determine size of {}: {}", path.string(), ec.message());
            return 0;
        }

        return size;
    }

    auto run(wlgen::generator_options const &opts) -> int {
        auto window = wlgen::skip(wlgen::produce(opts.alphabet, opts.length), opts.start);

        if(opts.sample) {
            window = wlgen::take(window, *opts.sample);
        }

        if(!opts.json) {
            print_banner(opts, window);
        }

        // stdout carries the JSON document, so the prompt must not go there
        auto &console = opts.json ? std::cerr : std::cout;

        if(!opts.sample && !opts.assume_yes && window.size_hint() > opts.confirm_threshold) {
            auto question = fmt::format("This will generate {} combinations. Continue?", wlgen::format_count(window.size_hint()));

            if(!wlgen::confirm(console, std::cin, question)) {
                console << "Operation cancelled." << std::endl;
                return 0;
            }
        }

        auto interrupt = wlgen::interrupt_handler{};
        auto write_opts = wlgen::write_options{};

        write_opts.stop_requested = [&interrupt] { return interrupt.requested(); };

        if(!opts.json) {
            write_opts.progress = print_progress;
            fmt::print("Generating wordlist...\n");
        }

        auto start = std::chrono::steady_clock::now();
        auto result = wlgen::write_combinations(opts.output, window, write_opts);
        auto end = std::chrono::steady_clock::now();

        auto elapsed = std::chrono::duration<double>(end - start);
        auto file_size = file_size_or_zero(opts.output);
        auto interrupted = result.status == wlgen::write_status::interrupted;

        if(opts.json) {
            auto json = nlohmann::json{
                { "output", opts.output.string() },
                { "alphabet", opts.alphabet },
                { "length", opts.length },
                { "start", opts.start },
                { "written", result.written },
                { "interrupted", interrupted },
                { "elapsed_s", elapsed.count() },
                { "file_size_bytes", file_size }
            };

            std::cout << json.dump(4) << std::endl;
            return 0;
        }

        if(interrupted) {
            fmt::print("\n\nGeneration interrupted by user after {} combinations.\n", wlgen::format_count(result.written));
            fmt::print("Output file: {} ({})\n", opts.output.string(), wlgen::format_file_size(file_size));
            return 0;
        }

        fmt::print("\n\nSuccessfully generated {} combinations!\n", wlgen::format_count(result.written));
        fmt::print("Time elapsed: {:.2f} seconds\n", elapsed.count());
        fmt::print("Output file: {}\n", opts.output.string());
        fmt::print("File size: {}\n", wlgen::format_file_size(file_size));

        return 0;
    }
}

int main(int argc, char *argv[]) try {
    auto opts = wlgen::parse_command_line(argc, argv);

    if(!opts) {
        return 0;
    }

    wlgen::logger->set_level(opts->log_level);

    return run(*opts);
} catch(wlgen::io_exception const &e) {
    wlgen::logger->error("I/O error on {}: {}", e.path().string(), e.cause().message());
    return 1;
} catch(wlgen::wlgen_exception const &e) {
    wlgen::logger->error("{}: {}", wlgen::errc_description(e.error()), e.what());
    return 1;
} catch(std::exception const &e) {
    wlgen::logger->error("error: {}", e.what());
    return 1;
}
