#pragma once

#include "combination_enumerator.hpp"
#include "output_file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace wlgen {
    enum class write_status {
        completed,
        interrupted
    };

    struct write_result {
        std::uint64_t written = 0;
        write_status status = write_status::completed;
    };

    /**
     * @param current number of combinations written so far
     * @param total number of combinations the run will write, i.e. the size of the
     *        skip/take window rather than the whole combination domain
     */
    using progress_callback = std::function<void(std::uint64_t current, std::uint64_t total)>;
    using stop_predicate = std::function<bool()>;

    struct write_options {
        std::uint64_t progress_interval = 10'000;
        progress_callback progress;
        stop_predicate stop_requested;
        std::size_t buffer_size = output_file::default_buffer_size;
    };

    /**
     * Writes every combination of the sequence to the file at path, one per line.
     *
     * The stop predicate is polled between combinations; once it returns true the loop
     * ends, the file is flushed and closed, and the result is marked interrupted. The
     * file then holds exactly the lines counted in the result.
     *
     * @throw io_exception if the file cannot be opened or written. Lines written up to
     *        that point stay in the file.
     */
    auto write_combinations(
        std::filesystem::path const &path,
        combination_range const &sequence,
        write_options const &options = {}
    ) -> write_result;

    /**
     * Size in bytes of a file holding count combinations of the given length, saturated
     * at the largest 64-bit value.
     */
    auto estimated_output_size(std::uint64_t count, std::size_t length) noexcept -> std::uint64_t;
}
