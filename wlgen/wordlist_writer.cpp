#include "wordlist_writer.hpp"
#include "logger.hpp"

#include <limits>
#include <string>

namespace wlgen {
    auto write_combinations(
        std::filesystem::path const &path,
        combination_range const &sequence,
        write_options const &options
    ) -> write_result {
        auto const planned = sequence.size_hint();
        auto const interval = options.progress_interval;

        logger->info("writing up to {} combinations of length {} starting at rank {} to {}",
                     planned, sequence.length(), sequence.first_rank(), path.string());

        auto out = output_file { path, options.buffer_size };
        auto result = write_result{};
        auto line = std::string{};

        line.reserve(sequence.length() + 1);

        for(auto const &combination : sequence) {
            if(options.stop_requested && options.stop_requested()) {
                result.status = write_status::interrupted;
                break;
            }

            // one append per line, so a flush never splits it
            line.assign(combination);
            line += '\n';
            out.append(line);
            ++result.written;

            if(options.progress && interval != 0 && result.written % interval == 0) {
                options.progress(result.written, planned);
            }
        }

        out.close();

        if(result.status == write_status::interrupted) {
            logger->warn("interrupted after {} combinations", result.written);
        } else {
            logger->info("wrote {} combinations ({} bytes)", result.written, out.bytes_written());
        }

        return result;
    }

    auto estimated_output_size(std::uint64_t count, std::size_t length) noexcept -> std::uint64_t {
        constexpr auto max = std::numeric_limits<std::uint64_t>::max();
        auto const line = static_cast<std::uint64_t>(length) + 1;

        if(line == 0 || count > max / line) {
            return max;
        }

        return count * line;
    }
}
