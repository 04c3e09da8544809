#include "format.hpp"

#include <fmt/format.h>

#include <array>
#include <string_view>

namespace wlgen {
    auto format_file_size(std::uint64_t bytes) -> std::string {
        constexpr auto units = std::array<std::string_view, 6> { "B", "KB", "MB", "GB", "TB", "PB" };

        auto size = static_cast<double>(bytes);
        auto unit = std::size_t{0};

        while(size >= 1024.0 && unit + 1 < units.size()) {
            size /= 1024.0;
            ++unit;
        }

        return fmt::format("{:.2f} {}", size, units[unit]);
    }

    auto format_count(std::uint64_t count) -> std::string {
        auto digits = fmt::format("{}", count);
        auto result = std::string{};

        result.reserve(digits.size() + digits.size() / 3);

        for(std::size_t i = 0; i < digits.size(); ++i) {
            if(i != 0 && (digits.size() - i) % 3 == 0) {
                result += ',';
            }

            result += digits[i];
        }

        return result;
    }
}
