#pragma once

#include <cstdint>
#include <string>

namespace wlgen {
    /**
     * Human readable size with two decimals, e.g. 1536 -> "1.50 KB".
     */
    auto format_file_size(std::uint64_t bytes) -> std::string;

    /**
     * Decimal number with thousands separators, e.g. 1000000 -> "1,000,000".
     */
    auto format_count(std::uint64_t count) -> std::string;
}
