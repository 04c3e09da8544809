#include "error.hpp"

#include <fmt/format.h>

#include <utility>

namespace wlgen {
    auto errc_description(errc err) noexcept -> char const * {
        switch(err) {
        case errc::invalid_argument: return "invalid argument";
        case errc::io_failure:       return "I/O failure";
        case errc::out_of_range:     return "value out of range";
        }

        return "unknown error";
    }

    io_exception::io_exception(std::filesystem::path path, std::error_code cause):
        wlgen_exception(errc::io_failure, fmt::format("{}: {}", path.string(), cause.message())),
        path_ { std::move(path) },
        cause_ { cause }
    {}
}
