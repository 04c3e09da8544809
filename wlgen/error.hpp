#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace wlgen {
    enum class errc {
        invalid_argument = 1,
        io_failure,
        out_of_range
    };

    auto errc_description(errc err) noexcept -> char const *;

    class wlgen_exception: public std::runtime_error {
    public:
        wlgen_exception(errc err, std::string const &message):
            runtime_error(message),
            err_(err)
        {}

        auto error() const noexcept {
            return err_;
        }

    private:
        errc err_;
    };

    /**
     * Raised when the output sink cannot be opened or written. Carries the
     * operating system error that caused it.
     */
    class io_exception: public wlgen_exception {
    public:
        io_exception(std::filesystem::path path, std::error_code cause);

        auto cause() const noexcept -> std::error_code const & {
            return cause_;
        }

        auto path() const noexcept -> std::filesystem::path const & {
            return path_;
        }

    private:
        std::filesystem::path path_;
        std::error_code cause_;
    };

    inline auto enforce(bool condition, errc err, std::string const &message) -> void {
        if(!condition) {
            [[unlikely]] throw wlgen_exception(err, message);
        }
    }
}
