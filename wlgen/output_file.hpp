#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace wlgen {
    /**
     * Append-only, buffered output file on top of a POSIX file descriptor.
     *
     * The file is created or truncated on construction. Appended data collects in a
     * memory buffer and is written out when the buffer is full, on flush() and on
     * destruction. Data is only ever written in whole appended pieces that have been
     * handed to append(), so a caller that appends complete lines never leaves a
     * partial line behind when it stops between appends.
     */
    class output_file {
    public:
        static constexpr int invalid_handle = -1;
        static constexpr std::size_t default_buffer_size = 64 * 1024;

        output_file() = default;

        /**
         * @throw io_exception if the file cannot be opened for writing
         */
        explicit output_file(std::filesystem::path path, std::size_t buffer_size = default_buffer_size);
        ~output_file();

        output_file(output_file const &) = delete;
        output_file(output_file &&other);

        output_file &operator=(output_file const &) = delete;
        output_file &operator=(output_file &&other);

        auto swap(output_file &other) -> void;

        auto append(std::string_view data) -> void;
        auto flush() -> void;

        /**
         * Flush and release the file descriptor.
         */
        auto close() -> void;

        [[nodiscard]] auto is_open() const noexcept { return fd_ != invalid_handle; }
        [[nodiscard]] auto path() const noexcept -> std::filesystem::path const & { return path_; }
        [[nodiscard]] auto bytes_written() const noexcept { return bytes_written_; }

    private:
        auto write_fully(char const *data, std::size_t len) -> void;
        auto release() noexcept -> void;

        std::filesystem::path path_;
        std::vector<char> buffer_;
        std::size_t buffer_capacity_ = default_buffer_size;
        std::uint64_t bytes_written_ = 0;
        int fd_ = invalid_handle;
    };

    inline auto swap(output_file &lhs, output_file &rhs) -> void {
        lhs.swap(rhs);
    }
}
