#include "output_file.hpp"
#include "error.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace wlgen {
    namespace {
        auto last_os_error() -> std::error_code {
            return std::error_code { errno, std::system_category() };
        }
    }

    output_file::output_file(std::filesystem::path path, std::size_t buffer_size):
        path_ { std::move(path) },
        buffer_capacity_ { buffer_size == 0 ? 1 : buffer_size },
        fd_ { ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644) }
    {
        if(fd_ == invalid_handle) {
            throw io_exception(path_, last_os_error());
        }

        buffer_.reserve(buffer_capacity_);
        logger->debug("opened {} for writing, fd = {}", path_.string(), fd_);
    }

    output_file::~output_file() {
        try {
            close();
        } catch(io_exception const &e) {
            logger->error("unable to flush {} on close: {}", path_.string(), e.what());
            release();
        }
    }

    output_file::output_file(output_file &&other) {
        swap(other);
    }

    output_file &output_file::operator=(output_file &&other) {
        auto temp = output_file(std::move(other));
        swap(temp);
        return *this;
    }

    auto output_file::swap(output_file &other) -> void {
        using std::swap;

        swap(path_, other.path_);
        swap(buffer_, other.buffer_);
        swap(buffer_capacity_, other.buffer_capacity_);
        swap(bytes_written_, other.bytes_written_);
        swap(fd_, other.fd_);
    }

    auto output_file::append(std::string_view data) -> void {
        if(buffer_.size() + data.size() > buffer_capacity_) {
            flush();
        }

        if(data.size() >= buffer_capacity_) {
            write_fully(data.data(), data.size());
        } else {
            buffer_.insert(buffer_.end(), data.begin(), data.end());
        }
    }

    auto output_file::flush() -> void {
        if(buffer_.empty()) {
            return;
        }

        write_fully(buffer_.data(), buffer_.size());
        buffer_.clear();
    }

    auto output_file::close() -> void {
        if(fd_ == invalid_handle) {
            return;
        }

        flush();

        if(::close(fd_) != 0) {
            auto err = last_os_error();
            fd_ = invalid_handle;
            throw io_exception(path_, err);
        }

        logger->debug("closed {} after {} bytes", path_.string(), bytes_written_);
        fd_ = invalid_handle;
    }

    auto output_file::write_fully(char const *data, std::size_t len) -> void {
        if(fd_ == invalid_handle) {
            throw io_exception(path_, std::make_error_code(std::errc::bad_file_descriptor));
        }

        while(len > 0) {
            auto written = ::write(fd_, data, len);

            if(written < 0) {
                if(errno == EINTR) {
                    continue;
                }

                throw io_exception(path_, last_os_error());
            }

            if(written == 0) {
                throw io_exception(path_, std::make_error_code(std::errc::no_space_on_device));
            }

            data += written;
            len -= static_cast<std::size_t>(written);
            bytes_written_ += static_cast<std::uint64_t>(written);
        }
    }

    auto output_file::release() noexcept -> void {
        buffer_.clear();

        if(fd_ != invalid_handle) {
            ::close(fd_);
            fd_ = invalid_handle;
        }
    }
}
