#pragma once

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {
    /**
     * Unique path in the temp directory that is removed again when the object goes away.
     */
    class scratch_file {
    public:
        scratch_file():
            path_ { make_path() }
        {}

        ~scratch_file() {
            auto ec = std::error_code{};
            std::filesystem::remove(path_, ec);
        }

        scratch_file(scratch_file const &) = delete;
        scratch_file &operator=(scratch_file const &) = delete;

        auto path() const -> std::filesystem::path const & { return path_; }

        auto contents() const -> std::string {
            auto in = std::ifstream(path_, std::ios::binary);
            auto buf = std::ostringstream{};
            buf << in.rdbuf();
            return buf.str();
        }

        auto lines() const -> std::vector<std::string> {
            auto in = std::ifstream(path_);
            auto result = std::vector<std::string>{};

            for(auto line = std::string{}; std::getline(in, line); ) {
                result.push_back(line);
            }

            return result;
        }

    private:
        static auto make_path() -> std::filesystem::path {
            static std::atomic<int> counter { 0 };

            auto name = "wlgen_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".txt";
            return std::filesystem::temp_directory_path() / name;
        }

        std::filesystem::path path_;
    };
}
