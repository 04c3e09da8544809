#include <wlgen/error.hpp>
#include <wlgen/output_file.hpp>

#include "scratch_file.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

TEST(wlgen_output_file, buffers_until_flush) {
    auto file = scratch_file{};
    auto out = wlgen::output_file { file.path(), 16 };

    EXPECT_TRUE(out.is_open());

    out.append("hello\n");
    EXPECT_EQ(file.contents(), "");
    EXPECT_EQ(out.bytes_written(), 0);

    out.flush();
    EXPECT_EQ(file.contents(), "hello\n");
    EXPECT_EQ(out.bytes_written(), 6);
}

TEST(wlgen_output_file, writes_when_buffer_is_full) {
    auto file = scratch_file{};
    auto out = wlgen::output_file { file.path(), 8 };

    out.append("abcd\n");
    out.append("efgh\n");

    // the second append did not fit, so the first one went out whole
    EXPECT_EQ(file.contents(), "abcd\n");

    out.append(std::string(20, 'x'));
    EXPECT_EQ(file.contents(), "abcd\nefgh\n" + std::string(20, 'x'));
}

TEST(wlgen_output_file, flushes_on_destruction) {
    auto file = scratch_file{};

    {
        auto out = wlgen::output_file { file.path() };
        out.append("line\n");
    }

    EXPECT_EQ(file.contents(), "line\n");
}

TEST(wlgen_output_file, close_is_idempotent) {
    auto file = scratch_file{};
    auto out = wlgen::output_file { file.path() };

    out.append("x\n");
    out.close();
    EXPECT_FALSE(out.is_open());
    out.close();

    EXPECT_EQ(file.contents(), "x\n");
    EXPECT_THROW(out.append(std::string(wlgen::output_file::default_buffer_size, 'y')), wlgen::io_exception);
}

TEST(wlgen_output_file, truncates_existing_file) {
    auto file = scratch_file{};

    {
        auto out = wlgen::output_file { file.path() };
        out.append("a much longer first version\n");
    }
    {
        auto out = wlgen::output_file { file.path() };
        out.append("short\n");
    }

    EXPECT_EQ(file.contents(), "short\n");
}

TEST(wlgen_output_file, move) {
    auto file = scratch_file{};
    auto out = wlgen::output_file { file.path() };

    out.append("moved\n");

    auto other = std::move(out);

    EXPECT_FALSE(out.is_open());
    EXPECT_TRUE(other.is_open());
    EXPECT_EQ(other.path().string(), file.path().string());

    other.close();
    EXPECT_EQ(file.contents(), "moved\n");
}

TEST(wlgen_output_file, open_failure) {
    auto file = scratch_file{};
    auto path = file.path() / "missing" / "out.txt";

    EXPECT_THROW(wlgen::output_file { path }, wlgen::io_exception);
}
