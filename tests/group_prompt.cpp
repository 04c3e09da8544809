#include <wlgen/prompt.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <utility>

TEST(wlgen_prompt, accepts_only_yes) {
    for(auto [answer, expected] : { std::pair { "y\n", true }, std::pair { "Y\n", true },
                                    std::pair { "n\n", false }, std::pair { "\n", false },
                                    std::pair { "yes\n", false }, std::pair { "", false } }) {
        auto console = std::ostringstream{};
        auto in = std::istringstream { answer };

        EXPECT_EQ(wlgen::confirm(console, in, "Continue?"), expected) << "answer '" << answer << "'";
    }
}

TEST(wlgen_prompt, writes_only_to_console) {
    auto console = std::ostringstream{};
    auto in = std::istringstream { "y\n" };

    EXPECT_TRUE(wlgen::confirm(console, in, "This will generate 10 combinations. Continue?"));
    EXPECT_EQ(console.str(), "This will generate 10 combinations. Continue? (y/N): ");
}
