#include <gtest/gtest.h>
#include "../../base/getenv.hpp"

#include <cstdlib>

TEST(GetenvTest, missing_variable_returns_default) {
    unsetenv("APROTO_TEST_MISSING");
    EXPECT_EQ(17, base::getenv<int>("APROTO_TEST_MISSING", 17));
    EXPECT_EQ("x", base::getenv<std::string>("APROTO_TEST_MISSING", "x"));
    EXPECT_FALSE(base::getenv_raw("APROTO_TEST_MISSING").has_value());
}

TEST(GetenvTest, parses_values) {
    setenv("APROTO_TEST_INT", "4096", 1);
    setenv("APROTO_TEST_BOOL", "Yes", 1);
    setenv("APROTO_TEST_STR", "debug", 1);
    EXPECT_EQ(4096u, base::getenv<uint64_t>("APROTO_TEST_INT"));
    EXPECT_TRUE(base::getenv<bool>("APROTO_TEST_BOOL"));
    EXPECT_EQ("debug", base::getenv<std::string>("APROTO_TEST_STR"));
    unsetenv("APROTO_TEST_INT");
    unsetenv("APROTO_TEST_BOOL");
    unsetenv("APROTO_TEST_STR");
}

TEST(GetenvTest, malformed_integer_returns_default) {
    setenv("APROTO_TEST_INT", "12abc", 1);
    EXPECT_EQ(5, base::getenv<int>("APROTO_TEST_INT", 5));
    setenv("APROTO_TEST_INT", "300", 1);
    EXPECT_EQ(1, base::getenv<uint8_t>("APROTO_TEST_INT", 1));
    unsetenv("APROTO_TEST_INT");
}
