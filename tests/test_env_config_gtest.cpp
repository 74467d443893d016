#include <gtest/gtest.h>

#include <stdlib.h>
#include <stdexcept>
#include <string>

#include "env_config.hpp"

TEST(EnvConfigTest, RequiredAndFallback) {
    ::unsetenv("QUOTE_EXTRACT_TEST_VAR");
    EXPECT_THROW(getenv_valid("QUOTE_EXTRACT_TEST_VAR"), std::runtime_error);
    EXPECT_EQ(getenv_or("QUOTE_EXTRACT_TEST_VAR", "dflt"), "dflt");

    ::setenv("QUOTE_EXTRACT_TEST_VAR", "value", 1);
    EXPECT_EQ(getenv_valid("QUOTE_EXTRACT_TEST_VAR"), "value");
    EXPECT_EQ(getenv_or("QUOTE_EXTRACT_TEST_VAR", "dflt"), "value");
    ::unsetenv("QUOTE_EXTRACT_TEST_VAR");
}
