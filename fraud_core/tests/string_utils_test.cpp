#include <userver/utest/utest.hpp>

#include "utils/string_utils.hpp"

namespace fraud_fusion {

TEST(StringUtils, Trim) {
    EXPECT_EQ(utils::Trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(utils::Trim("TRANSFER"), "TRANSFER");
    EXPECT_EQ(utils::Trim("\tamount\r"), "amount");
    EXPECT_EQ(utils::Trim(""), "");
    EXPECT_EQ(utils::Trim(" \t\r\n "), "");
}

} // namespace fraud_fusion
