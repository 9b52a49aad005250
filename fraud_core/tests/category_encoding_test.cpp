#include <userver/utest/utest.hpp>

#include "category_encoding/category_encoding.hpp"

namespace fraud_fusion {

TEST(CategoryEncoding, CodesFollowLexicographicOrder) {
    const auto encoding = CategoryEncoding::Fit({"TRANSFER", "CASH_OUT", "TRANSFER", "CASH_IN"});

    const std::vector<std::string> expected = {"CASH_IN", "CASH_OUT", "TRANSFER"};
    EXPECT_EQ(encoding.Classes(), expected);
    EXPECT_EQ(encoding.Find("CASH_IN").value_or(-1), 0);
    EXPECT_EQ(encoding.Find("CASH_OUT").value_or(-1), 1);
    EXPECT_EQ(encoding.Find("TRANSFER").value_or(-1), 2);
}

TEST(CategoryEncoding, UnknownLabel) {
    const auto encoding = CategoryEncoding::Fit({"CASH_OUT", "TRANSFER"});

    EXPECT_FALSE(encoding.Find("DEBIT").has_value());
    EXPECT_EQ(encoding.EncodeOrDefault("DEBIT"), kDefaultCategoryCode);
    EXPECT_EQ(encoding.EncodeOrDefault(""), kDefaultCategoryCode);
    EXPECT_EQ(encoding.EncodeOrDefault("TRANSFER"), 1);
}

TEST(CategoryEncoding, ProtoKeepsCodes) {
    const auto encoding = CategoryEncoding::Fit({"TRANSFER", "CASH_OUT"});
    const auto restored = CategoryEncoding::FromProto(encoding.ToProto());

    EXPECT_EQ(restored.Classes(), encoding.Classes());
    EXPECT_EQ(restored.ToProto().default_code(), kDefaultCategoryCode);
}

TEST(CategoryEncoding, RejectsUnsortedArtifact) {
    models::CategoryEncoding proto;
    proto.add_classes("TRANSFER");
    proto.add_classes("CASH_OUT");
    EXPECT_THROW(CategoryEncoding::FromProto(proto), std::invalid_argument);
}

} // namespace fraud_fusion
