#include <filesystem>
#include <fstream>

#include <userver/fs/blocking/temp_directory.hpp>
#include <userver/utest/utest.hpp>

#include "artifact_store/artifact_store.hpp"
#include "category_encoding/category_encoding.hpp"
#include "feature_engineer/payment_features.hpp"

namespace fraud_fusion {

namespace {

std::size_t CountFiles(const std::string& directory) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

} // anonymous namespace

TEST(ArtifactStore, LogicalKeys) {
    EXPECT_EQ(ToString(ArtifactKey::kChampion), "primary");
    EXPECT_EQ(ToString(ArtifactKey::kBaseline), "logistic");
    EXPECT_EQ(ToString(ArtifactKey::kAnomalyDetector), "isolation_forest");
    EXPECT_EQ(ToString(ArtifactKey::kCategoryEncoder), "encoder");
    EXPECT_EQ(ToString(ArtifactKey::kSecondaryForest), "secondary_rf");
    EXPECT_EQ(ToString(ArtifactKey::kSecondaryAnomalyDetector), "secondary_isolation_forest");
}

TEST(ArtifactStore, ColumnsLiveNextToModel) {
    const ArtifactStore store("/models");
    EXPECT_EQ(store.ModelPath(ArtifactKey::kChampion), "/models/model_primary.json");
    EXPECT_EQ(store.ColumnsPath(ArtifactKey::kChampion), "/models/model_primary_columns.txt");
}

TEST(ArtifactStore, MessageRoundTripLeavesNoTemporaryFiles) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const ArtifactStore store(dir.GetPath() + "/nested");

    EXPECT_FALSE(store.Exists(ArtifactKey::kCategoryEncoder));
    const auto encoding = CategoryEncoding::Fit({"CASH_OUT", "TRANSFER"});
    store.WriteMessage(ArtifactKey::kCategoryEncoder, encoding.ToProto());
    EXPECT_TRUE(store.Exists(ArtifactKey::kCategoryEncoder));

    models::CategoryEncoding restored;
    ASSERT_TRUE(store.ReadMessage(ArtifactKey::kCategoryEncoder, restored));
    EXPECT_EQ(CategoryEncoding::FromProto(restored).Classes(), encoding.Classes());
    EXPECT_EQ(CountFiles(store.Directory()), 1u);
}

TEST(ArtifactStore, ReplaceOverwritesPreviousArtifact) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const ArtifactStore store(dir.GetPath());

    store.WriteMessage(ArtifactKey::kCategoryEncoder, CategoryEncoding::Fit({"A"}).ToProto());
    store.WriteMessage(ArtifactKey::kCategoryEncoder, CategoryEncoding::Fit({"B", "C"}).ToProto());

    models::CategoryEncoding restored;
    ASSERT_TRUE(store.ReadMessage(ArtifactKey::kCategoryEncoder, restored));
    EXPECT_EQ(restored.classes_size(), 2);
    EXPECT_EQ(restored.classes(0), "B");
}

TEST(ArtifactStore, FailedWriterKeepsOldFile) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const ArtifactStore store(dir.GetPath());
    store.WriteMessage(ArtifactKey::kCategoryEncoder, CategoryEncoding::Fit({"A"}).ToProto());

    EXPECT_THROW(store.Replace(ArtifactKey::kCategoryEncoder,
                               [](const std::string& path) {
                                   std::ofstream(path) << "partial";
                                   throw std::runtime_error("disk full");
                               }),
                 std::runtime_error);

    models::CategoryEncoding restored;
    ASSERT_TRUE(store.ReadMessage(ArtifactKey::kCategoryEncoder, restored));
    EXPECT_EQ(restored.classes(0), "A");
    EXPECT_EQ(CountFiles(store.Directory()), 1u);
}

TEST(ArtifactStore, ColumnsRoundTrip) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const ArtifactStore store(dir.GetPath());

    EXPECT_FALSE(store.ReadColumns(ArtifactKey::kChampion).has_value());
    store.WriteColumns(ArtifactKey::kChampion, PaymentFeatureNames());

    const auto columns = store.ReadColumns(ArtifactKey::kChampion);
    ASSERT_TRUE(columns.has_value());
    ASSERT_EQ(columns->size(), kPaymentFeatureCount);
    EXPECT_EQ(columns->front(), "type");
    EXPECT_EQ(columns->back(), "errorBalanceDest");
}

TEST(ArtifactStore, MissingMessageIsNotAnError) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const ArtifactStore store(dir.GetPath());
    models::LogisticModel proto;
    EXPECT_FALSE(store.ReadMessage(ArtifactKey::kBaseline, proto));
}

} // namespace fraud_fusion
