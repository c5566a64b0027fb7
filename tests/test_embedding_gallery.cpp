#include <gtest/gtest.h>
#include "core/attendance_errors.h"
#include "recognition/embedding_gallery.h"
#include "test_support.h"
#include <cmath>
#include <limits>
#include <stdexcept>

class EmbeddingGalleryTest : public ::testing::Test {
protected:
    void SetUp() override {
        gallery_ = std::make_unique<EmbeddingGallery>(3, &storage_);
    }

    MemoryAttendanceStorage storage_;
    std::unique_ptr<EmbeddingGallery> gallery_;
};

// Test adding embeddings persists and counts per identity
TEST_F(EmbeddingGalleryTest, AddPersistsAndCounts) {
    EXPECT_EQ(gallery_->add("Alice", {{0.1f, 0.2f, 0.3f}, {0.1f, 0.2f, 0.4f}}), 2u);
    EXPECT_EQ(gallery_->add("Bob", {{0.9f, 0.9f, 0.9f}}), 1u);
    EXPECT_EQ(gallery_->add("Alice", {{0.1f, 0.2f, 0.5f}}), 1u);

    EXPECT_EQ(gallery_->size(), 4u);
    EXPECT_EQ(gallery_->identityCount(), 2u);
    EXPECT_TRUE(gallery_->contains("Alice"));
    EXPECT_FALSE(gallery_->contains("Carol"));
    EXPECT_EQ(storage_.gallery.entries.size(), 4u);
    EXPECT_EQ(storage_.saveCalls, 3u);

    auto stats = gallery_->statistics();
    ASSERT_EQ(stats.identityCounts.size(), 2u);
    EXPECT_EQ(stats.identityCounts[0].first, "Alice");
    EXPECT_EQ(stats.identityCounts[0].second, 3u);
    EXPECT_EQ(stats.identityCounts[1].first, "Bob");
    EXPECT_EQ(stats.totalEmbeddings, 4u);
    EXPECT_EQ(stats.dimension, 3u);
}

// Test a wrong-length vector rejects the whole batch
TEST_F(EmbeddingGalleryTest, DimensionMismatchAddsNothing) {
    EXPECT_THROW(gallery_->add("Alice", {{0.1f, 0.2f, 0.3f}, {0.1f, 0.2f}}),
                 DimensionMismatchError);
    EXPECT_EQ(gallery_->size(), 0u);
    EXPECT_EQ(storage_.saveCalls, 0u);
}

// Test invalid labels and non-finite values are rejected
TEST_F(EmbeddingGalleryTest, InvalidInputRejected) {
    EXPECT_THROW(gallery_->add("", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
    EXPECT_THROW(gallery_->add("A|B", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
    EXPECT_THROW(gallery_->add("Alice ", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
    EXPECT_THROW(gallery_->add("\tAlice", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
    float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(gallery_->add("Alice", {{nan, 0.2f, 0.3f}}), std::invalid_argument);
    EXPECT_EQ(gallery_->size(), 0u);
}

// Test removal deletes every embedding of the label
TEST_F(EmbeddingGalleryTest, RemoveIdentity) {
    gallery_->add("Alice", {{0.1f, 0.2f, 0.3f}, {0.1f, 0.2f, 0.4f}});
    gallery_->add("Bob", {{0.9f, 0.9f, 0.9f}});

    EXPECT_EQ(gallery_->remove("Alice"), 2u);
    EXPECT_FALSE(gallery_->contains("Alice"));
    EXPECT_EQ(gallery_->size(), 1u);
    EXPECT_EQ(storage_.gallery.entries.size(), 1u);

    EXPECT_EQ(gallery_->remove("Nobody"), 0u);
    EXPECT_EQ(gallery_->size(), 1u);
}

// Test a failed save leaves the in-memory gallery unchanged
TEST_F(EmbeddingGalleryTest, FailedSaveLeavesGalleryUntouched) {
    gallery_->add("Alice", {{0.1f, 0.2f, 0.3f}});
    storage_.failSave = true;

    EXPECT_THROW(gallery_->add("Bob", {{0.9f, 0.9f, 0.9f}}), PersistenceError);
    EXPECT_THROW(gallery_->remove("Alice"), PersistenceError);
    EXPECT_EQ(gallery_->size(), 1u);
    EXPECT_TRUE(gallery_->contains("Alice"));
    EXPECT_FALSE(gallery_->contains("Bob"));
}

// Test optimize keeps the oldest embeddings up to the bound
TEST_F(EmbeddingGalleryTest, OptimizeKeepsOldestPerIdentity) {
    gallery_->add("Alice", {{1, 0, 0}, {2, 0, 0}, {3, 0, 0}, {4, 0, 0}});
    gallery_->add("Bob", {{0, 1, 0}});

    auto result = gallery_->optimize(2);
    EXPECT_EQ(result.embeddingsBefore, 5u);
    EXPECT_EQ(result.embeddingsAfter, 3u);
    EXPECT_EQ(result.identitiesTrimmed, 1u);

    auto snapshot = gallery_->snapshot();
    ASSERT_EQ(snapshot.entries.size(), 3u);
    EXPECT_FLOAT_EQ(snapshot.entries[0].embedding[0], 1.0f);
    EXPECT_FLOAT_EQ(snapshot.entries[1].embedding[0], 2.0f);
    EXPECT_EQ(snapshot.entries[2].label, "Bob");

    EXPECT_THROW(gallery_->optimize(0), std::invalid_argument);
}

// Test a second optimize with the same bound changes nothing
TEST_F(EmbeddingGalleryTest, OptimizeIsIdempotent) {
    gallery_->add("Alice", {{1, 0, 0}, {2, 0, 0}, {3, 0, 0}});
    gallery_->add("Bob", {{0, 1, 0}, {0, 2, 0}});

    auto first = gallery_->optimize(1);
    EXPECT_EQ(first.embeddingsAfter, 2u);
    EXPECT_EQ(first.identitiesTrimmed, 2u);
    auto afterFirst = gallery_->snapshot();
    size_t saves = storage_.saveCalls;

    auto second = gallery_->optimize(1);
    EXPECT_EQ(second.embeddingsBefore, 2u);
    EXPECT_EQ(second.embeddingsAfter, 2u);
    EXPECT_EQ(second.identitiesTrimmed, 0u);
    EXPECT_EQ(storage_.saveCalls, saves);

    auto afterSecond = gallery_->snapshot();
    ASSERT_EQ(afterSecond.entries.size(), afterFirst.entries.size());
    for (size_t i = 0; i < afterFirst.entries.size(); ++i) {
        EXPECT_EQ(afterSecond.entries[i].label, afterFirst.entries[i].label);
        EXPECT_EQ(afterSecond.entries[i].embedding, afterFirst.entries[i].embedding);
    }
}

// Test optimize with nothing to trim does not rewrite storage
TEST_F(EmbeddingGalleryTest, OptimizeNoopSkipsSave) {
    gallery_->add("Alice", {{1, 0, 0}});
    size_t saves = storage_.saveCalls;
    auto result = gallery_->optimize(5);
    EXPECT_EQ(result.embeddingsBefore, result.embeddingsAfter);
    EXPECT_EQ(storage_.saveCalls, saves);
}

// Test validation passes on a consistent gallery and flags duplicates
TEST_F(EmbeddingGalleryTest, ValidateReportsDuplicates) {
    gallery_->add("Alice", {{1, 0, 0}});
    auto report = gallery_->validate();
    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.warnings.empty());

    gallery_->add("Bob", {{1, 0, 0}});
    report = gallery_->validate();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.totalEmbeddings, 2u);
    EXPECT_EQ(report.uniqueIdentities, 2u);
}

// Test restore replaces contents without saving
TEST_F(EmbeddingGalleryTest, RestoreReplacesWithoutSave) {
    GallerySnapshot snapshot;
    snapshot.entries.push_back({"Carol", {0.5f, 0.5f, 0.5f}});
    gallery_->restore(snapshot);
    EXPECT_TRUE(gallery_->contains("Carol"));
    EXPECT_EQ(storage_.saveCalls, 0u);

    GallerySnapshot bad;
    bad.entries.push_back({"Dave", {0.5f, 0.5f}});
    EXPECT_THROW(gallery_->restore(bad), DimensionMismatchError);
    EXPECT_TRUE(gallery_->contains("Carol"));
}

// Test a gallery without storage works in memory only
TEST(EmbeddingGalleryStandaloneTest, WorksWithoutStorage) {
    EmbeddingGallery gallery(2);
    EXPECT_EQ(gallery.add("Alice", {{0.0f, 1.0f}}), 1u);
    EXPECT_EQ(gallery.identities().size(), 1u);
    EXPECT_THROW(EmbeddingGallery(0), std::invalid_argument);
}
