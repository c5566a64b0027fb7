#include <gtest/gtest.h>
#include "core/attendance_errors.h"
#include "recognition/embedding_gallery.h"
#include "storage/file_attendance_storage.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <limits>
#include <stdexcept>

class FileAttendanceStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = makeTestDirectory("test_attendance_storage");
        storage_ = std::make_unique<FileAttendanceStorage>(test_dir_.string());
    }

    void TearDown() override {
        storage_.reset();
        if (std::filesystem::exists(test_dir_)) {
            std::filesystem::remove_all(test_dir_);
        }
    }

    std::unique_ptr<FileAttendanceStorage> storage_;
    std::filesystem::path test_dir_;
};

// Test constructor creates the partition directory
TEST_F(FileAttendanceStorageTest, CreatesDirectories) {
    EXPECT_TRUE(std::filesystem::is_directory(storage_->attendanceDir()));
    CalendarDate day{2024, 1, 1};
    EXPECT_EQ(storage_->partitionPath(day),
              (test_dir_ / "attendance" / "attendance_2024-01-01.jsonl").string());
}

// Test a missing gallery file loads as empty
TEST_F(FileAttendanceStorageTest, LoadMissingGalleryIsEmpty) {
    auto snapshot = storage_->loadGallery();
    EXPECT_TRUE(snapshot.entries.empty());
}

// Test gallery save and load keep order and exact float values
TEST_F(FileAttendanceStorageTest, SaveAndLoadGallery) {
    GallerySnapshot snapshot;
    snapshot.entries.push_back({"Alice", {0.1f, 0.2f, 0.3f}});
    snapshot.entries.push_back({"Bob", {1.0f / 3.0f, -2.5f, 1e-7f}});
    snapshot.entries.push_back({"Alice", {0.0f, 0.0f, 1.0f}});
    storage_->saveGallery(snapshot);

    auto loaded = storage_->loadGallery();
    ASSERT_EQ(loaded.entries.size(), 3u);
    EXPECT_EQ(loaded.entries[0].label, "Alice");
    EXPECT_EQ(loaded.entries[1].label, "Bob");
    EXPECT_EQ(loaded.entries[2].label, "Alice");
    for (size_t i = 0; i < snapshot.entries.size(); ++i) {
        EXPECT_EQ(loaded.entries[i].embedding, snapshot.entries[i].embedding);
    }
    EXPECT_FALSE(std::filesystem::exists(storage_->galleryPath() + ".tmp"));
}

// Test malformed gallery lines are skipped and counted
TEST_F(FileAttendanceStorageTest, LoadGallerySkipsMalformedLines) {
    {
        std::ofstream file(storage_->galleryPath());
        file << "Alice|0.1,0.2,0.3\n";
        file << "no separator here\n";
        file << "|0.1,0.2,0.3\n";
        file << "Bob|0.1,abc,0.3\n";
        file << "\n";
        file << "Carol|0.4,0.5,0.6\n";
    }

    auto loaded = storage_->loadGallery();
    ASSERT_EQ(loaded.entries.size(), 2u);
    EXPECT_EQ(loaded.entries[0].label, "Alice");
    EXPECT_EQ(loaded.entries[1].label, "Carol");
    EXPECT_EQ(storage_->lastSkippedLines(), 3u);
}

// Test subnormal and extreme finite values survive a save and load
TEST_F(FileAttendanceStorageTest, GalleryKeepsSubnormalValues) {
    const float denorm = std::numeric_limits<float>::denorm_min();
    GallerySnapshot snapshot;
    snapshot.entries.push_back({"Carol", {1e-40f, 0.5f, 0.5f}});
    snapshot.entries.push_back({"Mary Ann", {denorm, -1e-40f,
                                             std::numeric_limits<float>::max()}});
    storage_->saveGallery(snapshot);

    auto loaded = storage_->loadGallery();
    EXPECT_EQ(storage_->lastSkippedLines(), 0u);
    ASSERT_EQ(loaded.entries.size(), 2u);
    EXPECT_EQ(loaded.entries[0].label, "Carol");
    EXPECT_EQ(loaded.entries[1].label, "Mary Ann");
    EXPECT_EQ(loaded.entries[0].embedding, snapshot.entries[0].embedding);
    EXPECT_EQ(loaded.entries[1].embedding, snapshot.entries[1].embedding);
}

// Test an overflowing value still marks the line malformed
TEST_F(FileAttendanceStorageTest, GalleryRejectsOverflow) {
    {
        std::ofstream file(storage_->galleryPath());
        file << "Alice|1e39,0.2,0.3\n";
        file << "Bob|0.1,0.2,0.3x\n";
        file << "Carol|0.4,0.5,0.6\n";
    }
    auto loaded = storage_->loadGallery();
    ASSERT_EQ(loaded.entries.size(), 1u);
    EXPECT_EQ(loaded.entries[0].label, "Carol");
    EXPECT_EQ(storage_->lastSkippedLines(), 2u);
}

// Test a gallery reloaded by a fresh storage has the same identities
TEST_F(FileAttendanceStorageTest, GalleryRestartKeepsIdentities) {
    {
        EmbeddingGallery gallery(3, storage_.get());
        EXPECT_THROW(gallery.add("Bob ", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
        EXPECT_THROW(gallery.add(" Bob", {{0.1f, 0.2f, 0.3f}}), std::invalid_argument);
        gallery.add("Bob", {{0.1f, 0.2f, 0.3f}});
        gallery.add("Carol", {{1e-40f, 0.5f, 0.5f}});
        EXPECT_EQ(gallery.size(), 2u);
    }

    FileAttendanceStorage reopened(test_dir_.string());
    EmbeddingGallery restored(3, &reopened);
    restored.restore(reopened.loadGallery());

    EXPECT_EQ(restored.size(), 2u);
    EXPECT_TRUE(restored.contains("Bob"));
    EXPECT_TRUE(restored.contains("Carol"));
    auto snapshot = restored.snapshot();
    ASSERT_EQ(snapshot.entries.size(), 2u);
    EXPECT_EQ(snapshot.entries[1].embedding[0], 1e-40f);
}

// Test appended records are read back in order per partition
TEST_F(FileAttendanceStorageTest, AppendAndReadPartition) {
    CalendarDate day{2024, 1, 1};
    auto first = AttendanceRecord::create("Alice", at(2024, 1, 1, 9, 0),
                                          "Present", EntryKind::Automatic);
    auto second = AttendanceRecord::create("Bob", at(2024, 1, 1, 9, 5), "Late",
                                           EntryKind::Manual);
    storage_->appendRecord(day, first);
    storage_->appendRecord(day, second);

    auto records = storage_->readPartition(day);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].label, "Alice");
    EXPECT_EQ(records[0].entryKind, EntryKind::Automatic);
    EXPECT_EQ(records[1].label, "Bob");
    EXPECT_EQ(records[1].status, "Late");
    EXPECT_EQ(records[1].entryKind, EntryKind::Manual);

    CalendarDate nextDay{2024, 1, 2};
    EXPECT_TRUE(storage_->readPartition(nextDay).empty());
}

// Test a corrupt partition line is skipped without losing the others
TEST_F(FileAttendanceStorageTest, ReadPartitionSkipsCorruptLines) {
    CalendarDate day{2024, 1, 1};
    storage_->appendRecord(day, AttendanceRecord::create(
                                    "Alice", at(2024, 1, 1, 9, 0), "Present",
                                    EntryKind::Automatic));
    {
        std::ofstream file(storage_->partitionPath(day), std::ios::app);
        file << "{not json\n";
        file << "{\"name\": \"Bob\"}\n";
    }
    storage_->appendRecord(day, AttendanceRecord::create(
                                    "Carol", at(2024, 1, 1, 9, 1), "Present",
                                    EntryKind::Automatic));

    auto records = storage_->readPartition(day);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].label, "Alice");
    EXPECT_EQ(records[1].label, "Carol");
    EXPECT_EQ(storage_->lastSkippedLines(), 2u);
}

// Test partition dates are listed ascending and foreign files ignored
TEST_F(FileAttendanceStorageTest, ListPartitionDates) {
    storage_->appendRecord(CalendarDate{2024, 1, 3},
                           AttendanceRecord::create("A", at(2024, 1, 3, 9, 0),
                                                    "Present",
                                                    EntryKind::Automatic));
    storage_->appendRecord(CalendarDate{2023, 12, 31},
                           AttendanceRecord::create("A", at(2023, 12, 31, 9, 0),
                                                    "Present",
                                                    EntryKind::Automatic));
    {
        std::ofstream junk(std::filesystem::path(storage_->attendanceDir()) /
                           "notes.txt");
        junk << "ignore me";
        std::ofstream bad(std::filesystem::path(storage_->attendanceDir()) /
                          "attendance_2024-02-31.jsonl");
        bad << "";
    }

    auto dates = storage_->listPartitionDates();
    ASSERT_EQ(dates.size(), 2u);
    EXPECT_EQ(dates[0].toString(), "2023-12-31");
    EXPECT_EQ(dates[1].toString(), "2024-01-03");
}

// Test backup copies gallery, partitions and writes metadata
TEST_F(FileAttendanceStorageTest, BackupCopiesEverything) {
    GallerySnapshot snapshot;
    snapshot.entries.push_back({"Alice", {0.1f, 0.2f, 0.3f}});
    storage_->saveGallery(snapshot);
    storage_->appendRecord(CalendarDate{2024, 1, 1},
                           AttendanceRecord::create("Alice", at(2024, 1, 1, 9, 0),
                                                    "Present",
                                                    EntryKind::Automatic));
    storage_->appendRecord(CalendarDate{2024, 1, 2},
                           AttendanceRecord::create("Alice", at(2024, 1, 2, 9, 0),
                                                    "Present",
                                                    EntryKind::Automatic));

    auto target = test_dir_ / "backup";
    size_t copied = storage_->backup(target.string());
    EXPECT_EQ(copied, 3u);
    EXPECT_TRUE(std::filesystem::exists(target / "face_gallery.txt"));
    EXPECT_TRUE(std::filesystem::exists(target / "attendance" /
                                        "attendance_2024-01-02.jsonl"));

    std::ifstream metadataFile(target / "backup_metadata.json");
    ASSERT_TRUE(metadataFile.is_open());
    Json::Value metadata;
    Json::CharReaderBuilder builder;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(builder, metadataFile, &metadata, &errors));
    EXPECT_EQ(metadata["files_backed_up"].asUInt64(), 3u);
    EXPECT_TRUE(metadata.isMember("backup_date"));
}

// Test an unwritable data directory surfaces as PersistenceError
TEST_F(FileAttendanceStorageTest, UnusableDataDirectoryThrows) {
    auto blocker = test_dir_ / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    EXPECT_THROW(FileAttendanceStorage((blocker / "data").string()),
                 PersistenceError);
}
