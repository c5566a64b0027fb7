#include <gtest/gtest.h>
#include "attendance/attendance_ledger.h"
#include "attendance/report_aggregator.h"
#include "test_support.h"
#include <sstream>
#include <stdexcept>

class ReportAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(2024, 1, 7);
        ledger_ = std::make_unique<AttendanceLedger>(storage_, clock_.fn());
        aggregator_ = std::make_unique<ReportAggregator>(*ledger_);
    }

    // Mon 1st: Alice, Bob; Tue 2nd: Alice; Wed 3rd: Alice, Carol, Bob
    void seedWeek() {
        ledger_->mark("Alice", at(2024, 1, 1, 9, 0));
        ledger_->mark("Bob", at(2024, 1, 1, 9, 5));
        ledger_->mark("Alice", at(2024, 1, 2, 9, 0));
        ledger_->mark("Alice", at(2024, 1, 3, 9, 0));
        ledger_->mark("Carol", at(2024, 1, 3, 9, 1));
        ledger_->mark("Bob", at(2024, 1, 3, 9, 2));
    }

    MemoryAttendanceStorage storage_;
    ManualClock clock_;
    std::unique_ptr<AttendanceLedger> ledger_;
    std::unique_ptr<ReportAggregator> aggregator_;
};

// Test range returns records by date then insertion order
TEST_F(ReportAggregatorTest, RangeIsInclusiveAndOrdered) {
    seedWeek();
    CalendarDate start{2024, 1, 2};
    CalendarDate end{2024, 1, 3};
    auto records = aggregator_->range(start, end);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].date.toString(), "2024-01-02");
    EXPECT_EQ(records[1].label, "Alice");
    EXPECT_EQ(records[2].label, "Carol");
    EXPECT_EQ(records[3].label, "Bob");

    CalendarDate single{2024, 1, 1};
    EXPECT_EQ(aggregator_->range(single, single).size(), 2u);
}

// Test an inverted range is rejected
TEST_F(ReportAggregatorTest, InvertedRangeRejected) {
    CalendarDate start{2024, 1, 3};
    CalendarDate end{2024, 1, 1};
    EXPECT_THROW(aggregator_->range(start, end), std::invalid_argument);
    EXPECT_THROW(aggregator_->statistics(start, end), std::invalid_argument);
}

// Test statistics over a seeded week
TEST_F(ReportAggregatorTest, StatisticsOverWeek) {
    seedWeek();
    CalendarDate start{2024, 1, 1};
    CalendarDate end{2024, 1, 7};
    auto stats = aggregator_->statistics(start, end, 2);

    EXPECT_EQ(stats.totalRecords, 6u);
    EXPECT_EQ(stats.uniqueIdentities, 3u);
    EXPECT_EQ(stats.numberOfDays, 3u);
    EXPECT_DOUBLE_EQ(stats.averageDailyAttendance, 2.0);

    ASSERT_EQ(stats.dailyCounts.size(), 3u);
    EXPECT_EQ(stats.dailyCounts[0].second, 2u);
    EXPECT_EQ(stats.dailyCounts[2].second, 3u);

    ASSERT_EQ(stats.topIdentities.size(), 2u);
    EXPECT_EQ(stats.topIdentities[0].first, "Alice");
    EXPECT_EQ(stats.topIdentities[0].second, 3u);
    EXPECT_EQ(stats.topIdentities[1].first, "Bob");
    EXPECT_EQ(stats.topIdentities[1].second, 2u);

    ASSERT_EQ(stats.weekdayDistribution.size(), 3u);
    EXPECT_EQ(stats.weekdayDistribution[0].first, "Monday");
    EXPECT_EQ(stats.weekdayDistribution[0].second, 2u);
    EXPECT_EQ(stats.weekdayDistribution[2].first, "Wednesday");
    EXPECT_EQ(stats.weekdayDistribution[2].second, 3u);

    Json::Value json = stats.toJson();
    EXPECT_EQ(json["date_range"].asString(), "2024-01-01 to 2024-01-07");
    EXPECT_EQ(json["per_identity_counts"]["Carol"].asUInt64(), 1u);
    EXPECT_EQ(json["daily_counts"]["2024-01-03"].asUInt64(), 3u);
    EXPECT_EQ(json["top_n"].size(), 2u);
    EXPECT_EQ(json["weekday_distribution"]["Tuesday"].asUInt64(), 1u);
}

// Test the average is total over days with records
TEST_F(ReportAggregatorTest, AverageIsUnrounded) {
    ledger_->mark("Alice", at(2024, 1, 1, 9, 0));
    ledger_->mark("Bob", at(2024, 1, 1, 9, 0));
    ledger_->mark("Alice", at(2024, 1, 2, 9, 0));
    ledger_->mark("Alice", at(2024, 1, 3, 9, 0));
    CalendarDate start{2024, 1, 1};
    CalendarDate end{2024, 1, 3};
    auto stats = aggregator_->statistics(start, end);
    EXPECT_DOUBLE_EQ(stats.averageDailyAttendance, 4.0 / 3.0);
}

// Test statistics over an empty range
TEST_F(ReportAggregatorTest, EmptyRangeStatistics) {
    CalendarDate start{2024, 1, 1};
    CalendarDate end{2024, 1, 7};
    auto stats = aggregator_->statistics(start, end);
    EXPECT_EQ(stats.totalRecords, 0u);
    EXPECT_EQ(stats.numberOfDays, 0u);
    EXPECT_DOUBLE_EQ(stats.averageDailyAttendance, 0.0);
    EXPECT_TRUE(stats.topIdentities.empty());
}

// Test equal counts keep first-seen order in the top list
TEST_F(ReportAggregatorTest, TopListTiesKeepFirstSeenOrder) {
    std::vector<AttendanceRecord> records;
    for (const char *label : {"Zed", "Amy", "Zed", "Amy", "Bo"}) {
        records.push_back(AttendanceRecord::create(label, at(2024, 1, 1, 9, 0),
                                                   "Present",
                                                   EntryKind::Manual));
    }
    CalendarDate day{2024, 1, 1};
    auto stats = ReportAggregator::summarize(records, day, day, 10);
    ASSERT_EQ(stats.topIdentities.size(), 3u);
    EXPECT_EQ(stats.topIdentities[0].first, "Zed");
    EXPECT_EQ(stats.topIdentities[1].first, "Amy");
    EXPECT_EQ(stats.topIdentities[2].first, "Bo");
}

// Test CSV export has a header and escapes awkward fields
TEST_F(ReportAggregatorTest, ExportCsv) {
    CalendarDate day{2024, 1, 1};
    ledger_->mark("Alice", at(2024, 1, 1, 9, 0));
    ledger_->manualEntry("Smith, John", day, TimeOfDay{10, 0, 0}, "Late \"excused\"");

    std::string csv = aggregator_->exportCsv(day, day);
    std::istringstream lines(csv);
    std::string header, first, second, extra;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);
    EXPECT_FALSE(std::getline(lines, extra));

    EXPECT_EQ(header, "name,date,time,timestamp,day_of_week,status,entry_type");
    EXPECT_EQ(first,
              "Alice,2024-01-01,09:00:00,2024-01-01T09:00:00,Monday,Present,automatic");
    EXPECT_EQ(second, "\"Smith, John\",2024-01-01,10:00:00,2024-01-01T10:00:00,"
                      "Monday,\"Late \"\"excused\"\"\",manual");
}

// Test an empty range exports only the header
TEST_F(ReportAggregatorTest, ExportEmptyRange) {
    CalendarDate day{2024, 1, 5};
    EXPECT_EQ(aggregator_->exportCsv(day, day),
              "name,date,time,timestamp,day_of_week,status,entry_type\n");
}
