// =============================================================================
// Journal Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/journal.hpp"
#include "test_helpers.hpp"

using namespace fleetcrypt;
using test_support::TempDir;

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>();
        path_ = *dir_ / "test.journal";
    }

    void TearDown() override {
        dir_.reset();
    }

    std::unique_ptr<TempDir> dir_;
    std::filesystem::path path_;
};

TEST_F(JournalTest, RecordsSurviveReopen) {
    {
        Journal journal(path_);
        EXPECT_TRUE(journal.open().empty());
        journal.append("w:ENEMY w:FLEET");
        journal.append("s:HQ");
    }

    Journal journal(path_);
    EXPECT_EQ(journal.open(), (std::vector<std::string>{"w:ENEMY w:FLEET", "s:HQ"}));
    EXPECT_EQ(journal.discarded_records(), 0u);
}

TEST_F(JournalTest, TornTailIsTruncated) {
    {
        Journal journal(path_);
        journal.open();
        journal.append("first");
    }
    test_support::append_raw(path_, "seco");

    {
        Journal journal(path_);
        EXPECT_EQ(journal.open(), (std::vector<std::string>{"first"}));
        EXPECT_EQ(journal.discarded_records(), 1u);
        journal.append("second");
    }

    Journal journal(path_);
    EXPECT_EQ(journal.open(), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(journal.discarded_records(), 0u);
}

TEST_F(JournalTest, CorruptRecordIsSkipped) {
    {
        Journal journal(path_);
        journal.open();
        journal.append("first");
    }
    test_support::append_raw(path_, "forged\t0000000000000000\n");
    test_support::append_raw(path_, "no separator\n");
    test_support::append_raw(path_, "third\t" + Journal::checksum("third") + "\n");

    Journal journal(path_);
    EXPECT_EQ(journal.open(), (std::vector<std::string>{"first", "third"}));
    EXPECT_EQ(journal.discarded_records(), 2u);
}

TEST_F(JournalTest, SecondHolderIsLockedOut) {
    Journal first(path_);
    first.open();

    Journal second(path_);
    EXPECT_THROW(second.open(), StoreLockedError);

    first.close();
    EXPECT_NO_THROW(second.open());
}

TEST_F(JournalTest, RejectsBadRecords) {
    Journal journal(path_);
    EXPECT_THROW(journal.append("early"), IOError);

    journal.open();
    EXPECT_THROW(journal.append(""), InvalidArgumentError);
    EXPECT_THROW(journal.append("a\tb"), InvalidArgumentError);
    EXPECT_THROW(journal.append("a\nb"), InvalidArgumentError);
    EXPECT_EQ(test_support::count_lines(path_), 0u);
}

TEST_F(JournalTest, ChecksumIsShortHex) {
    auto sum = Journal::checksum("w:ENEMY");
    EXPECT_EQ(sum.size(), 16u);
    EXPECT_EQ(sum, Journal::checksum("w:ENEMY"));
    EXPECT_NE(sum, Journal::checksum("w:ENEMZ"));
}
