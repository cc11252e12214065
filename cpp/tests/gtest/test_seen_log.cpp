// =============================================================================
// Seen-Message Log Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/message.hpp"
#include "fleetcrypt/seen_log.hpp"
#include "test_helpers.hpp"

using namespace fleetcrypt;
using test_support::TempDir;

class SeenLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>();
        path_ = *dir_ / "seen_messages.journal";
    }

    void TearDown() override {
        dir_.reset();
    }

    std::unique_ptr<TempDir> dir_;
    std::filesystem::path path_;
};

TEST_F(SeenLogTest, RecordIsIdempotent) {
    SeenLog log(path_);
    log.open();
    auto fp = fingerprint_text("=HQ ENEMY FLEET=");

    EXPECT_FALSE(log.contains(fp));
    EXPECT_TRUE(log.record(fp));
    EXPECT_TRUE(log.contains(fp));
    EXPECT_FALSE(log.record(fp));
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(test_support::count_lines(path_), 1u);
}

TEST_F(SeenLogTest, SurvivesInterruptedRecord) {
    auto first = fingerprint_text("=HQ ENEMY FLEET=");
    auto second = fingerprint_text("=HQ CNRJC DGVC=");
    {
        SeenLog log(path_);
        log.open();
        log.record(first);
    }
    test_support::append_raw(path_, second.substr(0, 20));

    SeenLog log(path_);
    log.open();
    EXPECT_TRUE(log.contains(first));
    EXPECT_FALSE(log.contains(second));
    EXPECT_EQ(log.size(), 1u);

    EXPECT_TRUE(log.record(second));
    EXPECT_EQ(test_support::count_lines(path_), 2u);
}

TEST_F(SeenLogTest, RejectsMalformedFingerprints) {
    SeenLog log(path_);
    log.open();
    EXPECT_THROW(log.record(""), InvalidArgumentError);
    EXPECT_THROW(log.record("abc def"), InvalidArgumentError);
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(SeenLogTest, SecondLogIsLockedOut) {
    SeenLog first(path_);
    first.open();

    SeenLog second(path_);
    EXPECT_THROW(second.open(), StoreLockedError);
}
