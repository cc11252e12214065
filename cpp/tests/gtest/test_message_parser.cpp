// =============================================================================
// Message Parser Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fleetcrypt/error.hpp"
#include "fleetcrypt/message.hpp"
#include "test_helpers.hpp"

using namespace fleetcrypt;

class MessageParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        dictionary_ = Dictionary{"ENEMY", "FLEET", "SIGHTED", "NORTH"};
    }

    Dictionary dictionary_;
};

TEST_F(MessageParserTest, SenderAndReceiver) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("=HQ ENEMY FLEET SIGHTED FLEET7=");

    ASSERT_TRUE(message.sender.has_value());
    ASSERT_TRUE(message.receiver.has_value());
    EXPECT_EQ(*message.sender, "HQ");
    EXPECT_EQ(*message.receiver, "FLEET7");
    EXPECT_EQ(message.body, (std::vector<std::string>{"ENEMY", "FLEET", "SIGHTED"}));
    EXPECT_EQ(message.classification, Classification::CLEAR);
    EXPECT_EQ(message.normalized_text, "=HQ ENEMY FLEET SIGHTED FLEET7=");
}

// '=' inside the last token is not a receiver marker.
TEST_F(MessageParserTest, EmbeddedEqualsIsNotAMarker) {
    MessageParser parser(dictionary_);
    Message message;
    ASSERT_NO_THROW(message = parser.parse("=ALPHA BETA GAMMA=DELTA"));

    EXPECT_EQ(message.sender, std::optional<std::string>("ALPHA"));
    EXPECT_FALSE(message.receiver.has_value());
    EXPECT_EQ(message.body, (std::vector<std::string>{"BETA", "GAMMA=DELTA"}));
}

TEST_F(MessageParserTest, MissingRouting) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("ENEMY FLEET");

    EXPECT_FALSE(message.has_routing());
    EXPECT_EQ(message.body.size(), 2u);
    EXPECT_TRUE(message.is_clear());
}

TEST_F(MessageParserTest, BareMarkersAreConsumed) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("= ENEMY =");

    EXPECT_FALSE(message.sender.has_value());
    EXPECT_FALSE(message.receiver.has_value());
    EXPECT_EQ(message.body, (std::vector<std::string>{"ENEMY"}));
}

// One token cannot route both ways.
TEST_F(MessageParserTest, SingleTokenIsSenderOnly) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("=HQ");

    EXPECT_EQ(message.sender, std::optional<std::string>("HQ"));
    EXPECT_FALSE(message.receiver.has_value());
    EXPECT_TRUE(message.body.empty());
    EXPECT_EQ(message.classification, Classification::CIPHER);
}

TEST_F(MessageParserTest, ForeignSymbolsDropped) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("=HQ EN$MY FLEET FLEET7=");
    EXPECT_EQ(message.body, (std::vector<std::string>{"FLEET"}));
}

TEST_F(MessageParserTest, EdgeDashTokensDropped) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("=HQ -ENEMY FLEET- NORTH-WEST - SIGHTED FLEET7=");
    EXPECT_EQ(message.body, (std::vector<std::string>{"NORTH-WEST", "SIGHTED"}));
}

TEST_F(MessageParserTest, LowercaseIsUppercased) {
    MessageParser parser(dictionary_);
    auto message = parser.parse("=hq enemy fleet=");

    EXPECT_EQ(message.sender, std::optional<std::string>("HQ"));
    EXPECT_EQ(message.receiver, std::optional<std::string>("FLEET"));
    EXPECT_EQ(message.body, (std::vector<std::string>{"ENEMY"}));
}

TEST_F(MessageParserTest, EmptyInput) {
    MessageParser parser(dictionary_);
    Message message;
    ASSERT_NO_THROW(message = parser.parse("   \n\t "));
    EXPECT_TRUE(message.body.empty());
    EXPECT_EQ(message.normalized_text, "");
    EXPECT_EQ(message.classification, Classification::CIPHER);
}

TEST_F(MessageParserTest, FingerprintIgnoresWhitespace) {
    MessageParser parser(dictionary_);
    auto a = parser.parse("=HQ  ENEMY\nFLEET=");
    auto b = parser.parse("=hq ENEMY FLEET=");
    auto c = parser.parse("=HQ ENEMY NORTH=");

    EXPECT_EQ(a.fingerprint, b.fingerprint);
    EXPECT_NE(a.fingerprint, c.fingerprint);
    EXPECT_EQ(a.fingerprint.size(), 64u);
    EXPECT_EQ(a.fingerprint, fingerprint_text("=HQ ENEMY FLEET="));
}

// Clear needs strictly more than a quarter of the body in the dictionary.
TEST_F(MessageParserTest, ClassificationThreshold) {
    MessageParser parser(dictionary_);

    EXPECT_EQ(parser.classify({"ENEMY", "XQZV", "KLMP", "WRTY"}), Classification::CIPHER);
    EXPECT_EQ(parser.classify({"ENEMY", "FLEET", "KLMP", "WRTY"}), Classification::CLEAR);
    EXPECT_EQ(parser.classify({"ENEMY", "XQZV", "KLMP"}), Classification::CLEAR);
    EXPECT_EQ(parser.classify({}), Classification::CIPHER);
}

TEST_F(MessageParserTest, NumbersReadAsClear) {
    MessageParser parser(dictionary_);
    EXPECT_EQ(parser.classify({"123", "XQZV"}), Classification::CLEAR);
    EXPECT_EQ(parser.classify({"12A", "XQZV"}), Classification::CIPHER);
}

TEST_F(MessageParserTest, ThresholdIsConfigurable) {
    MessageParser strict(dictionary_, ParserOptions{0.5});
    EXPECT_EQ(strict.classify({"ENEMY", "FLEET", "KLMP", "WRTY"}), Classification::CIPHER);
    EXPECT_EQ(strict.classify({"ENEMY", "FLEET", "NORTH", "WRTY"}), Classification::CLEAR);
}

TEST_F(MessageParserTest, ParseIsRepeatable) {
    MessageParser parser(dictionary_);
    auto first = parser.parse("=HQ DMSGB CNRJC FLEET7=");
    auto second = parser.parse("=HQ DMSGB CNRJC FLEET7=");

    EXPECT_EQ(first.fingerprint, second.fingerprint);
    EXPECT_EQ(first.body, second.body);
    EXPECT_EQ(first.classification, second.classification);
    EXPECT_EQ(first.to_text(), first.normalized_text);
}

// =============================================================================
// Dictionary
// =============================================================================

TEST(DictionaryTest, LoadsWordListUppercased) {
    test_support::TempDir dir;
    auto path = dir / "words.txt";
    test_support::append_raw(path, "enemy\nFleet\n\ndon't\ntwo words\nsighted\n");

    Dictionary dictionary;
    EXPECT_EQ(dictionary.load(path), 3u);
    EXPECT_TRUE(dictionary.contains("ENEMY"));
    EXPECT_TRUE(dictionary.contains("FLEET"));
    EXPECT_TRUE(dictionary.contains("SIGHTED"));
    EXPECT_FALSE(dictionary.contains("DON'T"));
    EXPECT_EQ(dictionary.size(), 3u);
}

TEST(DictionaryTest, MissingFileThrows) {
    test_support::TempDir dir;
    Dictionary dictionary;
    try {
        dictionary.load(dir / "absent.txt");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
    }
}
