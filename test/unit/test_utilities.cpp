// test/unit/test_utilities.cpp
// -----------------------------------------------------------
// UTF-8 conversion, SHA-256 helpers, the occupancy set and the config parser.

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "../../config/redactor_config.hpp"
#include "catalog/match_span.hpp"
#include "redaction/occupancy_set.hpp"
#include "util/config_parser.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/unicode_classes.hpp"
#include "util/utf8.hpp"

namespace {

namespace utf8 = idredact::util::utf8;
using idredact::catalog::MatchSpan;

// ---------------------------------------------------------------------------
// utf8
// ---------------------------------------------------------------------------

TEST(Utf8Test, DecodesMultiByteSequences) {
    std::wstring w = utf8::decode("Ñandú ∩ 😀");
    ASSERT_EQ(w.size(), 9u);
    EXPECT_EQ(static_cast<unsigned long>(w[0]), 0xD1ul);
    EXPECT_EQ(static_cast<unsigned long>(w[4]), 0xFAul);
    EXPECT_EQ(static_cast<unsigned long>(w[6]), 0x2229ul);
    EXPECT_EQ(static_cast<unsigned long>(w[8]), 0x1F600ul);
    EXPECT_EQ(utf8::encode(w), "Ñandú ∩ 😀");
}

TEST(Utf8Test, InvalidBytesBecomeReplacementCharacters) {
    std::wstring w = utf8::decode("a\xff" "b");
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[1], utf8::kReplacementChar);
    EXPECT_EQ(w[2], L'b');
}

TEST(Utf8Test, TruncatedSequenceIsOneReplacement) {
    // first two bytes of a three-byte sequence, then ASCII
    std::wstring w = utf8::decode("x\xe2\x88" "y");
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[1], utf8::kReplacementChar);
    EXPECT_EQ(w[2], L'y');

    std::wstring end = utf8::decode("\xc3");
    ASSERT_EQ(end.size(), 1u);
    EXPECT_EQ(end[0], utf8::kReplacementChar);
}

TEST(Utf8Test, CodePointLengthCountsCharactersNotBytes) {
    EXPECT_EQ(utf8::codePointLength(""), 0u);
    EXPECT_EQ(utf8::codePointLength("Perú"), 4u);
    EXPECT_EQ(std::string("Perú").size(), 5u);
}

TEST(UnicodeClassesTest, WhitespaceIncludesNoBreakSpaces) {
    namespace unicode = idredact::util::unicode;
    EXPECT_TRUE(unicode::isWhitespace(0x20));
    EXPECT_TRUE(unicode::isWhitespace(0x09));
    EXPECT_TRUE(unicode::isWhitespace(0xA0));
    EXPECT_TRUE(unicode::isWhitespace(0x202F));
    EXPECT_TRUE(unicode::isWhitespace(0x3000));
    EXPECT_FALSE(unicode::isWhitespace(0x200B));   // zero width space is not Zs
    EXPECT_FALSE(unicode::isWhitespace('a'));
}

TEST(UnicodeClassesTest, DecimalDigitsInOtherScripts) {
    namespace unicode = idredact::util::unicode;
    EXPECT_TRUE(unicode::isDecimalDigit('0'));
    EXPECT_TRUE(unicode::isDecimalDigit('9'));
    EXPECT_TRUE(unicode::isDecimalDigit(0x0663));    // Arabic-Indic three
    EXPECT_TRUE(unicode::isDecimalDigit(0xFF19));    // fullwidth nine
    EXPECT_TRUE(unicode::isDecimalDigit(0x1D7FF));
    EXPECT_FALSE(unicode::isDecimalDigit(0x00B2));   // superscript two is No, not Nd
    EXPECT_FALSE(unicode::isDecimalDigit(0x2163));   // roman numeral four
    EXPECT_FALSE(unicode::isDecimalDigit('/'));
    EXPECT_FALSE(unicode::isDecimalDigit(':'));
}

// ---------------------------------------------------------------------------
// hashing
// ---------------------------------------------------------------------------

TEST(HashingTest, Sha256KnownVector) {
    EXPECT_EQ(idredact::util::hashing::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingTest, Sha256LinesTerminatesEachLine) {
    using namespace idredact::util::hashing;
    EXPECT_EQ(sha256Lines({"abc"}), sha256("abc\n"));
    EXPECT_EQ(sha256Lines({"A=1", "B=2"}), sha256("A=1\nB=2\n"));
    EXPECT_EQ(sha256Lines({}), sha256(""));
}

// ---------------------------------------------------------------------------
// OccupancySet
// ---------------------------------------------------------------------------

TEST(OccupancySetTest, ClaimsOnlyFreeIntervals) {
    idredact::redaction::OccupancySet occ;
    EXPECT_TRUE(occ.empty());
    EXPECT_TRUE(occ.tryClaim(MatchSpan{10, 20}));
    EXPECT_TRUE(occ.tryClaim(MatchSpan{0, 10}));   // touching is not overlapping
    EXPECT_TRUE(occ.tryClaim(MatchSpan{20, 25}));
    EXPECT_FALSE(occ.tryClaim(MatchSpan{19, 21}));
    EXPECT_FALSE(occ.tryClaim(MatchSpan{5, 30}));
    EXPECT_FALSE(occ.tryClaim(MatchSpan{12, 13}));
    EXPECT_TRUE(occ.tryClaim(MatchSpan{30, 31}));
    EXPECT_EQ(occ.size(), 4u);

    auto iv = occ.intervals();
    ASSERT_EQ(iv.size(), 4u);
    EXPECT_EQ(iv[0], (MatchSpan{0, 10}));
    EXPECT_EQ(iv[3], (MatchSpan{30, 31}));
}

TEST(OccupancySetTest, EmptySpanNeverIntersects) {
    idredact::redaction::OccupancySet occ;
    occ.tryClaim(MatchSpan{0, 5});
    EXPECT_FALSE(occ.intersects(MatchSpan{3, 3}));
    EXPECT_TRUE(occ.tryClaim(MatchSpan{3, 3}));
    EXPECT_EQ(occ.size(), 1u);
}

// ---------------------------------------------------------------------------
// ConfigParser
// ---------------------------------------------------------------------------

class ConfigParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "idredact_config_test.conf";
    }
    void TearDown() override {
        std::remove(path_.c_str());
    }
    void writeFile(const std::string& content) {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string path_;
};

TEST_F(ConfigParserTest, LoadsRecognizedKeys) {
    writeFile("# idredact\n"
              "placeholder = [ID REDACTED]\n"
              "patternFile=patterns/latam.conf\n"
              "workerThreads=6\n"
              "regexLocale=es_CL.UTF-8\n"
              "logLevel=warning\n"
              "logFile=run.log\n"
              "maxEntityTextLength=5000\n"
              "somethingElse=1\n");
    idredact::config::RedactorConfig cfg;
    idredact::util::ConfigParser parser(cfg);
    ASSERT_TRUE(parser.loadFromFile(path_));
    EXPECT_EQ(cfg.placeholder, "[ID REDACTED]");
    EXPECT_EQ(cfg.patternFile, "patterns/latam.conf");
    EXPECT_EQ(cfg.workerThreads, 6u);
    EXPECT_EQ(cfg.regexLocale, "es_CL.UTF-8");
    EXPECT_EQ(cfg.logLevel, "warning");
    EXPECT_EQ(cfg.logFile, "run.log");
    EXPECT_EQ(cfg.maxEntityTextLength, 5000u);
}

TEST_F(ConfigParserTest, MissingFileKeepsDefaults) {
    idredact::config::RedactorConfig cfg;
    idredact::util::ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile(path_ + ".absent"));
    EXPECT_EQ(cfg.placeholder, "<ID>");
    EXPECT_EQ(cfg.workerThreads, 0u);
    EXPECT_EQ(cfg.regexLocale, "C.UTF-8");
    EXPECT_EQ(cfg.maxEntityTextLength, 100000u);
}

TEST_F(ConfigParserTest, MalformedLineThrows) {
    writeFile("placeholder=<ID>\nthis line has no separator\n");
    idredact::config::RedactorConfig cfg;
    idredact::util::ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromFile(path_), std::runtime_error);
}

TEST_F(ConfigParserTest, InvalidValuesThrow) {
    idredact::config::RedactorConfig cfg;
    idredact::util::ConfigParser parser(cfg);
    EXPECT_THROW(parser.set("workerThreads", "-1"), std::runtime_error);
    EXPECT_THROW(parser.set("workerThreads", "4x"), std::runtime_error);
    EXPECT_THROW(parser.set("workerThreads", "99999999999"), std::runtime_error);
    EXPECT_THROW(parser.set("placeholder", ""), std::runtime_error);
    EXPECT_THROW(parser.set("logLevel", "verbose"), std::runtime_error);
    EXPECT_EQ(cfg.workerThreads, 0u);
    EXPECT_EQ(cfg.placeholder, "<ID>");
}

TEST_F(ConfigParserTest, SetOverridesFileValues) {
    writeFile("workerThreads=2\n");
    idredact::config::RedactorConfig cfg;
    idredact::util::ConfigParser parser(cfg);
    ASSERT_TRUE(parser.loadFromFile(path_));
    parser.set("workerThreads", "8");
    EXPECT_EQ(cfg.workerThreads, 8u);
}

TEST(LoggerTest, ParsesLevelNames) {
    using idredact::util::logger::LogLevel;
    using idredact::util::logger::parseLogLevel;
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::CRITICAL);
    EXPECT_THROW(parseLogLevel("loud"), std::runtime_error);
}

} // anonymous namespace
