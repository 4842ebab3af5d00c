// test/unit/test_pattern_catalog.cpp
// -----------------------------------------------------------
// Catalog construction, match enumeration, pattern files and fingerprints.

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "catalog/builtin_patterns.hpp"
#include "catalog/pattern_catalog.hpp"
#include "catalog/pattern_file.hpp"

namespace {

using idredact::catalog::MatchSpan;
using idredact::catalog::PatternCatalog;
using idredact::catalog::PatternCompilationError;
using idredact::catalog::PatternSource;

TEST(PatternCatalogTest, BuiltinHoldsEveryCountryPattern) {
    const auto& cat = PatternCatalog::builtin();
    ASSERT_EQ(cat.size(), 28u);
    EXPECT_EQ(cat.entries().front().label, "CI_NIC");
    EXPECT_EQ(cat.entries().back().label, "RUC_PER");
    EXPECT_EQ(cat.entries()[11].label, "RUT_CHI");
    EXPECT_EQ(cat.fingerprint().size(), 64u);
}

TEST(PatternCatalogTest, BuiltinIsASingleInstance) {
    EXPECT_EQ(&PatternCatalog::builtin(), &PatternCatalog::builtin());
}

TEST(PatternCatalogTest, MalformedPatternNamesItsLabel) {
    try {
        PatternCatalog::build({{"GOOD", R"(\d{3})"}, {"BROKEN", R"([0-9)"}});
        FAIL() << "expected PatternCompilationError";
    } catch (const PatternCompilationError& ex) {
        EXPECT_EQ(ex.label(), "BROKEN");
        EXPECT_FALSE(ex.engineMessage().empty());
        EXPECT_NE(std::string(ex.what()).find("BROKEN"), std::string::npos);
    }
}

TEST(PatternCatalogTest, UnbalancedGroupIsRejected) {
    EXPECT_THROW(PatternCatalog::build({{"OPEN", R"((\d{3})"}}), PatternCompilationError);
}

TEST(PatternCatalogTest, DuplicateAndEmptyLabelsAreRejected) {
    EXPECT_THROW(PatternCatalog::build({{"X", "a"}, {"X", "b"}}), PatternCompilationError);
    EXPECT_THROW(PatternCatalog::build({{"", "a"}}), PatternCompilationError);
}

TEST(PatternCatalogTest, EmptyCatalogFindsNothing) {
    auto cat = PatternCatalog::build({});
    EXPECT_TRUE(cat.empty());
    EXPECT_TRUE(cat.findAll(std::string("12.345.678-9")).empty());
}

TEST(PatternCatalogTest, FindAllReportsEveryNonOverlappingMatchPerPattern) {
    auto cat = PatternCatalog::build({{"PAIR", R"(\d{2})"}, {"TRIPLE", R"(\d{3})"}});
    auto hits = cat.findAll(std::string("12345"));
    // PAIR: [0,2) [2,4); TRIPLE: [0,3)
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].label, "PAIR");
    EXPECT_EQ(hits[0].span, (MatchSpan{0, 2}));
    EXPECT_EQ(hits[1].span, (MatchSpan{2, 4}));
    EXPECT_EQ(hits[2].label, "TRIPLE");
    EXPECT_EQ(hits[2].span, (MatchSpan{0, 3}));
}

TEST(PatternCatalogTest, MatchingIsCaseInsensitive) {
    auto cat = PatternCatalog::build({{"PAS_MEX", R"(\bG-\d{8}\b)"}});
    auto hits = cat.findAll(std::string("pasaporte g-12345678"));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].span, (MatchSpan{10, 20}));
}

TEST(PatternCatalogTest, OffsetsAreCodePoints) {
    auto cat = PatternCatalog::build({{"PAS_CHI", R"(\b[Cc]-\d{8}\b)"}});
    // each "ñ" is two bytes in UTF-8
    auto hits = cat.findAll(std::string("Pasaporte ñoño: C-12345678"));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].span, (MatchSpan{16, 26}));
}

TEST(PatternCatalogTest, OverlappingPatternsBothReport) {
    const auto& cat = PatternCatalog::builtin();
    auto hits = cat.findAll(std::string("CUIT 20-12345678-1"));
    bool cuit = false;
    bool pry = false;
    for (const auto& h : hits) {
        if (h.label == "CUIT_ARG" && h.span == MatchSpan{5, 18}) cuit = true;
        if (h.label == "RUC_PRY" && h.span == MatchSpan{8, 18}) pry = true;
    }
    EXPECT_TRUE(cuit);
    EXPECT_TRUE(pry);
}

TEST(PatternCatalogTest, ConcurrentReadersSeeSameMatches) {
    const auto& cat = PatternCatalog::builtin();
    const std::string text = "RUT 12.345.678-9 y CUIT 20-12345678-1";
    const size_t expected = cat.findAll(text).size();

    std::vector<std::thread> threads;
    std::vector<size_t> counts(8, 0);
    for (size_t i = 0; i < counts.size(); ++i) {
        threads.emplace_back([&cat, &text, &counts, i]() {
            for (int n = 0; n < 50; ++n) {
                counts[i] = cat.findAll(text).size();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (size_t c : counts) {
        EXPECT_EQ(c, expected);
    }
}

TEST(PatternCatalogTest, FingerprintFollowsContentAndOrder) {
    std::vector<PatternSource> a = {{"A", R"(\d{3})"}, {"B", R"(\d{4})"}};
    std::vector<PatternSource> b = {{"B", R"(\d{4})"}, {"A", R"(\d{3})"}};
    EXPECT_EQ(PatternCatalog::build(a).fingerprint(), PatternCatalog::build(a).fingerprint());
    EXPECT_NE(PatternCatalog::build(a).fingerprint(), PatternCatalog::build(b).fingerprint());
}

TEST(PatternCatalogTest, UnknownLocaleFallsBack) {
    auto cat = PatternCatalog::build({{"PAS_MEX", R"(\bG-\d{8}\b)"}}, "xx_NOT.A-LOCALE");
    EXPECT_EQ(cat.findAll(std::string("G-12345678")).size(), 1u);
}

TEST(PatternCatalogTest, WhitespaceAndDigitClassesAreUnicodeWide) {
    auto sep = PatternCatalog::build({{"SEP", R"(\d\s\d)"}});
    EXPECT_EQ(sep.findAll(std::wstring(L"1\u00a02")).size(), 1u);
    EXPECT_EQ(sep.findAll(std::wstring(L"\u0661\u3000\u0662")).size(), 1u);

    auto noSep = PatternCatalog::build({{"NOSEP", R"(\d\S\d)"}});
    EXPECT_TRUE(noSep.findAll(std::wstring(L"1\u00a02")).empty());

    auto nonDigit = PatternCatalog::build({{"NONDIGIT", R"([^\d]+)"}});
    EXPECT_TRUE(nonDigit.findAll(std::wstring(L"\u0661\u0662\uff13")).empty());

    auto bracket = PatternCatalog::build({{"BRACKET", R"(\b\d{2}[.\s-]\d{3}\b)"}});
    auto hits = bracket.findAll(std::wstring(L"x 12\u202f345 y"));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].span, (MatchSpan{2, 8}));
}

// ---------------------------------------------------------------------------
// Pattern files
// ---------------------------------------------------------------------------

TEST(PatternFileTest, ParsesLabelsAndRegexesInOrder) {
    std::istringstream in(
        "# Chile\n"
        "RUT_CHI = \\b\\d{1,2}[.\\s-]\\d{3}[.\\s-]\\d{3}[.\\s-]?[\\dkK]\\b\n"
        "\n"
        "EQ=a=b\n");
    auto sources = idredact::catalog::parsePatternLines(in, "inline");
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].first, "RUT_CHI");
    EXPECT_EQ(sources[0].second, R"(\b\d{1,2}[.\s-]\d{3}[.\s-]\d{3}[.\s-]?[\dkK]\b)");
    EXPECT_EQ(sources[1].first, "EQ");
    EXPECT_EQ(sources[1].second, "a=b");
}

TEST(PatternFileTest, MalformedLinesThrow) {
    std::istringstream noEquals("JUST_A_LABEL\n");
    EXPECT_THROW(idredact::catalog::parsePatternLines(noEquals, "inline"), std::runtime_error);

    std::istringstream emptyRegex("LABEL=\n");
    EXPECT_THROW(idredact::catalog::parsePatternLines(emptyRegex, "inline"), std::runtime_error);
}

TEST(PatternFileTest, MissingFileThrows) {
    EXPECT_THROW(idredact::catalog::loadPatternFile("does/not/exist.conf"), std::runtime_error);
}

TEST(PatternFileTest, BuiltinSourcesRoundTripThroughParser) {
    std::ostringstream out;
    for (const auto& p : idredact::catalog::builtinPatterns()) {
        out << p.first << "=" << p.second << "\n";
    }
    std::istringstream in(out.str());
    auto parsed = idredact::catalog::parsePatternLines(in, "builtin");
    EXPECT_EQ(parsed, idredact::catalog::builtinPatterns());
    EXPECT_EQ(PatternCatalog::build(parsed).fingerprint(), PatternCatalog::builtin().fingerprint());
}

} // anonymous namespace
