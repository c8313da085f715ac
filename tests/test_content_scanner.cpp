#include <gtest/gtest.h>
#include "threat_guard/scan/content_scanner.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace threat_guard;
using common::RiskLevel;
using scan::Recommendation;

namespace {

bool hasKind(const scan::ContentAnalysisResult& result, const std::string& kind) {
    return std::any_of(result.evidence.begin(), result.evidence.end(),
                       [&kind](const scan::ThreatEvidence& item) { return item.kind == kind; });
}

class FailingMarkupScanner : public scan::ContentThreatScanner {
protected:
    scan::MarkupFindings analyzeMarkup(std::string_view) const override {
        throw std::runtime_error("markup parser unavailable");
    }
};

}

class ContentScannerTest : public ::testing::Test {
protected:
    scan::ContentThreatScanner scanner;
};

TEST_F(ContentScannerTest, ScriptTagIsCritical) {
    auto result = scanner.analyze("<html><body><script>alert(1)</script></body></html>");

    EXPECT_TRUE(result.is_threat);
    EXPECT_EQ(result.risk_level, RiskLevel::CRITICAL);
    EXPECT_EQ(result.recommendation, Recommendation::REJECT);
    EXPECT_TRUE(hasKind(result, "script_tag"));
    EXPECT_TRUE(hasKind(result, "embedded_scripts"));
    EXPECT_FALSE(result.degraded);
}

TEST_F(ContentScannerTest, UniformBytesAreClean) {
    std::string uniform(1000, 'A');
    auto result = scanner.analyze(uniform);

    EXPECT_FALSE(result.is_threat);
    EXPECT_TRUE(result.evidence.empty());
    EXPECT_EQ(result.risk_level, RiskLevel::LOW);
    EXPECT_EQ(result.recommendation, Recommendation::ALLOW);
    EXPECT_EQ(result.analyzed_bytes, 1000u);
}

TEST_F(ContentScannerTest, EmptyBufferIsClean) {
    auto result = scanner.analyze(std::string_view());
    EXPECT_FALSE(result.is_threat);
    EXPECT_EQ(result.analyzed_bytes, 0u);
}

TEST_F(ContentScannerTest, UnclosedScriptTagIsNotReportedAsTag) {
    auto result = scanner.analyze("a note about <script without closing");
    EXPECT_FALSE(hasKind(result, "script_tag"));
}

TEST_F(ContentScannerTest, GifScriptPolyglot) {
    auto result = scanner.analyze("GIF89a<script>alert(1)</script>");

    EXPECT_TRUE(hasKind(result, "gif_script_polyglot"));
    EXPECT_EQ(result.risk_level, RiskLevel::CRITICAL);
}

TEST_F(ContentScannerTest, JavascriptProtocolIsCaseInsensitive) {
    auto result = scanner.analyze("link: JavaScript:alert(document.cookie)");
    EXPECT_TRUE(hasKind(result, "javascript_protocol"));
    EXPECT_EQ(result.risk_level, RiskLevel::HIGH);
}

TEST_F(ContentScannerTest, EventHandlersAndExternalResources) {
    auto result = scanner.analyze(
        "<div><img src=\"https://evil.example/x.png\" onerror=\"steal()\"/><p>hi</p></div>");

    EXPECT_TRUE(hasKind(result, "event_handlers"));
    EXPECT_TRUE(hasKind(result, "external_resources"));
    EXPECT_FALSE(hasKind(result, "script_tag"));
    EXPECT_EQ(result.risk_level, RiskLevel::HIGH);
    EXPECT_EQ(result.recommendation, Recommendation::QUARANTINE);
}

TEST_F(ContentScannerTest, EventHandlersInLooseHtml) {
    auto result = scanner.analyze(
        "<html><body><img src=http://x/a.png onerror=alert(1)><br><p>hi</p></body></html>");

    EXPECT_TRUE(result.is_threat);
    EXPECT_TRUE(hasKind(result, "event_handlers"));
    EXPECT_TRUE(hasKind(result, "external_resources"));
}

TEST(MarkupAnalyzerTest, ScansTagsWhenNotWellFormed) {
    scan::MarkupAnalyzer analyzer;
    auto findings = analyzer.analyze(
        "<div><IMG SRC='//cdn.example/a.png' OnLoad=go()><br><script src=\"https://x/y.js\"></div>");

    EXPECT_TRUE(findings.parsed);
    EXPECT_TRUE(findings.lenient);
    EXPECT_EQ(findings.script_elements, 1u);
    EXPECT_EQ(findings.event_handler_attributes, 1u);
    EXPECT_EQ(findings.external_references, 2u);
    EXPECT_EQ(findings.event_handler_names, std::vector<std::string>{"onload"});
}

TEST(MarkupAnalyzerTest, WellFormedMarkupUsesParser) {
    scan::MarkupAnalyzer analyzer;
    auto findings = analyzer.analyze("<div><img src=\"local.png\"/><p>hi</p></div>");

    EXPECT_TRUE(findings.parsed);
    EXPECT_FALSE(findings.lenient);
    EXPECT_EQ(findings.external_references, 0u);
    EXPECT_EQ(findings.event_handler_attributes, 0u);
}

TEST(MarkupAnalyzerTest, IgnoresClosingAndDeclarationTags) {
    scan::MarkupAnalyzer analyzer;
    auto findings = analyzer.analyze("<!DOCTYPE html><p onclick>one</p><p>two<br></p>");

    EXPECT_TRUE(findings.lenient);
    EXPECT_EQ(findings.event_handler_attributes, 1u);
    EXPECT_EQ(findings.script_elements, 0u);
}

TEST_F(ContentScannerTest, EmbeddedExecutableHeader) {
    common::Bytes data = test_util::bytesOf("harmless prefix ");
    size_t mz = data.size();
    data.resize(mz + 0x80, 0x20);
    data[mz] = 'M';
    data[mz + 1] = 'Z';
    data[mz + 0x3C] = 0x40;
    data[mz + 0x3D] = 0;
    data[mz + 0x3E] = 0;
    data[mz + 0x3F] = 0;
    data[mz + 0x40] = 'P';
    data[mz + 0x41] = 'E';
    data[mz + 0x42] = 0;
    data[mz + 0x43] = 0;

    auto result = scanner.analyze(common::asView(data));
    ASSERT_TRUE(hasKind(result, "pe_executable"));
    EXPECT_EQ(result.risk_level, RiskLevel::CRITICAL);

    auto it = std::find_if(result.evidence.begin(), result.evidence.end(),
                           [](const scan::ThreatEvidence& e) { return e.kind == "pe_executable"; });
    EXPECT_EQ(it->byte_offset, mz);
}

TEST_F(ContentScannerTest, MzWithoutPeHeaderIsIgnored) {
    auto result = scanner.analyze("MZ is also a pair of initials");
    EXPECT_FALSE(hasKind(result, "pe_executable"));
}

TEST_F(ContentScannerTest, ZipOnlyCountsWhenEmbedded) {
    std::string leading = std::string("PK\x03\x04", 4) + " archive body";
    EXPECT_FALSE(hasKind(scanner.analyze(leading), "embedded_zip"));

    std::string embedded = "image data " + leading;
    auto result = scanner.analyze(embedded);
    ASSERT_TRUE(hasKind(result, "embedded_zip"));
    EXPECT_EQ(result.risk_level, RiskLevel::MEDIUM);
}

TEST_F(ContentScannerTest, AnalysisWindowLimitsScannedBytes) {
    std::string data = std::string(100, 'A') + "<script>alert(1)</script>";

    auto limited = scanner.analyze(data, 50);
    EXPECT_EQ(limited.analyzed_bytes, 50u);
    EXPECT_FALSE(limited.is_threat);

    auto full = scanner.analyze(data);
    EXPECT_TRUE(full.is_threat);
}

TEST_F(ContentScannerTest, DegradesToPatternScanWhenMarkupFails) {
    FailingMarkupScanner failing;

    auto threat = failing.analyze("<script>alert(1)</script>");
    EXPECT_TRUE(threat.degraded);
    EXPECT_TRUE(threat.is_threat);
    EXPECT_EQ(threat.risk_level, RiskLevel::MEDIUM);
    EXPECT_EQ(threat.recommendation, Recommendation::SANITIZE);

    auto clean = failing.analyze(std::string(10000, 'B'));
    EXPECT_TRUE(clean.degraded);
    EXPECT_FALSE(clean.is_threat);
    EXPECT_EQ(clean.risk_level, RiskLevel::LOW);
    EXPECT_EQ(clean.analyzed_bytes, 4096u);
}

TEST_F(ContentScannerTest, AnalysisIsIdempotent) {
    std::string data = "GIF89a <img onerror=x> javascript:void(0)";
    auto first = scanner.analyze(data);
    auto second = scanner.analyze(data);

    EXPECT_EQ(first.risk_level, second.risk_level);
    ASSERT_EQ(first.evidence.size(), second.evidence.size());
    for (size_t i = 0; i < first.evidence.size(); ++i) {
        EXPECT_EQ(first.evidence[i].kind, second.evidence[i].kind);
        EXPECT_EQ(first.evidence[i].byte_offset, second.evidence[i].byte_offset);
    }
}

TEST_F(ContentScannerTest, RiskLevelFromEvidence) {
    EXPECT_EQ(scanner.calculateRiskLevel({}), RiskLevel::LOW);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.5, 0, ""}}), RiskLevel::LOW);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.65, 0, ""}}), RiskLevel::MEDIUM);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.5, 0, ""}, {"y", 0.5, 0, ""}}), RiskLevel::MEDIUM);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.5, 0, ""}, {"y", 0.5, 0, ""}, {"z", 0.5, 0, ""}}),
              RiskLevel::HIGH);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.85, 0, ""}}), RiskLevel::HIGH);
    EXPECT_EQ(scanner.calculateRiskLevel({{"x", 0.9, 0, ""}}), RiskLevel::CRITICAL);
    EXPECT_EQ(scanner.calculateRiskLevel({{"script_tag", 0.1, 0, ""}}), RiskLevel::CRITICAL);
}

TEST(EntropyTest, KnownDistributions) {
    EXPECT_DOUBLE_EQ(scan::ContentThreatScanner::shannonEntropy(""), 0.0);
    EXPECT_DOUBLE_EQ(scan::ContentThreatScanner::shannonEntropy("AAAA"), 0.0);
    EXPECT_DOUBLE_EQ(scan::ContentThreatScanner::shannonEntropy("abab"), 1.0);

    std::string every_byte;
    for (int i = 0; i < 256; ++i) every_byte.push_back(static_cast<char>(i));
    EXPECT_NEAR(scan::ContentThreatScanner::shannonEntropy(every_byte), 8.0, 1e-9);
}

TEST(RecommendationTest, MapsFromRisk) {
    EXPECT_EQ(scan::recommendationFor(RiskLevel::CRITICAL), Recommendation::REJECT);
    EXPECT_EQ(scan::recommendationFor(RiskLevel::HIGH), Recommendation::QUARANTINE);
    EXPECT_EQ(scan::recommendationFor(RiskLevel::MEDIUM), Recommendation::SANITIZE);
    EXPECT_EQ(scan::recommendationFor(RiskLevel::LOW), Recommendation::ALLOW);
    EXPECT_EQ(scan::recommendationText(Recommendation::REJECT).rfind("REJECT:", 0), 0u);
}
