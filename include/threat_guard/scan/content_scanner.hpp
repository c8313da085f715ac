#pragma once

#include "markup_analyzer.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace scan {

enum class Recommendation {
    ALLOW,
    SANITIZE,
    QUARANTINE,
    REJECT
};

std::string to_string(Recommendation recommendation);
std::string recommendationText(Recommendation recommendation);
Recommendation recommendationFor(common::RiskLevel risk);

struct ThreatEvidence {
    std::string kind;
    double confidence = 0.0;
    size_t byte_offset = 0;
    std::string description;
};

struct ContentAnalysisResult {
    bool is_threat = false;
    std::vector<ThreatEvidence> evidence;
    common::RiskLevel risk_level = common::RiskLevel::LOW;
    Recommendation recommendation = Recommendation::ALLOW;
    size_t analyzed_bytes = 0;
    bool degraded = false;
};

enum class MatchMode {
    TEXT,
    BYTES,
    ORDERED_PAIR
};

using MatchValidator = bool (*)(std::string_view window, size_t offset);

struct PatternRule {
    const char* kind;
    MatchMode mode;
    std::vector<std::string> needles;
    std::string follower;
    double confidence;
    bool embedded_only;
    MatchValidator validator;
};

// Ordered dangerous-pattern table. TEXT and ORDERED_PAIR rules match
// case-insensitively, BYTES rules match raw bytes.
const std::vector<PatternRule>& dangerousPatternTable();

bool isCriticalEvidenceKind(const std::string& kind);

class ContentThreatScanner {
public:
    explicit ContentThreatScanner(const common::ScannerConfig& config = common::ScannerConfig{});
    virtual ~ContentThreatScanner() = default;

    ContentAnalysisResult analyze(std::string_view buffer) const;
    ContentAnalysisResult analyze(std::string_view buffer, size_t max_analysis_bytes) const;

    common::RiskLevel calculateRiskLevel(const std::vector<ThreatEvidence>& evidence) const;

    static double shannonEntropy(std::string_view data);
    static std::vector<ThreatEvidence> scanPatterns(std::string_view window);

    const common::ScannerConfig& config() const { return config_; }

protected:
    virtual MarkupFindings analyzeMarkup(std::string_view window) const;

private:
    common::ScannerConfig config_;
    MarkupAnalyzer markup_analyzer_;

    std::vector<ThreatEvidence> runFullAnalysis(std::string_view window) const;
    void detectSignatures(std::string_view window, std::vector<ThreatEvidence>& evidence) const;
    void detectMarkup(std::string_view window, std::vector<ThreatEvidence>& evidence) const;
    void detectStructure(std::string_view window, std::vector<ThreatEvidence>& evidence) const;
    ContentAnalysisResult buildResult(std::vector<ThreatEvidence> evidence, size_t analyzed_bytes) const;
};

}}
