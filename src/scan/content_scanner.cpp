#include "threat_guard/scan/content_scanner.hpp"
#include "threat_guard/scan/signatures.hpp"
#include "threat_guard/common/constants.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <set>

namespace threat_guard {
namespace scan {

namespace {

constexpr size_t SNIPPET_LENGTH = 50;
constexpr double MULTIPLE_SIGNATURES_CONFIDENCE = 0.8;
constexpr double EMBEDDED_SCRIPTS_CONFIDENCE = 0.9;
constexpr double EVENT_HANDLERS_CONFIDENCE = 0.85;
constexpr double EXTERNAL_RESOURCES_CONFIDENCE = 0.6;
constexpr double NULL_BYTES_CONFIDENCE = 0.6;
constexpr double HIGH_ENTROPY_CONFIDENCE = 0.7;

const std::set<std::string> CRITICAL_KINDS = {
    "script_tag", "pe_executable", "elf_executable", "gif_script_polyglot"
};

bool closedTagFollows(std::string_view window, size_t offset) {
    return window.find('>', offset) != std::string_view::npos;
}

bool peHeaderAt(std::string_view window, size_t offset) {
    return hasValidPeHeader(window, offset);
}

bool elfHeaderAt(std::string_view window, size_t offset) {
    return hasValidElfHeader(window, offset);
}

std::string asciiLower(std::string_view data) {
    std::string out(data);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string printableSnippet(std::string_view data, size_t offset) {
    std::string snippet;
    size_t end = std::min(data.size(), offset + SNIPPET_LENGTH);
    for (size_t i = offset; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (std::isprint(c)) {
            snippet += static_cast<char>(c);
        } else {
            snippet += fmt::format("\\x{:02X}", c);
        }
    }
    return snippet;
}

ThreatEvidence patternEvidence(const PatternRule& rule, std::string_view raw, size_t offset) {
    ThreatEvidence item;
    item.kind = rule.kind;
    item.confidence = rule.confidence;
    item.byte_offset = offset;
    item.description = "Dangerous pattern detected: " + printableSnippet(raw, offset) + "...";
    return item;
}

void matchSingle(const PatternRule& rule, std::string_view raw, std::string_view haystack,
                 std::vector<ThreatEvidence>& out) {
    size_t reported = 0;
    for (const auto& needle : rule.needles) {
        size_t pos = 0;
        while (reported < constants::limits::MAX_MATCHES_PER_PATTERN &&
               (pos = haystack.find(needle, pos)) != std::string_view::npos) {
            size_t validate_at = (rule.mode == MatchMode::BYTES) ? pos : pos + needle.size();
            bool accepted = !(rule.embedded_only && pos == 0) &&
                            (rule.validator == nullptr || rule.validator(raw, validate_at));
            if (accepted) {
                out.push_back(patternEvidence(rule, raw, pos));
                ++reported;
            }
            pos += needle.size();
        }
    }
}

void matchOrderedPair(const PatternRule& rule, std::string_view raw, std::string_view haystack,
                      std::vector<ThreatEvidence>& out) {
    size_t last_follower = haystack.rfind(rule.follower);
    if (last_follower == std::string_view::npos) return;

    std::vector<size_t> starts;
    for (const auto& needle : rule.needles) {
        size_t pos = 0;
        while ((pos = haystack.find(needle, pos)) != std::string_view::npos &&
               pos + needle.size() <= last_follower) {
            starts.push_back(pos);
            pos += needle.size();
        }
    }

    std::sort(starts.begin(), starts.end());
    size_t limit = std::min(starts.size(), constants::limits::MAX_MATCHES_PER_PATTERN);
    for (size_t i = 0; i < limit; ++i) {
        out.push_back(patternEvidence(rule, raw, starts[i]));
    }
}

}

std::string to_string(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::ALLOW: return "allow";
        case Recommendation::SANITIZE: return "sanitize";
        case Recommendation::QUARANTINE: return "quarantine";
        case Recommendation::REJECT: return "reject";
        default: return "unknown";
    }
}

std::string recommendationText(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::REJECT:
            return "REJECT: File contains critical security threats and should be blocked immediately";
        case Recommendation::QUARANTINE:
            return "QUARANTINE: File requires manual review before allowing upload";
        case Recommendation::SANITIZE:
            return "SANITIZE: Consider additional processing or content filtering";
        case Recommendation::ALLOW:
        default:
            return "ALLOW: File appears safe for upload with standard precautions";
    }
}

Recommendation recommendationFor(common::RiskLevel risk) {
    switch (risk) {
        case common::RiskLevel::CRITICAL: return Recommendation::REJECT;
        case common::RiskLevel::HIGH: return Recommendation::QUARANTINE;
        case common::RiskLevel::MEDIUM: return Recommendation::SANITIZE;
        default: return Recommendation::ALLOW;
    }
}

const std::vector<PatternRule>& dangerousPatternTable() {
    static const std::vector<PatternRule> table = {
        {"script_tag", MatchMode::TEXT, {"<script"}, "", 0.9, false, closedTagFollows},
        {"javascript_protocol", MatchMode::TEXT, {"javascript:"}, "", 0.8, false, nullptr},
        {"vbscript_protocol", MatchMode::TEXT, {"vbscript:"}, "", 0.8, false, nullptr},
        {"data_uri_html", MatchMode::TEXT, {"data:text/html"}, "", 0.9, false, nullptr},

        {"pe_executable", MatchMode::BYTES, {"MZ"}, "", 0.95, false, peHeaderAt},
        {"elf_executable", MatchMode::BYTES, {std::string("\x7F" "ELF")}, "", 0.95, false, elfHeaderAt},

        {"embedded_zip", MatchMode::BYTES, {std::string("PK\x03\x04", 4)}, "", 0.7, true, nullptr},
        {"embedded_jpeg", MatchMode::BYTES, {std::string("\xFF\xD8\xFF")}, "", 0.6, true, nullptr},

        {"gif_script_polyglot", MatchMode::ORDERED_PAIR, {"gif87a", "gif89a"}, "<script", 0.95, false, nullptr},
        {"jpeg_html_polyglot", MatchMode::ORDERED_PAIR, {std::string("\xFF\xD8\xFF")}, "<html", 0.9, false, nullptr},
        {"png_js_polyglot", MatchMode::ORDERED_PAIR, {"png"}, "javascript:", 0.85, false, nullptr}
    };
    return table;
}

bool isCriticalEvidenceKind(const std::string& kind) {
    return CRITICAL_KINDS.count(kind) > 0;
}

ContentThreatScanner::ContentThreatScanner(const common::ScannerConfig& config)
    : config_(config) {}

ContentAnalysisResult ContentThreatScanner::analyze(std::string_view buffer) const {
    return analyze(buffer, config_.max_analysis_bytes);
}

ContentAnalysisResult ContentThreatScanner::analyze(std::string_view buffer, size_t max_analysis_bytes) const {
    std::string_view window = buffer.substr(0, std::min(buffer.size(), max_analysis_bytes));

    try {
        auto evidence = runFullAnalysis(window);
        auto result = buildResult(std::move(evidence), window.size());

        common::Logger::instance().debug("[Scanner] Analysis complete | bytes={} | evidence={} | risk={}",
                                         window.size(), result.evidence.size(),
                                         common::to_string(result.risk_level));
        return result;
    } catch (const std::exception& e) {
        common::Logger::instance().warn("[Scanner] Full analysis failed, using basic pattern scan | error={}",
                                        e.what());
    }

    std::string_view reduced = window.substr(0, std::min(window.size(), constants::limits::FALLBACK_ANALYSIS_BYTES));

    ContentAnalysisResult result;
    result.evidence = scanPatterns(reduced);
    result.is_threat = !result.evidence.empty();
    result.risk_level = result.is_threat ? common::RiskLevel::MEDIUM : common::RiskLevel::LOW;
    result.recommendation = recommendationFor(result.risk_level);
    result.analyzed_bytes = reduced.size();
    result.degraded = true;
    return result;
}

std::vector<ThreatEvidence> ContentThreatScanner::runFullAnalysis(std::string_view window) const {
    std::vector<ThreatEvidence> evidence;

    detectSignatures(window, evidence);

    auto patterns = scanPatterns(window);
    evidence.insert(evidence.end(), patterns.begin(), patterns.end());

    detectMarkup(window, evidence);
    detectStructure(window, evidence);

    return evidence;
}

std::vector<ThreatEvidence> ContentThreatScanner::scanPatterns(std::string_view window) {
    std::vector<ThreatEvidence> evidence;
    std::string lowered = asciiLower(window);

    for (const auto& rule : dangerousPatternTable()) {
        std::string_view haystack = (rule.mode == MatchMode::BYTES) ? window : std::string_view(lowered);

        if (rule.mode == MatchMode::ORDERED_PAIR) {
            matchOrderedPair(rule, window, haystack, evidence);
        } else {
            matchSingle(rule, window, haystack, evidence);
        }
    }
    return evidence;
}

void ContentThreatScanner::detectSignatures(std::string_view window, std::vector<ThreatEvidence>& evidence) const {
    auto formats = detectFileSignatures(window);
    if (countSignatureFamilies(formats) <= 1) return;

    std::string joined;
    for (const auto& format : formats) {
        if (!joined.empty()) joined += ", ";
        joined += format;
    }

    evidence.push_back({"multiple_signatures", MULTIPLE_SIGNATURES_CONFIDENCE, 0,
                        "Multiple file signatures detected: " + joined});
}

MarkupFindings ContentThreatScanner::analyzeMarkup(std::string_view window) const {
    return markup_analyzer_.analyze(window);
}

void ContentThreatScanner::detectMarkup(std::string_view window, std::vector<ThreatEvidence>& evidence) const {
    auto findings = analyzeMarkup(window);
    if (!findings.parsed) return;

    if (findings.script_elements > 0) {
        size_t offset = asciiLower(window).find("<script");
        evidence.push_back({"embedded_scripts", EMBEDDED_SCRIPTS_CONFIDENCE,
                            offset == std::string::npos ? 0 : offset,
                            fmt::format("{} script tags found in markup content", findings.script_elements)});
    }

    if (findings.event_handler_attributes > 0) {
        std::string names;
        for (const auto& name : findings.event_handler_names) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        evidence.push_back({"event_handlers", EVENT_HANDLERS_CONFIDENCE, 0,
                            "Event handler attributes detected in markup: " + names});
    }

    if (findings.external_references > 0) {
        evidence.push_back({"external_resources", EXTERNAL_RESOURCES_CONFIDENCE, 0,
                            fmt::format("{} external resources referenced in markup",
                                        findings.external_references)});
    }
}

void ContentThreatScanner::detectStructure(std::string_view window, std::vector<ThreatEvidence>& evidence) const {
    size_t null_count = static_cast<size_t>(std::count(window.begin(), window.end(), '\0'));
    if (null_count > config_.null_byte_threshold && null_count * 10 < window.size()) {
        evidence.push_back({"suspicious_null_bytes", NULL_BYTES_CONFIDENCE, window.find('\0'),
                            fmt::format("Suspicious null byte pattern ({} null bytes)", null_count)});
    }

    double entropy = shannonEntropy(window.substr(0, std::min(window.size(), config_.entropy_window_bytes)));
    if (entropy > config_.entropy_threshold) {
        evidence.push_back({"high_entropy", HIGH_ENTROPY_CONFIDENCE, 0,
                            fmt::format("High entropy content detected ({:.2f})", entropy)});
    }
}

double ContentThreatScanner::shannonEntropy(std::string_view data) {
    if (data.empty()) return 0.0;

    std::array<size_t, 256> frequencies{};
    for (char c : data) {
        frequencies[static_cast<uint8_t>(c)]++;
    }

    double entropy = 0.0;
    const double length = static_cast<double>(data.size());
    for (size_t count : frequencies) {
        if (count == 0) continue;
        double probability = static_cast<double>(count) / length;
        entropy -= probability * std::log2(probability);
    }
    return entropy;
}

common::RiskLevel ContentThreatScanner::calculateRiskLevel(const std::vector<ThreatEvidence>& evidence) const {
    using common::RiskLevel;

    if (evidence.empty()) return RiskLevel::LOW;

    double max_confidence = 0.0;
    bool has_critical_kind = false;
    for (const auto& item : evidence) {
        max_confidence = std::max(max_confidence, item.confidence);
        has_critical_kind = has_critical_kind || isCriticalEvidenceKind(item.kind);
    }

    if (has_critical_kind || max_confidence >= config_.critical_confidence) return RiskLevel::CRITICAL;
    if (max_confidence >= config_.high_confidence || evidence.size() >= config_.high_evidence_count) {
        return RiskLevel::HIGH;
    }
    if (max_confidence >= config_.medium_confidence || evidence.size() >= config_.medium_evidence_count) {
        return RiskLevel::MEDIUM;
    }
    return RiskLevel::LOW;
}

ContentAnalysisResult ContentThreatScanner::buildResult(std::vector<ThreatEvidence> evidence, size_t analyzed_bytes) const {
    ContentAnalysisResult result;
    result.risk_level = calculateRiskLevel(evidence);
    result.recommendation = recommendationFor(result.risk_level);
    result.is_threat = !evidence.empty();
    result.evidence = std::move(evidence);
    result.analyzed_bytes = analyzed_bytes;
    return result;
}

}}
