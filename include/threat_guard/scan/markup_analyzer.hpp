#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace scan {

struct MarkupFindings {
    bool parsed = false;
    bool lenient = false;
    size_t script_elements = 0;
    size_t event_handler_attributes = 0;
    size_t external_references = 0;
    std::vector<std::string> event_handler_names;
};

// Best-effort structural analysis of HTML/XML-like content. Well-formed
// buffers go through pugixml; anything else is scanned tag by tag
// (lenient). Buffers that do not look like markup produce empty findings.
class MarkupAnalyzer {
public:
    static size_t countTagLikeSubstrings(std::string_view content);
    static bool looksLikeMarkup(std::string_view content);

    MarkupFindings analyze(std::string_view content) const;

    static bool isEventHandlerAttribute(const std::string& lowered_name);
    static bool isProtocolQualified(const std::string& url);
};

}}
