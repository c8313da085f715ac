#include "threat_guard/scan/markup_analyzer.hpp"
#include "threat_guard/common/logger.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>
#include <vector>

namespace threat_guard {
namespace scan {

namespace {

constexpr size_t MIN_TAG_LIKE_SUBSTRINGS = 3;

const std::set<std::string> EVENT_HANDLER_ATTRIBUTES = {
    "onabort", "onafterprint", "onanimationstart", "onbeforeunload", "onblur",
    "onchange", "onclick", "oncontextmenu", "ondblclick", "ondrag", "ondrop",
    "onerror", "onfocus", "onhashchange", "oninput", "oninvalid", "onkeydown",
    "onkeypress", "onkeyup", "onload", "onmessage", "onmousedown", "onmouseenter",
    "onmouseleave", "onmousemove", "onmouseout", "onmouseover", "onmouseup",
    "onpageshow", "onpointerdown", "onpopstate", "onreset", "onresize", "onscroll",
    "onselect", "onsubmit", "ontoggle", "ontouchstart", "onunload", "onwheel"
};

std::string lowered(const char* text) {
    std::string out = text ? text : "";
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string localName(const std::string& qualified) {
    size_t colon = qualified.find(':');
    return colon == std::string::npos ? qualified : qualified.substr(colon + 1);
}

using Attributes = std::vector<std::pair<std::string, std::string>>;

// Applies the script, event handler and external reference checks to one
// element. Names are expected lowercased.
void recordElement(const std::string& name, const Attributes& attributes, MarkupFindings& findings) {
    if (name == "script") {
        findings.script_elements++;
    }

    for (const auto& [attr_name, value] : attributes) {
        if (MarkupAnalyzer::isEventHandlerAttribute(attr_name)) {
            findings.event_handler_attributes++;
            if (findings.event_handler_names.size() < 8 &&
                std::find(findings.event_handler_names.begin(), findings.event_handler_names.end(),
                          attr_name) == findings.event_handler_names.end()) {
                findings.event_handler_names.push_back(attr_name);
            }
        }

        bool reference_attr = (name == "link" && attr_name == "href") ||
                              (name == "script" && attr_name == "src") ||
                              (name == "img" && attr_name == "src");
        if (reference_attr && MarkupAnalyzer::isProtocolQualified(value)) {
            findings.external_references++;
        }
    }
}

class MarkupWalker : public pugi::xml_tree_walker {
public:
    explicit MarkupWalker(MarkupFindings& findings) : findings_(findings) {}

    bool for_each(pugi::xml_node& node) override {
        if (node.type() != pugi::node_element) return true;

        Attributes attributes;
        for (pugi::xml_attribute attr : node.attributes()) {
            attributes.emplace_back(lowered(attr.name()), attr.value());
        }
        recordElement(localName(lowered(node.name())), attributes, findings_);
        return true;
    }

private:
    MarkupFindings& findings_;
};

bool isNameChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '-' || c == '_' || c == ':' || c == '.';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Splits the inside of one start tag ("img src=x onerror='y'") into an
// element name and attributes. Quoted and unquoted values are accepted.
bool parseStartTag(std::string_view tag, std::string& name, Attributes& attributes) {
    size_t pos = 0;
    while (pos < tag.size() && isNameChar(tag[pos])) ++pos;
    if (pos == 0) return false;
    name = localName(lowered(std::string(tag.substr(0, pos)).c_str()));

    while (pos < tag.size()) {
        while (pos < tag.size() && (isSpace(tag[pos]) || tag[pos] == '/')) ++pos;
        size_t name_start = pos;
        while (pos < tag.size() && !isSpace(tag[pos]) && tag[pos] != '=' && tag[pos] != '/') ++pos;
        if (pos == name_start) {
            if (pos < tag.size()) ++pos;
            continue;
        }
        std::string attr_name = lowered(std::string(tag.substr(name_start, pos - name_start)).c_str());

        while (pos < tag.size() && isSpace(tag[pos])) ++pos;
        std::string value;
        if (pos < tag.size() && tag[pos] == '=') {
            ++pos;
            while (pos < tag.size() && isSpace(tag[pos])) ++pos;
            if (pos < tag.size() && (tag[pos] == '"' || tag[pos] == '\'')) {
                char quote = tag[pos++];
                size_t end = tag.find(quote, pos);
                if (end == std::string_view::npos) end = tag.size();
                value = std::string(tag.substr(pos, end - pos));
                pos = std::min(end + 1, tag.size());
            } else {
                size_t value_start = pos;
                while (pos < tag.size() && !isSpace(tag[pos])) ++pos;
                value = std::string(tag.substr(value_start, pos - value_start));
            }
        }
        attributes.emplace_back(std::move(attr_name), std::move(value));
    }
    return true;
}

// Tag-by-tag scan used when the buffer is not well-formed XML, which is
// the common case for HTML (void elements, unquoted attributes).
void scanTagsLexically(std::string_view content, MarkupFindings& findings) {
    size_t pos = 0;
    while ((pos = content.find('<', pos)) != std::string_view::npos) {
        size_t close = content.find_first_of("<>", pos + 1);
        if (close == std::string_view::npos) break;
        if (content[close] != '>') {
            pos = close;
            continue;
        }

        std::string_view tag = content.substr(pos + 1, close - pos - 1);
        pos = close + 1;
        if (tag.empty() || tag[0] == '/' || tag[0] == '!' || tag[0] == '?') continue;

        std::string name;
        Attributes attributes;
        if (parseStartTag(tag, name, attributes)) {
            recordElement(name, attributes, findings);
        }
    }
}

}

size_t MarkupAnalyzer::countTagLikeSubstrings(std::string_view content) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = content.find('<', pos)) != std::string_view::npos) {
        size_t close = content.find_first_of("<>", pos + 1);
        if (close == std::string_view::npos) break;
        if (content[close] == '>' && close > pos + 1) {
            ++count;
            pos = close + 1;
        } else {
            pos = close;
        }
    }
    return count;
}

bool MarkupAnalyzer::looksLikeMarkup(std::string_view content) {
    return countTagLikeSubstrings(content) >= MIN_TAG_LIKE_SUBSTRINGS;
}

bool MarkupAnalyzer::isEventHandlerAttribute(const std::string& lowered_name) {
    return EVENT_HANDLER_ATTRIBUTES.count(lowered_name) > 0;
}

bool MarkupAnalyzer::isProtocolQualified(const std::string& url) {
    std::string value = lowered(url.c_str());
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return false;
    value = value.substr(start);

    if (value.compare(0, 2, "//") == 0) return true;

    size_t colon = value.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    return std::all_of(value.begin(), value.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](unsigned char c) { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; });
}

MarkupFindings MarkupAnalyzer::analyze(std::string_view content) const {
    MarkupFindings findings;

    if (!looksLikeMarkup(content)) {
        return findings;
    }

    size_t first_tag = content.find('<');
    std::string_view markup = content.substr(first_tag);

    unsigned int flags = pugi::parse_default | pugi::parse_fragment;
    flags &= ~pugi::parse_doctype;

    pugi::xml_document document;
    pugi::xml_parse_result result = document.load_buffer(markup.data(), markup.size(),
                                                         flags, pugi::encoding_utf8);
    findings.parsed = true;
    if (!result) {
        common::Logger::instance().debug("[Markup] Not well-formed, scanning tags | error={} | offset={}",
                                         result.description(), static_cast<size_t>(result.offset));
        findings.lenient = true;
        scanTagsLexically(markup, findings);
        return findings;
    }

    MarkupWalker walker(findings);
    document.traverse(walker);
    return findings;
}

}}
