#pragma once

#include <map>
#include <string>
#include <unordered_map>

namespace threat_guard {
namespace common {

enum class RiskLevel;

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* event_kind;
    RiskLevel severity;
    const char* user_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        return getFallback();
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).user_message;
    }

    static const char* getEventKind(EnumType code) {
        return getInfo(code).event_kind;
    }

    static RiskLevel getSeverity(EnumType code) {
        return getInfo(code).severity;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
    static const ErrorInfo<EnumType>& getFallback();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    if (!ctx.component.empty()) {
        result = "component=" + ctx.component;
    }
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

}}
