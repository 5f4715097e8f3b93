/**
 * ResponseCleaner.cpp - Strip model formatting quirks from a suggested command
 */

#include "shlama/ResponseCleaner.hpp"
#include "shlama/Config.hpp"

#include <regex>

namespace shlama {

std::string cleanResponse(const std::string& raw) {
    // Tag only counts when the fence line ends, so "```ls -la```" keeps "ls"
    static const std::regex leading_fence(R"(^```(?:[A-Za-z0-9_+#.\-]*[ \t]*\r?\n)?)");
    static const std::regex trailing_fence(R"(```$)");
    
    std::string text = trim(raw);
    text = std::regex_replace(text, leading_fence, "", std::regex_constants::format_first_only);
    text = std::regex_replace(text, trailing_fence, "", std::regex_constants::format_first_only);
    text = trim(text);
    
    if (!text.empty() && text.front() == '`') {
        text.erase(0, 1);
    }
    if (!text.empty() && text.back() == '`') {
        text.pop_back();
    }
    
    return trim(text);
}

} // namespace shlama
