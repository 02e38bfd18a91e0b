#include "core/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace chat_backup::core::utils {

std::string StringUtils::Join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result << delimiter;
        }
        result << parts[i];
    }
    return result.str();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::Trim(const std::string& str) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };

    auto begin = std::find_if(str.begin(), str.end(), not_space);
    auto end = std::find_if(str.rbegin(), str.rend(), not_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace chat_backup::core::utils
