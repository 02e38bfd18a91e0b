#pragma once

#include <string>
#include <vector>

namespace chat_backup::core::utils {

class StringUtils {
public:
    static std::string Join(const std::vector<std::string>& parts, const std::string& delimiter);

    static std::string ToLower(const std::string& str);

    static std::string Trim(const std::string& str);

    static bool StartsWith(const std::string& str, const std::string& prefix);
};

} // namespace chat_backup::core::utils
