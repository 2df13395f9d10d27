#ifndef TRANSFER_METER_STRING_UTILS_HPP
#define TRANSFER_METER_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool ieq(std::string_view a, std::string_view b);

    std::string to_lower(std::string_view s);

    std::string trim(std::string s);

    // Splits "Name: value" into its trimmed parts. Returns nullopt for lines without a colon.
    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line);

    std::vector<std::string> split_lines(std::string_view text);

    std::string strip_query(std::string_view url);
}  // namespace string_utils

#endif
