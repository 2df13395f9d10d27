#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {
    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool ieq(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line) {
        const auto pos = line.find(':');
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        return std::make_pair(trim(std::string(line.substr(0, pos))), trim(std::string(line.substr(pos + 1))));
    }

    std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> out;
        size_t start = 0;
        while (start < text.size()) {
            size_t pos = text.find('\n', start);
            size_t end = (pos == std::string_view::npos) ? text.size() : pos;

            std::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            out.emplace_back(line);

            if (pos == std::string_view::npos) {
                break;
            }
            start = pos + 1;
        }
        return out;
    }

    std::string strip_query(std::string_view url) { return std::string(url.substr(0, url.find('?'))); }
}  // namespace string_utils
