#include "model.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace http::model {
    namespace {
        bool has_name(const std::string& line, std::string_view name) {
            const auto parts = string_utils::split_header_line(line);
            return parts && string_utils::ieq(parts->first, name);
        }
    }  // namespace

    std::optional<std::string> header_value(const std::vector<std::string>& headers, std::string_view name) {
        for (const auto& line : headers) {
            const auto parts = string_utils::split_header_line(line);
            if (parts && string_utils::ieq(parts->first, name)) {
                return parts->second;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> header_names(const std::vector<std::string>& headers) {
        std::vector<std::string> names;
        for (const auto& line : headers) {
            const auto parts = string_utils::split_header_line(line);
            if (!parts) {
                continue;
            }
            const bool seen = std::any_of(names.begin(), names.end(), [&](const std::string& n) { return string_utils::ieq(n, parts->first); });
            if (!seen) {
                names.push_back(parts->first);
            }
        }
        return names;
    }

    void set_header(std::vector<std::string>& headers, std::string_view name, std::string_view value) {
        remove_header(headers, name);
        headers.push_back(std::string(name) + ": " + std::string(value));
    }

    void remove_header(std::vector<std::string>& headers, std::string_view name) {
        headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const std::string& line) { return has_name(line, name); }), headers.end());
    }
}  // namespace http::model
