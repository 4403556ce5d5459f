#include "rest_check/media_type.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace rest_check {

    namespace {

        std::string_view trim(std::string_view s) {
            constexpr std::string_view ws = " \t";
            const auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos) return {};
            const auto last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }

        std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// Split on ';' outside of quoted strings.
        std::vector<std::string_view> split_parameters(std::string_view s) {
            std::vector<std::string_view> parts;
            bool quoted = false;
            size_t start = 0;
            for (size_t i = 0; i < s.size(); ++i) {
                const char c = s[i];
                if (quoted && c == '\\') {
                    ++i;
                } else if (c == '"') {
                    quoted = !quoted;
                } else if (c == ';' && !quoted) {
                    parts.push_back(s.substr(start, i - start));
                    start = i + 1;
                }
            }
            parts.push_back(s.substr(start));
            return parts;
        }

        std::string unquote(std::string_view v) {
            if (v.size() < 2 || v.front() != '"' || v.back() != '"') {
                return std::string(v);
            }
            std::string out;
            out.reserve(v.size() - 2);
            for (size_t i = 1; i + 1 < v.size(); ++i) {
                if (v[i] == '\\' && i + 2 < v.size()) ++i;
                out.push_back(v[i]);
            }
            return out;
        }

    }  // namespace

    std::string_view MediaType::suffix() const noexcept {
        const auto plus = subtype.rfind('+');
        if (plus == std::string::npos) return {};
        return std::string_view(subtype).substr(plus + 1);
    }

    std::optional<MediaType> parse_media_type(std::string_view value) {
        const auto parts = split_parameters(value);
        const std::string_view essence = trim(parts.front());

        const auto slash = essence.find('/');
        if (slash == std::string_view::npos) return std::nullopt;

        MediaType out;
        out.type = to_lower(trim(essence.substr(0, slash)));
        out.subtype = to_lower(trim(essence.substr(slash + 1)));
        if (out.type.empty() || out.subtype.empty()) return std::nullopt;

        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string_view param = trim(parts[i]);
            const auto eq = param.find('=');
            // Parameters without a value are not meaningful here.
            if (eq == std::string_view::npos) continue;
            std::string name = to_lower(trim(param.substr(0, eq)));
            if (name.empty()) continue;
            out.parameters.emplace(std::move(name),
                                   unquote(trim(param.substr(eq + 1))));
        }
        return out;
    }

    ContentTypeMatcher::ContentTypeMatcher(
        std::initializer_list<std::string_view> ranges) {
        for (std::string_view r : ranges) add_range(r);
    }

    ContentTypeMatcher::ContentTypeMatcher(
        const std::vector<std::string>& ranges) {
        for (const auto& r : ranges) add_range(r);
    }

    void ContentTypeMatcher::add_range(std::string_view range) {
        auto parsed = parse_media_type(range);
        if (!parsed) {
            spdlog::warn("rest_check: ignoring malformed media range '{}'",
                         range);
            return;
        }
        m_ranges.push_back(std::move(*parsed));
    }

    bool ContentTypeMatcher::matches(std::string_view content_type) const {
        const auto media = parse_media_type(content_type);
        if (!media) return false;
        return std::any_of(
            m_ranges.begin(), m_ranges.end(), [&](const MediaType& range) {
                if (range.type == "*") return range.subtype == "*";
                if (range.type != media->type) return false;
                return range.subtype == "*" || range.subtype == media->subtype;
            });
    }

}  // namespace rest_check
