#pragma once
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rest_check {

    /**
     * @brief A parsed Content-Type value: `type/subtype; name=value`.
     *
     * Type, subtype and parameter names are lowercased. Parameter values keep
     * their case, with surrounding quotes removed.
     */
    struct MediaType {
        std::string type;
        std::string subtype;
        std::map<std::string, std::string> parameters;

        /// @brief Structured syntax suffix, e.g. "json" for
        /// "application/problem+json". Empty if there is none.
        [[nodiscard]] std::string_view suffix() const noexcept;

        /// @brief "type/subtype" without parameters.
        [[nodiscard]] std::string essence() const {
            return type + "/" + subtype;
        }
    };

    /// @brief Parse a Content-Type header value.
    /// @return std::nullopt if the value has no `type/subtype` part.
    [[nodiscard]] std::optional<MediaType> parse_media_type(
        std::string_view value);

    /// @brief Matches Content-Type values against a list of media ranges.
    ///
    /// Ranges are `type/subtype`, `type/*` or `*/*`. Parameters on either
    /// side are ignored.
    class ContentTypeMatcher {
       public:
        /**
         * @brief Constructs a matcher accepting any of the given ranges.
         * @param ranges Media ranges such as "application/json".
         */
        ContentTypeMatcher(std::initializer_list<std::string_view> ranges);
        explicit ContentTypeMatcher(const std::vector<std::string>& ranges);

        /// @brief True if `content_type` parses and falls in any range.
        [[nodiscard]] bool matches(std::string_view content_type) const;

        [[nodiscard]] const std::vector<MediaType>& ranges() const noexcept {
            return m_ranges;
        }

       private:
        void add_range(std::string_view range);

        std::vector<MediaType> m_ranges;
    };

}  // namespace rest_check
