#pragma once
#include <chrono>
#include <optional>
#include <string_view>

#include "response.hpp"

namespace rest_check {

    /**
     * @brief Parse an HTTP-date, as used by the `Date` header and others.
     *
     * Accepts the three formats HTTP/1.1 allows:
     *  - IMF-fixdate: `Sun, 06 Nov 1994 08:49:37 GMT`
     *  - RFC 850:     `Sunday, 06-Nov-94 08:49:37 GMT`
     *  - asctime:     `Sun Nov  6 08:49:37 1994`
     *
     * RFC 850 two-digit years are placed in the window from 49 years before
     * `now` to 50 years after it.
     *
     * @return std::nullopt if the value matches none of the formats or names
     * an invalid calendar date.
     */
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point>
    parse_http_date(std::string_view value,
                    std::chrono::system_clock::time_point now =
                        std::chrono::system_clock::now());

    /// @brief Parse the response's `Date` header.
    /// @return std::nullopt if the header is absent or malformed.
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point>
    parsed_date_header(const Response& response);

}  // namespace rest_check
