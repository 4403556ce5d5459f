#pragma once

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rest_check {

    /**
     * @brief A completed HTTP exchange as handed over by the transport.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP response headers, names as sent by the server. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief Raw response body bytes. */
        std::string body;

        /// @brief Case-insensitive header lookup.
        /// @return The header value, or std::nullopt if the header is absent.
        [[nodiscard]] std::optional<std::string_view> header(
            std::string_view name) const {
            auto it = headers.find(std::string(name));
            if (it != headers.end()) return std::string_view(it->second);
            for (const auto& [k, v] : headers) {
                if (boost::beast::iequals(
                        k, boost::beast::string_view(name.data(), name.size())))
                    return std::string_view(v);
            }
            return std::nullopt;
        }
    };

    /// @brief Convert a Boost.Beast HTTP response to a rest_check::Response.
    /// @note If duplicate header names occur, the first one wins.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());

        for (const auto& field : beast_res.base()) {
            out.headers.emplace(std::string(field.name_string()),
                                std::string(field.value()));
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace rest_check
