#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rest_check {

    /// @brief Error domain for HttpError values.
    inline constexpr std::string_view kErrorDomain = "rest_check.HTTPError";

    /**
     * @brief Kinds of HttpError. This is a closed set; values are stable.
     */
    enum class ErrorKind : int {
        FailedResponse = 1,     /**< Status code indicates failure. */
        UnexpectedContentType,  /**< Content-Type did not match. */
        UnexpectedNoContent,    /**< 204 No Content where an entity was expected. */
        UnexpectedRedirect,     /**< Redirect received with redirects disabled. */
    };

    /**
     * @brief Identifiers for the contextual fields an HttpError may carry.
     */
    enum class PayloadKey {
        StatusCode,   /**< int. FailedResponse, UnexpectedRedirect. */
        BodyData,     /**< Raw body bytes. FailedResponse, UnexpectedContentType, UnexpectedRedirect. */
        BodyJSON,     /**< Decoded JSON object. FailedResponse. */
        ContentType,  /**< Content-Type header value. UnexpectedContentType. */
        Location,     /**< Location header value. UnexpectedRedirect. */
    };

    namespace keys {
        inline constexpr std::string_view kStatusCode = "StatusCode";
        inline constexpr std::string_view kBodyData = "BodyData";
        inline constexpr std::string_view kBodyJSON = "BodyJSON";
        inline constexpr std::string_view kContentType = "ContentType";
        inline constexpr std::string_view kLocation = "Location";
    }  // namespace keys

    inline constexpr std::string_view to_string(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::FailedResponse:
                return "FailedResponse";
            case ErrorKind::UnexpectedContentType:
                return "UnexpectedContentType";
            case ErrorKind::UnexpectedNoContent:
                return "UnexpectedNoContent";
            case ErrorKind::UnexpectedRedirect:
                return "UnexpectedRedirect";
        }
        return "Unknown";
    }

    inline constexpr std::string_view to_string(PayloadKey key) noexcept {
        switch (key) {
            case PayloadKey::StatusCode:
                return keys::kStatusCode;
            case PayloadKey::BodyData:
                return keys::kBodyData;
            case PayloadKey::BodyJSON:
                return keys::kBodyJSON;
            case PayloadKey::ContentType:
                return keys::kContentType;
            case PayloadKey::Location:
                return keys::kLocation;
        }
        return "Unknown";
    }

    /// @brief Payload of ErrorKind::FailedResponse.
    struct FailedResponse {
        int status_code{0};
        /// @brief Raw body; absent when the body was empty.
        std::optional<std::string> body_data;
        /// @brief Body decoded as a JSON object with top-level nulls removed.
        /// Only present when body_data is.
        std::optional<nlohmann::ordered_json> body_json;
    };

    /// @brief Payload of ErrorKind::UnexpectedContentType.
    struct UnexpectedContentType {
        std::optional<std::string> content_type;
        std::optional<std::string> body_data;
    };

    /// @brief ErrorKind::UnexpectedNoContent carries no payload.
    struct UnexpectedNoContent {};

    /// @brief Payload of ErrorKind::UnexpectedRedirect.
    struct UnexpectedRedirect {
        int status_code{0};
        std::optional<std::string> location;
        std::optional<std::string> body_data;
    };

    using ErrorPayload = std::variant<FailedResponse, UnexpectedContentType,
                                      UnexpectedNoContent, UnexpectedRedirect>;

    /**
     * @brief A completed HTTP exchange that did not satisfy the caller's
     * expectations.
     *
     * The variant alternative selects the kind; each alternative holds only
     * the fields valid for that kind. Instances are immutable.
     *
     * A FailedResponse payload is normalized on construction: body_json is
     * dropped unless body_data is present and body_json is an object, and
     * top-level null members are removed from it.
     */
    class HttpError {
       public:
        explicit HttpError(ErrorPayload payload);

        /// @brief The kind of failure, derived from the active alternative.
        [[nodiscard]] ErrorKind kind() const noexcept;

        /// @brief Always kErrorDomain.
        [[nodiscard]] static constexpr std::string_view domain() noexcept {
            return kErrorDomain;
        }

        [[nodiscard]] const ErrorPayload& payload() const noexcept {
            return m_payload;
        }

        /// @brief Typed access to the payload for a known kind.
        /// @return nullptr if the error is of another kind.
        template <typename P>
        [[nodiscard]] const P* get_if() const noexcept {
            return std::get_if<P>(&m_payload);
        }

        /// @name Per-key accessors. Empty when the key is absent.
        /// @{
        [[nodiscard]] std::optional<int> status_code() const;
        [[nodiscard]] std::optional<std::string_view> body_data() const;
        [[nodiscard]] const nlohmann::ordered_json* body_json() const noexcept;
        [[nodiscard]] std::optional<std::string_view> content_type() const;
        [[nodiscard]] std::optional<std::string_view> location() const;
        /// @}

        /// @brief True if the key is present in this error's payload.
        [[nodiscard]] bool has_key(PayloadKey key) const;

        /// @brief The keys present in this error's payload, in PayloadKey order.
        [[nodiscard]] std::vector<PayloadKey> payload_keys() const;

        /// @brief Human readable one-line description, e.g. for logs.
        [[nodiscard]] std::string message() const;

       private:
        ErrorPayload m_payload;
    };

}  // namespace rest_check
