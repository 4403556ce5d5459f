#include "rest_check/error.hpp"

namespace rest_check {

    namespace {
        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        void normalize_body_json(FailedResponse& p) {
            if (!p.body_json) return;
            if (!p.body_data || !p.body_json->is_object()) {
                p.body_json.reset();
                return;
            }
            for (auto it = p.body_json->begin(); it != p.body_json->end();) {
                if (it->is_null()) {
                    it = p.body_json->erase(it);
                } else {
                    ++it;
                }
            }
        }

        constexpr ErrorKind kind_of(const FailedResponse&) noexcept {
            return ErrorKind::FailedResponse;
        }
        constexpr ErrorKind kind_of(const UnexpectedContentType&) noexcept {
            return ErrorKind::UnexpectedContentType;
        }
        constexpr ErrorKind kind_of(const UnexpectedNoContent&) noexcept {
            return ErrorKind::UnexpectedNoContent;
        }
        constexpr ErrorKind kind_of(const UnexpectedRedirect&) noexcept {
            return ErrorKind::UnexpectedRedirect;
        }

    }  // namespace

    HttpError::HttpError(ErrorPayload payload) : m_payload(std::move(payload)) {
        if (auto* p = std::get_if<FailedResponse>(&m_payload)) {
            normalize_body_json(*p);
        }
    }

    // No public path leaves m_payload valueless.
    ErrorKind HttpError::kind() const noexcept {
        return std::visit([](const auto& p) { return kind_of(p); }, m_payload);
    }

    std::optional<int> HttpError::status_code() const {
        if (const auto* p = get_if<FailedResponse>()) return p->status_code;
        if (const auto* p = get_if<UnexpectedRedirect>()) return p->status_code;
        return std::nullopt;
    }

    std::optional<std::string_view> HttpError::body_data() const {
        const std::optional<std::string>* body = std::visit(
            overloaded{
                [](const UnexpectedNoContent&)
                    -> const std::optional<std::string>* { return nullptr; },
                [](const auto& p) -> const std::optional<std::string>* {
                    return &p.body_data;
                },
            },
            m_payload);
        if (body == nullptr || !body->has_value()) return std::nullopt;
        return std::string_view(**body);
    }

    const nlohmann::ordered_json* HttpError::body_json() const noexcept {
        const auto* p = get_if<FailedResponse>();
        if (p == nullptr || !p->body_json) return nullptr;
        return &*p->body_json;
    }

    std::optional<std::string_view> HttpError::content_type() const {
        const auto* p = get_if<UnexpectedContentType>();
        if (p == nullptr || !p->content_type) return std::nullopt;
        return std::string_view(*p->content_type);
    }

    std::optional<std::string_view> HttpError::location() const {
        const auto* p = get_if<UnexpectedRedirect>();
        if (p == nullptr || !p->location) return std::nullopt;
        return std::string_view(*p->location);
    }

    bool HttpError::has_key(PayloadKey key) const {
        switch (key) {
            case PayloadKey::StatusCode:
                return status_code().has_value();
            case PayloadKey::BodyData:
                return body_data().has_value();
            case PayloadKey::BodyJSON:
                return body_json() != nullptr;
            case PayloadKey::ContentType:
                return content_type().has_value();
            case PayloadKey::Location:
                return location().has_value();
        }
        return false;
    }

    std::vector<PayloadKey> HttpError::payload_keys() const {
        std::vector<PayloadKey> out;
        for (PayloadKey key :
             {PayloadKey::StatusCode, PayloadKey::BodyData, PayloadKey::BodyJSON,
              PayloadKey::ContentType, PayloadKey::Location}) {
            if (has_key(key)) out.push_back(key);
        }
        return out;
    }

    std::string HttpError::message() const {
        std::string out(to_string(kind()));
        std::visit(
            overloaded{
                [&](const FailedResponse& p) {
                    out += ": HTTP status " + std::to_string(p.status_code);
                },
                [&](const UnexpectedContentType& p) {
                    out += ": Content-Type ";
                    out += p.content_type ? "'" + *p.content_type + "'"
                                          : std::string("missing");
                },
                [&](const UnexpectedNoContent&) {
                    out += ": 204 No Content where an entity was expected";
                },
                [&](const UnexpectedRedirect& p) {
                    out += ": HTTP status " + std::to_string(p.status_code);
                    if (p.location) out += " to " + *p.location;
                },
            },
            m_payload);
        return out;
    }

}  // namespace rest_check
