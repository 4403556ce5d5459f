#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace rest_check {

    /// @brief Result<T> holds either a value of type T or the HttpError that
    /// classified the exchange as a failure.
    /// @tparam T The type of the successful value.
    /// @note Similar to std::expected<T, HttpError> in C++23.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result with the given value.
        /// @tparam Args The types of the arguments to construct T.
        /// @param args The arguments to construct T.
        /// @return A Result containing the constructed T.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given HttpError.
        static Result err(const HttpError& error) {
            return Result(std::in_place_type<HttpError>, error);
        }

        /// @brief Create an error Result with the given HttpError.
        static Result err(HttpError&& error) {
            return Result(std::in_place_type<HttpError>, std::move(error));
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result holds a value of type T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @brief True if this Result holds an HttpError.
        bool has_error() const noexcept {
            return std::holds_alternative<HttpError>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            // Debug-only check; release builds do not throw.
            assert(p &&
                   "Result::value() called but this Result holds an HttpError");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an HttpError");
            return *p;
        }

        /// @brief The stored T, moved out of the Result.
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an HttpError");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept { return std::get_if<T>(&m_state); }

        /// @brief The stored error. HttpError is immutable, so only const
        /// access is offered.
        const HttpError& error() const& {
            const HttpError* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Rvalue overload so the error can be moved out.
        HttpError&& error() && {
            HttpError* p = std::get_if<HttpError>(&m_state);
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        /// @return Pointer to the HttpError if active, otherwise nullptr.
        [[nodiscard]] const HttpError* error_ptr() const noexcept {
            return std::get_if<HttpError>(&m_state);
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<HttpError>, const HttpError& error)
            : m_state(std::in_place_type<HttpError>, error) {}

        explicit Result(std::in_place_type_t<HttpError>, HttpError&& error)
            : m_state(std::in_place_type<HttpError>, std::move(error)) {}

        /// @brief Exactly one of {T, HttpError} is active at any time.
        std::variant<T, HttpError> m_state;
    };

}  // namespace rest_check
