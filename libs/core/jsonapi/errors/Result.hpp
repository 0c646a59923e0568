#pragma once
#include <utility>
#include <variant>
#include "ApiError.hpp"

namespace Tuner {

/// Value-or-Error returned by every fallible operation of the binding.
template <class T>
class Result {
public:
    using value_type = T;

    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result failure(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool ok() const noexcept { return m_data.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // Accessing the wrong alternative throws std::bad_variant_access.
    T& value() & { return std::get<0>(m_data); }
    const T& value() const& { return std::get<0>(m_data); }
    T&& value() && { return std::get<0>(std::move(m_data)); }

    const Error& error() const { return std::get<1>(m_data); }

    /// The ApiError held by this result, or nullptr for success and other error categories.
    const ApiError* apiError() const noexcept {
        if (ok()) return nullptr;
        return std::get_if<ApiError>(&std::get<1>(m_data));
    }

    template <class E>
    [[nodiscard]] bool holds() const noexcept {
        return !ok() && std::holds_alternative<E>(std::get<1>(m_data));
    }

    /// Re-types a failed result so it can be returned from a function with another value type.
    template <class U>
    Result<U> forward() const {
        return Result<U>::failure(error());
    }

private:
    template <std::size_t I, class... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : m_data(tag, std::forward<Args>(args)...) {}

    std::variant<T, Error> m_data;
};

} // namespace Tuner
