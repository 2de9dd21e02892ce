#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace Rbum {

// Error wrapper that selects the error alternative of an Expected
template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

namespace detail {
template<typename>
struct IsUnexpected : std::false_type {};

template<typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

template<typename X, typename Self>
constexpr bool isForwardable = !std::is_same_v<std::decay_t<X>, Self> &&
                               !IsUnexpected<std::decay_t<X>>::value;

[[noreturn]] inline void throwBadAccess(const char* what) {
    throw std::runtime_error(what);
}
}

/**
 * @brief Value or error, in the shape of C++23 std::expected
 *
 * Values convert implicitly. A bare E is taken as the error only when T
 * can't be built from it; otherwise wrap it with makeUnexpected().
 * value() on an error (or error() on a value) throws std::runtime_error.
 */
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected()
        : storage_(std::in_place_index<0>) {}

    template<typename U, typename = std::enable_if_t<
        detail::isForwardable<U, Expected> && std::is_constructible_v<T, U&&>>>
    Expected(U&& value)
        : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<
        detail::isForwardable<G, Expected> &&
        !std::is_constructible_v<T, G&&> &&
        std::is_constructible_v<E, G&&>>, typename = void>
    Expected(G&& error)
        : storage_(std::in_place_index<1>, std::forward<G>(error)) {}

    template<typename G>
    Expected(const Unexpected<G>& unexpected)
        : storage_(std::in_place_index<1>, unexpected.error()) {}

    template<typename G>
    Expected(Unexpected<G>&& unexpected)
        : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    const T& value() const& {
        if (hasError()) {
            detail::throwBadAccess("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T& value() & {
        if (hasError()) {
            detail::throwBadAccess("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (hasError()) {
            detail::throwBadAccess("Expected contains error, not value");
        }
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        if (hasValue()) {
            detail::throwBadAccess("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    E& error() & {
        if (hasValue()) {
            detail::throwBadAccess("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue()) {
            return std::forward<F>(f)(value());
        }
        return makeUnexpected(error());
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, E> storage_;
};

// Success carries nothing; only the error is stored
template<typename E>
class Expected<void, E> {
public:
    Expected() = default;

    template<typename G, typename = std::enable_if_t<
        detail::isForwardable<G, Expected> && std::is_constructible_v<E, G&&>>>
    Expected(G&& error)
        : error_(std::in_place, std::forward<G>(error)) {}

    template<typename G>
    Expected(const Unexpected<G>& unexpected)
        : error_(std::in_place, unexpected.error()) {}

    template<typename G>
    Expected(Unexpected<G>&& unexpected)
        : error_(std::in_place, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return !error_.has_value(); }
    bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    void value() const {
        if (hasError()) {
            detail::throwBadAccess("Expected contains error, not value");
        }
    }

    const E& error() const& {
        if (hasValue()) {
            detail::throwBadAccess("Expected contains value, not error");
        }
        return *error_;
    }

    E& error() & {
        if (hasValue()) {
            detail::throwBadAccess("Expected contains value, not error");
        }
        return *error_;
    }

private:
    std::optional<E> error_;
};

} // namespace Rbum
