#pragma once

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Scribe {

template<typename E>
class Unexpected;

namespace detail {

template<typename U>
struct IsUnexpected : std::false_type {};

template<typename G>
struct IsUnexpected<Unexpected<G>> : std::true_type {};

} // namespace detail

// Value-or-error result, modelled on std::expected (C++23)
template<typename T, typename E>
class Expected {
public:
    struct ValueTag {};
    struct ErrorTag {};

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !detail::IsUnexpected<std::decay_t<U>>::value &&
        std::is_constructible_v<T, U>>>
    Expected(U&& value) noexcept(std::is_nothrow_constructible_v<T, U>)
        : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    // Disambiguates construction when T and E are the same type
    template<typename U>
    Expected(ValueTag, U&& value) : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    template<typename G>
    Expected(ErrorTag, G&& error) : hasValue_(false) {
        new (&error_) E(std::forward<G>(error));
    }

    // Implicit error construction, only when the argument cannot become a T
    template<typename G, typename = std::enable_if_t<
        std::is_constructible_v<E, const G&> &&
        !std::is_constructible_v<T, const G&> &&
        !std::is_same_v<std::decay_t<G>, Expected> &&
        !detail::IsUnexpected<std::decay_t<G>>::value>>
    Expected(const G& error) : hasValue_(false) {
        new (&error_) E(error);
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            construct(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            construct(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }

    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return value_;
    }

    T& value() & {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return value_;
    }

    T&& value() && {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::move(value_);
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

    E& error() & {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Result = std::invoke_result_t<F, const T&>;
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return Result(typename Result::ErrorTag{}, error_);
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        using Result = Expected<std::invoke_result_t<F, const T&>, E>;
        if (hasValue_) {
            return Result(typename Result::ValueTag{}, std::forward<F>(f)(value_));
        }
        return Result(typename Result::ErrorTag{}, error_);
    }

    template<typename U>
    T valueOr(U&& defaultValue) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(defaultValue));
    }

private:
    void destroy() noexcept {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    void construct(Expected&& other) noexcept {
        hasValue_ = other.hasValue_;
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

template<typename E>
class Unexpected {
public:
    explicit Unexpected(const E& error) : error_(error) {}
    explicit Unexpected(E&& error) : error_(std::move(error)) {}

    const E& error() const& { return error_; }
    E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

// Success carries no payload
template<typename E>
class Expected<void, E> {
public:
    struct ErrorTag {};

    Expected() noexcept : hasValue_(true) {}

    template<typename G>
    Expected(ErrorTag, G&& error) : hasValue_(false) {
        new (&error_) E(std::forward<G>(error));
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (!hasValue_) {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            this->~Expected();
            new (this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }

    explicit operator bool() const noexcept { return hasValue_; }

    void value() const {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

private:
    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace Scribe
