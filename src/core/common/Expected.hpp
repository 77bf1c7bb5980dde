#pragma once

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Ferry {

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

class BadExpectedAccess : public std::logic_error {
public:
    explicit BadExpectedAccess(const char* what) : std::logic_error(what) {}
};

// Value-or-error return type used across the core, modelled on std::expected.
// Errors are only ever constructed through Unexpected so that T and E may
// share a type without ambiguity.
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
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

    Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                        std::is_nothrow_move_constructible_v<E>)
        : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() { destroy(); }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            new (this) Expected(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                   std::is_nothrow_move_constructible_v<E>) {
        if (this != &other) {
            destroy();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        if (!hasValue_) {
            throw BadExpectedAccess("Expected holds an error, not a value");
        }
        return value_;
    }

    T& value() & {
        if (!hasValue_) {
            throw BadExpectedAccess("Expected holds an error, not a value");
        }
        return value_;
    }

    T&& value() && {
        if (!hasValue_) {
            throw BadExpectedAccess("Expected holds an error, not a value");
        }
        return std::move(value_);
    }

    const E& error() const& {
        if (hasValue_) {
            throw BadExpectedAccess("Expected holds a value, not an error");
        }
        return error_;
    }

    E& error() & {
        if (hasValue_) {
            throw BadExpectedAccess("Expected holds a value, not an error");
        }
        return error_;
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return makeUnexpected(error_);
    }

private:
    void destroy() {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

template<typename E>
class Expected<void, E> {
public:
    Expected() : hasValue_(true) {}

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

    Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() { destroy(); }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            new (this) Expected(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>) {
        if (this != &other) {
            destroy();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    const E& error() const& {
        if (hasValue_) {
            throw BadExpectedAccess("Expected holds a value, not an error");
        }
        return error_;
    }

private:
    void destroy() {
        if (!hasValue_) {
            error_.~E();
        }
    }

    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace Ferry
