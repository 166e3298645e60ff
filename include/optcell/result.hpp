#ifndef OPTCELL_RESULT_HPP
#define OPTCELL_RESULT_HPP

#include <functional>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "option.hpp"

// Result<T, E> - Either a success value or an error
// Equivalent to Rust's Result<T, E>
//
// Usage:
//   Result<int, ParseError> r = Result<int, ParseError>::Ok(42);
//   if (r.is_ok()) {
//       int v = r.unwrap();
//   }
//
// T may be an lvalue reference (Result<const X&, E>); it is then stored as a
// rebindable reference and unwrap() hands back the reference.
//
// Guarantees:
// - Exactly one of the two alternatives is alive at any time
// - Errors are values; only unwrap()/expect() on the wrong alternative throws

// @safe
namespace optcell {

// Rust's unit type (), the success value of operations that return nothing
// @safe
struct Unit {
    constexpr bool operator==(Unit) const noexcept { return true; }
};

// @safe
template<typename T, typename E>
class Result {
private:
    using OkStorage = std::conditional_t<
        std::is_lvalue_reference_v<T>,
        std::reference_wrapper<std::remove_reference_t<T>>,
        T>;

    struct OkTag {};
    struct ErrTag {};

    bool is_ok_;
    union {
        OkStorage ok_;
        E err_;
    };

    template<typename U>
    Result(OkTag, U&& value) : is_ok_(true), ok_(std::forward<U>(value)) {}

    template<typename U>
    Result(ErrTag, U&& error) : is_ok_(false), err_(std::forward<U>(error)) {}

    void destroy() noexcept {
        if (is_ok_) {
            ok_.~OkStorage();
        } else {
            err_.~E();
        }
    }

public:
    // @lifetime: owned
    static Result Ok(T value) {
        return Result(OkTag{}, std::forward<T>(value));
    }

    // @lifetime: owned
    static Result Err(E error) {
        return Result(ErrTag{}, std::move(error));
    }

    Result(const Result& other) : is_ok_(other.is_ok_) {
        if (is_ok_) {
            new (&ok_) OkStorage(other.ok_);
        } else {
            new (&err_) E(other.err_);
        }
    }

    Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<OkStorage> &&
                                    std::is_nothrow_move_constructible_v<E>)
        : is_ok_(other.is_ok_) {
        if (is_ok_) {
            new (&ok_) OkStorage(std::move(other.ok_));
        } else {
            new (&err_) E(std::move(other.err_));
        }
    }

    Result& operator=(const Result&) = delete;
    Result& operator=(Result&&) = delete;

    ~Result() {
        destroy();
    }

    bool is_ok() const { return is_ok_; }
    bool is_err() const { return !is_ok_; }

    explicit operator bool() const { return is_ok_; }

    // Unwrap the success value (panics if Err)
    // @lifetime: owned
    T unwrap() {
        if (!is_ok_) {
            throw std::runtime_error("Called unwrap on Err");
        }
        return static_cast<T>(std::move(ok_));
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!is_ok_) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    // Unwrap the error value (panics if Ok)
    // @lifetime: owned
    E unwrap_err() {
        if (is_ok_) {
            throw std::runtime_error("Called unwrap_err on Ok");
        }
        return std::move(err_);
    }

    // @lifetime: owned
    T unwrap_or(T default_value) {
        if (is_ok_) {
            return unwrap();
        }
        return std::forward<T>(default_value);
    }

    // Discard the error, keeping the success value
    // @lifetime: owned
    Option<T> ok() {
        if (is_ok_) {
            return Option<T>(unwrap());
        }
        return None;
    }

    // Discard the success value, keeping the error
    // @lifetime: owned
    Option<E> err() {
        if (!is_ok_) {
            return Option<E>(unwrap_err());
        }
        return None;
    }
};

} // namespace optcell

#endif // OPTCELL_RESULT_HPP
