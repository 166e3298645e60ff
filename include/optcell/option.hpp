#ifndef OPTCELL_OPTION_HPP
#define OPTCELL_OPTION_HPP

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "ptr.hpp"

// Option<T> - Represents an optional value
// Equivalent to Rust's Option<T>
//
// Layout:
// - Option<T>           : bool discriminant, then a union holding T
// - Option<T&>          : a single pointer, nullptr is None
// - Option<NonNull<T>>  : a single pointer, nullptr is None (niche encoding)
//
// OptionCell<T> is laid out exactly like Option<T> and relies on this
// representation; see option_cell.hpp and reinterpret.hpp.
//
// Guarantees:
// - Type-safe null handling
// - Every live payload is destroyed exactly once (a move destroys the
//   source payload and leaves the source None)
// - Explicit handling of absence

// @safe
namespace optcell {

// Tag types for Option variants
// @safe
struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

// @safe
template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;  // For when there's no value
    };

    void reset() noexcept {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    // Constructors
    Option() : has_value(false), dummy(0) {}

    Option(None_t) : has_value(false), dummy(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    Option(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(other.value);
                has_value = true;
            }
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(std::move(other.value));
                has_value = true;
                other.reset();
            }
        }
        return *this;
    }

    ~Option() {
        reset();
    }

    // Check if Option contains a value
    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // Unwrap the value (panics if None) - Rust style
    // Leaves the Option as None
    // @lifetime: owned
    T unwrap() {
        if (!has_value) {
            throw std::runtime_error("Called unwrap on None");
        }
        T result = std::move(value);
        reset();
        return result;
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!has_value) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    // @lifetime: owned
    T unwrap_or(T default_value) {
        if (has_value) {
            return unwrap();
        }
        return default_value;
    }

    // Map function over the value, consuming it
    template<typename F>
    // @lifetime: owned
    auto map(F&& f) -> Option<decltype(f(std::declval<T>()))> {
        using U = decltype(f(std::declval<T>()));
        if (has_value) {
            return Option<U>(f(unwrap()));
        }
        return Option<U>(None);
    }

    // Map function over reference
    template<typename F>
    // @lifetime: (&'a) -> owned
    auto map_ref(F&& f) const -> Option<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (has_value) {
            return Option<U>(f(value));
        }
        return Option<U>(None);
    }

    // Take the value out, leaving None
    // @lifetime: owned
    Option<T> take() {
        return Option<T>(std::move(*this));
    }

    // Store a new value, returning the previous one
    // @lifetime: owned
    Option<T> replace(T new_value) {
        Option<T> old = take();
        insert(std::move(new_value));
        return old;
    }

    // Store a new value (dropping any previous one) and return a reference to it
    // @lifetime: (&'a mut, T) -> &'a mut T
    T& insert(T new_value) {
        reset();
        new (&value) T(std::move(new_value));
        has_value = true;
        return value;
    }

    // @lifetime: (&'a) -> Option<&'a T>
    Option<T&> as_ref() & {
        if (has_value) {
            return Option<T&>(value);
        }
        return None;
    }

    // @lifetime: (&'a) -> Option<&'a const T>
    Option<const T&> as_ref() const & {
        if (has_value) {
            return Option<const T&>(value);
        }
        return None;
    }

    // @lifetime: (&'a mut) -> Option<&'a mut T>
    Option<T&> as_mut() & {
        if (has_value) {
            return Option<T&>(value);
        }
        return None;
    }

    // Prevent calling as_ref()/as_mut() on rvalue (temporary)
    Option<T&> as_ref() && = delete;
    Option<const T&> as_ref() const && = delete;
    Option<T&> as_mut() && = delete;
};

// Template specialization for Option<T&> (reference types)
// This allows holding references without storing them in a union
// Implementation uses raw pointers, but API is safe
// @safe
template<typename T>
class Option<T&> {
private:
    T* ptr;  // nullptr if None, otherwise points to the value

public:
    // @safe - Constructors
    Option() : ptr(nullptr) {}

    // @safe
    Option(None_t) : ptr(nullptr) {}

    // @safe
    Option(T& ref) : ptr(&ref) {}

    // @safe
    Option(const Option& other) : ptr(other.ptr) {}

    // @safe
    Option(Option&& other) noexcept : ptr(other.ptr) {
        other.ptr = nullptr;
    }

    // @safe
    Option& operator=(const Option& other) {
        ptr = other.ptr;
        return *this;
    }

    // @safe
    Option& operator=(Option&& other) noexcept {
        ptr = other.ptr;
        other.ptr = nullptr;
        return *this;
    }

    ~Option() = default;

    // @safe
    bool is_some() const { return ptr != nullptr; }
    // @safe
    bool is_none() const { return !ptr; }

    explicit operator bool() const { return ptr != nullptr; }

    // @safe - Unwrap the reference (panics if None)
    // @lifetime: (&'a) -> &'a T
    T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("Called unwrap on None");
        }
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a T
    T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    // @lifetime: (&'a, &'b) -> &'c T where 'a: 'c, 'b: 'c
    T& unwrap_or(T& default_ref) const {
        if (ptr) {
            return *ptr;
        }
        return default_ref;
    }

    template<typename F>
    // @lifetime: (&'a) -> Option<U>
    auto map(F&& f) const -> Option<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    // @lifetime: (&'a) -> &'a self
    Option<const T&> as_ref() const & {
        if (ptr) {
            return Option<const T&>(*ptr);
        }
        return None;
    }

    Option<const T&> as_ref() const && = delete;

    // @safe
    bool contains(const T& value) const {
        return ptr && (*ptr == value);
    }
};

// Template specialization for Option<const T&> (const reference types)
// @safe
template<typename T>
class Option<const T&> {
private:
    const T* ptr;  // nullptr if None, otherwise points to the value

public:
    // @safe
    Option() : ptr(nullptr) {}

    // @safe
    Option(None_t) : ptr(nullptr) {}

    // @safe
    Option(const T& ref) : ptr(&ref) {}

    // @safe
    Option(const Option& other) : ptr(other.ptr) {}

    // @safe
    Option(Option&& other) noexcept : ptr(other.ptr) {
        other.ptr = nullptr;
    }

    // @safe
    Option& operator=(const Option& other) {
        ptr = other.ptr;
        return *this;
    }

    // @safe
    Option& operator=(Option&& other) noexcept {
        ptr = other.ptr;
        other.ptr = nullptr;
        return *this;
    }

    ~Option() = default;

    // @safe
    bool is_some() const { return ptr != nullptr; }
    // @safe
    bool is_none() const { return !ptr; }

    explicit operator bool() const { return ptr != nullptr; }

    // @safe - Unwrap the reference (panics if None)
    // @lifetime: (&'a) -> &'a const T
    const T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("Called unwrap on None");
        }
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a const T
    const T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    // @lifetime: (&'a, &'b) -> &'c const T where 'a: 'c, 'b: 'c
    const T& unwrap_or(const T& default_ref) const {
        if (ptr) {
            return *ptr;
        }
        return default_ref;
    }

    template<typename F>
    // @lifetime: (&'a) -> Option<U>
    auto map(F&& f) const -> Option<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    // @lifetime: (&'a) -> &'a self
    Option<const T&> as_ref() const & {
        return *this;
    }

    Option<const T&> as_ref() const && = delete;

    // @safe
    bool contains(const T& value) const {
        return ptr && (*ptr == value);
    }
};

// Template specialization for Option<NonNull<T>>
// Niche encoding: the null bit pattern of the pointer is None, so the
// Option is exactly pointer-sized and carries no separate discriminant.
// Like Rust's Option<NonNull<T>> it is trivially copyable; moving leaves
// the source unchanged.
// @safe
template<typename T>
class Option<NonNull<T>> {
private:
    NonNull<T> value;  // value.as_ptr() == nullptr encodes None

public:
    // @safe
    constexpr Option() noexcept : value(nullptr) {}

    // @safe
    constexpr Option(None_t) noexcept : value(nullptr) {}

    // @safe
    constexpr Option(NonNull<T> ptr) noexcept : value(ptr) {}

    // @safe
    constexpr bool is_some() const noexcept { return value.as_ptr() != nullptr; }
    // @safe
    constexpr bool is_none() const noexcept { return value.as_ptr() == nullptr; }

    explicit constexpr operator bool() const noexcept { return is_some(); }

    // @safe - Unwrap the pointer (panics if None), leaving None
    NonNull<T> unwrap() {
        if (is_none()) {
            throw std::runtime_error("Called unwrap on None");
        }
        NonNull<T> result = value;
        value = NonNull<T>(nullptr);
        return result;
    }

    NonNull<T> expect(const char* msg) {
        if (is_none()) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    NonNull<T> unwrap_or(NonNull<T> default_value) {
        if (is_some()) {
            return unwrap();
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) -> Option<decltype(f(std::declval<NonNull<T>>()))> {
        using U = decltype(f(std::declval<NonNull<T>>()));
        if (is_some()) {
            return Option<U>(f(unwrap()));
        }
        return Option<U>(None);
    }

    Option take() {
        Option result = *this;
        value = NonNull<T>(nullptr);
        return result;
    }

    Option replace(NonNull<T> new_value) {
        Option old = *this;
        value = new_value;
        return old;
    }

    // @lifetime: (&'a mut, T) -> &'a mut T
    NonNull<T>& insert(NonNull<T> new_value) {
        value = new_value;
        return value;
    }

    // @lifetime: (&'a) -> Option<&'a NonNull<T>>
    Option<NonNull<T>&> as_ref() & {
        if (is_some()) {
            return Option<NonNull<T>&>(value);
        }
        return None;
    }

    // @lifetime: (&'a) -> Option<&'a const NonNull<T>>
    Option<const NonNull<T>&> as_ref() const & {
        if (is_some()) {
            return Option<const NonNull<T>&>(value);
        }
        return None;
    }

    // @lifetime: (&'a mut) -> Option<&'a mut NonNull<T>>
    Option<NonNull<T>&> as_mut() & {
        return as_ref();
    }

    Option<NonNull<T>&> as_ref() && = delete;
    Option<const NonNull<T>&> as_ref() const && = delete;
    Option<NonNull<T>&> as_mut() && = delete;
};

// Helper function to create Some variant
// @safe
template<typename T>
// @lifetime: owned
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

// Checked NonNull constructor: None for a null pointer
// @safe
template<typename T>
Option<NonNull<T>> non_null(T* ptr) noexcept {
    if (ptr) {
        return Option<NonNull<T>>(NonNull<T>::new_unchecked(ptr));
    }
    return None;
}

// Equality operators
template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() && rhs.is_none()) return true;
    if (lhs.is_some() && rhs.is_some()) {
        return lhs.as_ref().unwrap() == rhs.as_ref().unwrap();
    }
    return false;
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

// opt == None (the reversed and != forms are synthesized)
template<typename T>
bool operator==(const Option<T>& opt, None_t) {
    return opt.is_none();
}

} // namespace optcell

#endif // OPTCELL_OPTION_HPP
