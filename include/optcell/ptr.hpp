// optcell/ptr.hpp - Non-nullable pointer type
//
// In Rust, NonNull<T> is a raw pointer that is statically known not to be
// null. Because null is never a valid NonNull value, Option<NonNull<T>> can
// use the null bit pattern as its None state and stays pointer-sized.
//
// This header provides the C++ equivalent:
//   NonNull<T> - T* that is never null (like core::ptr::NonNull<T>)
//
// Usage:
//   int x = 42;
//   NonNull<int> p = NonNull<int>::from_ref(x);
//   *p.as_ptr() = 7;
//
// The checked constructor (non_null(ptr) -> Option<NonNull<T>>) lives in
// option.hpp next to the Option<NonNull<T>> specialization.

#ifndef OPTCELL_PTR_HPP
#define OPTCELL_PTR_HPP

#include <cstddef>  // for std::nullptr_t

namespace optcell {

template<typename T> class Option;

// @safe - NonNull<T> is a plain pointer value; dereferencing it is the unsafe part
template<typename T>
class NonNull {
private:
    T* ptr_;

    // Only Option<NonNull<T>> may hold the null pattern (as its None state)
    friend class Option<NonNull<T>>;
    explicit constexpr NonNull(std::nullptr_t) noexcept : ptr_(nullptr) {}

    explicit constexpr NonNull(T* p) noexcept : ptr_(p) {}

public:
    NonNull() = delete;

    // @safe - a reference is never null
    // @lifetime: (&'a) -> NonNull<T>
    static constexpr NonNull from_ref(T& ref) noexcept {
        return NonNull(&ref);
    }

    // @unsafe - caller guarantees p != nullptr
    static constexpr NonNull new_unchecked(T* p) noexcept {
        return NonNull(p);
    }

    // @safe
    constexpr T* as_ptr() const noexcept { return ptr_; }

    // @unsafe - caller guarantees the pointee is alive
    // @lifetime: (&'a) -> &'a T
    constexpr T& as_ref() const noexcept { return *ptr_; }

    friend constexpr bool operator==(NonNull lhs, NonNull rhs) noexcept {
        return lhs.ptr_ == rhs.ptr_;
    }

    friend constexpr bool operator!=(NonNull lhs, NonNull rhs) noexcept {
        return lhs.ptr_ != rhs.ptr_;
    }
};

} // namespace optcell

#endif // OPTCELL_PTR_HPP
