#ifndef OPTCELL_UNSAFE_CELL_HPP
#define OPTCELL_UNSAFE_CELL_HPP

#include <type_traits>
#include <utility>

// UnsafeCell<T> - The core primitive for interior mutability
//
// This is the building block OptionCell<T> is made of. It holds exactly one
// T and nothing else, so sizeof(UnsafeCell<T>) == sizeof(T) and the wrapped
// value sits at offset 0.
//
// Guarantees:
// - Single-threaded only (not thread-safe)
// - NO borrow checking (unsafe)
// - Mutable access to the inner value through const methods. The member is
//   declared mutable, so writing through a const UnsafeCell is well-defined
//   even when the enclosing object was itself declared const.
//
// Safety:
// - You MUST ensure no data races or aliasing violations
// - You MUST NOT create multiple mutable references simultaneously
// - You MUST ensure references don't outlive the UnsafeCell

// @safe
namespace optcell {

template<typename T>
class UnsafeCell {
private:
    mutable T value;

public:
    UnsafeCell() : value() {}
    explicit UnsafeCell(T val) : value(std::move(val)) {}

    // Moving requires exclusive access to the source, so no reference into
    // it can be alive
    UnsafeCell(UnsafeCell&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value(std::move(other.value)) {}

    // Get a raw mutable pointer to the inner value
    // @lifetime: (&'a) -> *mut T where return: 'a
    // SAFETY: Caller must ensure:
    // 1. No data races (single-threaded access only)
    // 2. No aliasing violations (no other reference to the value is in use
    //    while writing through the pointer)
    // 3. Returned pointer doesn't outlive the UnsafeCell
    T* get() const {
        return &value;
    }

    // @lifetime: (&'a) -> *const T where return: 'a
    const T* get_const() const {
        return &value;
    }

    // @safe - Get mutable reference when you have exclusive access
    // @lifetime: (&'a mut) -> &'a mut T
    T& get_mut() {
        return value;
    }

    // @safe - Consume the cell, returning the wrapped value
    // @lifetime: owned
    T into_inner() && {
        return std::move(value);
    }

    UnsafeCell(const UnsafeCell&) = delete;
    UnsafeCell& operator=(const UnsafeCell&) = delete;
    UnsafeCell& operator=(UnsafeCell&&) = delete;
};

} // namespace optcell

#endif // OPTCELL_UNSAFE_CELL_HPP
