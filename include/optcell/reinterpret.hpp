#ifndef OPTCELL_REINTERPRET_HPP
#define OPTCELL_REINTERPRET_HPP

#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

#include "option.hpp"
#include "option_cell.hpp"

// Reinterpretation between Option<T> storage and OptionCell<T> storage
//
// OptionCell<T> is UnsafeCell<Option<T>>, which is a single Option<T> member
// and nothing else. The same bytes can therefore be accessed as either
// type. These functions change only the type (and so the permitted
// operations) through which the storage is accessed:
//   Option<T>     - freely mutable
//   OptionCell<T> - write-once per slot
// They never allocate, never move or copy a payload and never touch the
// discriminant.
//
// Usage:
//   std::vector<Option<int>> opts{None, Some(5), None};
//   std::span<OptionCell<int>> cells = cells_from_mut_slice(opts);
//   cells[0].set(7).unwrap();               // opts[0] == Some(7)
//   assert(cells[1].set(9).is_err());        // opts[1] still Some(5)
//
// Safety:
// - The input must be borrowed exclusively for as long as the returned view
//   is in use: no other reference may read or write the storage meanwhile.
// - The view must not outlive the storage. Binding to a temporary is
//   rejected at compile time (the rvalue overloads are deleted).
// - There is no const variant: OptionCell<T>::set() writes through const,
//   so a cell view over immutably borrowed options would be unsound.

// @safe
namespace optcell {

// Compile-time layout check used by every conversion below
template<typename T>
inline constexpr bool is_layout_compatible_v =
    sizeof(OptionCell<T>) == sizeof(Option<T>) &&
    alignof(OptionCell<T>) == alignof(Option<T>) &&
    std::is_standard_layout_v<OptionCell<T>> == std::is_standard_layout_v<Option<T>>;

template<typename T>
struct is_layout_compatible : std::bool_constant<is_layout_compatible_v<T>> {};

// @safe - View an Option<T> as an OptionCell<T> (has internal @unsafe block)
// @lifetime: (&'a mut) -> &'a mut
template<typename T>
OptionCell<T>& cell_from_mut(Option<T>& opt) noexcept {
    static_assert(is_layout_compatible_v<T>,
                  "OptionCell<T> must have the same layout as Option<T>");
    // @unsafe
    {
        return *reinterpret_cast<OptionCell<T>*>(&opt);
    }
}

template<typename T>
OptionCell<T>& cell_from_mut(Option<T>&& opt) = delete;

// @safe - View an OptionCell<T> as the Option<T> it is made of
// Exclusive access to the cell is exclusive access to the whole Option<T>,
// including overwriting or clearing it.
// @lifetime: (&'a mut) -> &'a mut
template<typename T>
Option<T>& option_from_mut(OptionCell<T>& cell) noexcept {
    static_assert(is_layout_compatible_v<T>,
                  "OptionCell<T> must have the same layout as Option<T>");
    return cell.inner_.get_mut();
}

template<typename T>
Option<T>& option_from_mut(OptionCell<T>&& cell) = delete;

// @safe - View a span of Option<T> as a span of OptionCell<T> (has internal @unsafe block)
// @lifetime: (&'a mut [Option<T>]) -> &'a mut [OptionCell<T>]
template<typename T, std::size_t Extent>
std::span<OptionCell<T>, Extent> cells_from_mut_slice(std::span<Option<T>, Extent> slice) noexcept {
    static_assert(is_layout_compatible_v<T>,
                  "OptionCell<T> must have the same layout as Option<T>");
    // @unsafe
    {
        return std::span<OptionCell<T>, Extent>(
            reinterpret_cast<OptionCell<T>*>(slice.data()), slice.size());
    }
}

// @lifetime: (&'a mut) -> &'a mut [OptionCell<T>]
template<typename T, typename Alloc>
std::span<OptionCell<T>> cells_from_mut_slice(std::vector<Option<T>, Alloc>& vec) noexcept {
    return cells_from_mut_slice(std::span<Option<T>>(vec));
}

template<typename T, typename Alloc>
std::span<OptionCell<T>> cells_from_mut_slice(std::vector<Option<T>, Alloc>&& vec) = delete;

// @safe - View a span of OptionCell<T> as a span of Option<T> (has internal @unsafe block)
// @lifetime: (&'a mut [OptionCell<T>]) -> &'a mut [Option<T>]
template<typename T, std::size_t Extent>
std::span<Option<T>, Extent> options_from_mut_slice(std::span<OptionCell<T>, Extent> cells) noexcept {
    static_assert(is_layout_compatible_v<T>,
                  "OptionCell<T> must have the same layout as Option<T>");
    // @unsafe
    {
        return std::span<Option<T>, Extent>(
            reinterpret_cast<Option<T>*>(cells.data()), cells.size());
    }
}

// @lifetime: (&'a mut) -> &'a mut [Option<T>]
template<typename T, typename Alloc>
std::span<Option<T>> options_from_mut_slice(std::vector<OptionCell<T>, Alloc>& vec) noexcept {
    return options_from_mut_slice(std::span<OptionCell<T>>(vec));
}

template<typename T, typename Alloc>
std::span<Option<T>> options_from_mut_slice(std::vector<OptionCell<T>, Alloc>&& vec) = delete;

} // namespace optcell

#endif // OPTCELL_REINTERPRET_HPP
