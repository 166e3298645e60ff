#ifndef OPTCELL_OPTION_CELL_HPP
#define OPTCELL_OPTION_CELL_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>

#include "option.hpp"
#include "result.hpp"
#include "unsafe_cell.hpp"

// OptionCell<T> - A cell which can be written to only once, laid out
// exactly like Option<T>
//
// Equivalent to Rust's OnceCell<T> (unsync), except that the representation
// is guaranteed to be that of Option<T>: an existing Option<T> (or a whole
// array of them) can be viewed as OptionCell<T> in place, written once per
// slot through the cell interface and viewed back as Option<T> afterwards.
// See reinterpret.hpp.
//
// Usage:
//   std::vector<Option<int>> options{None, None};
//   auto cells = cells_from_mut_slice(options);
//   cells[0].set(1).unwrap();
//
// State machine:
//   Empty  --set(v)--> Filled
//   Filled --set(v)--> Filled   (rejected, v is handed back in AlreadySet)
// No operation on a cell moves it from Filled back to Empty.
//
// Guarantees:
// - Single-threaded only (not thread-safe); wrap it in Mutex<OptionCell<T>>
//   to share it between threads
// - References returned by get() stay valid until the cell is destroyed
//   or consumed, even across later set() calls
// - The payload is destroyed exactly once

// @safe
namespace optcell {

// Returned by OptionCell::try_get() on an empty cell
// @safe
struct NotYetSet {
    const char* what() const noexcept { return "OptionCell is not yet set"; }
};

// Returned by OptionCell::set() on a filled cell
// The rejected value is handed back unchanged.
// @safe
template<typename T>
struct AlreadySet {
    T value;

    const char* what() const noexcept { return "OptionCell is already set"; }
};

template<typename T> class OptionCell;

template<typename T>
Option<T>& option_from_mut(OptionCell<T>& cell) noexcept;

// @safe
template<typename T>
class OptionCell {
    static_assert(!std::is_reference_v<T>,
                  "OptionCell<T&> is not supported, use OptionCell<NonNull<T>>");

private:
    // Ownership: same as Option<T>.
    //
    // Shared access (through const) has two modes:
    // - write mode while the Option is None: no reference into the payload
    //   exists, so set() may construct it
    // - read mode once the Option is Some: nothing writes the Option through
    //   a shared path any more, so get() may hand out references
    // Exclusive access (option_from_mut) sees the whole Option<T>.
    UnsafeCell<Option<T>> inner_;

    friend Option<T>& option_from_mut<T>(OptionCell<T>& cell) noexcept;

public:
    using value_type = T;

    // @safe - Creates an empty cell
    OptionCell() : inner_() {}

    // @safe
    OptionCell(None_t) : inner_() {}

    // @safe - Takes over the state and payload of opt
    explicit OptionCell(Option<T> opt) : inner_(std::move(opt)) {}

    // @safe - Rust-style factories
    static OptionCell new_() {
        return OptionCell();
    }

    // @lifetime: owned
    static OptionCell from(Option<T> opt) {
        return OptionCell(std::move(opt));
    }

    // Clone: a new cell in the same state holding a copy of the payload
    OptionCell(const OptionCell& other) requires std::is_copy_constructible_v<T>
        : inner_(Option<T>(*other.inner_.get_const())) {}

    // Moving consumes the source, like into_option()
    OptionCell(OptionCell&& other) noexcept(std::is_nothrow_move_constructible_v<Option<T>>)
        : inner_(std::move(other.inner_)) {}

    // Assignment could overwrite a filled cell
    OptionCell& operator=(const OptionCell&) = delete;
    OptionCell& operator=(OptionCell&&) = delete;

    ~OptionCell() = default;

    // @safe
    bool is_filled() const { return inner_.get_const()->is_some(); }
    // @safe
    bool is_empty() const { return inner_.get_const()->is_none(); }

    // @safe - Reference to the stored value, None if the cell is empty
    // @lifetime: (&'a) -> Option<&'a const T>
    [[nodiscard]] Option<const T&> get() const {
        return inner_.get_const()->as_ref();
    }

    // @safe - Same as get(), reporting an empty cell as NotYetSet
    // @lifetime: (&'a) -> Result<&'a const T, NotYetSet>
    [[nodiscard]] Result<const T&, NotYetSet> try_get() const {
        const Option<T>& opt = *inner_.get_const();
        if (opt.is_some()) {
            return Result<const T&, NotYetSet>::Ok(opt.as_ref().unwrap());
        }
        return Result<const T&, NotYetSet>::Err(NotYetSet{});
    }

    // @safe - Fills an empty cell (has internal @unsafe block)
    // On a filled cell nothing is written and the value comes back as
    // AlreadySet<T>::value.
    // Precondition: constructing T must not re-enter this cell.
    // @lifetime: (&'a, T) -> Result<(), AlreadySet<T>>
    [[nodiscard]] Result<Unit, AlreadySet<T>> set(T value) const {
        // @unsafe
        {
            Option<T>* slot = inner_.get();
            if (slot->is_some()) {
                return Result<Unit, AlreadySet<T>>::Err(AlreadySet<T>{std::move(value)});
            }
            slot->insert(std::move(value));
            return Result<Unit, AlreadySet<T>>::Ok(Unit{});
        }
    }

    // @safe - Gets the value, initializing it with f() if the cell is empty
    // Throws std::runtime_error if f() itself fills the cell.
    // @lifetime: (&'a, F) -> &'a const T
    template<typename F>
    const T& get_or_init(F&& f) const {
        if (is_empty()) {
            auto result = set(std::forward<F>(f)());
            if (result.is_err()) {
                throw std::runtime_error("Recursive initialization within get_or_init");
            }
        }
        return inner_.get_const()->as_ref().unwrap();
    }

    // @safe - Consumes the cell, returning the wrapped Option<T>
    // @lifetime: owned
    Option<T> into_option() && {
        return std::move(inner_).into_inner();
    }
};

template<typename T>
bool operator==(const OptionCell<T>& lhs, const OptionCell<T>& rhs) {
    return lhs.get() == rhs.get();
}

} // namespace optcell

#endif // OPTCELL_OPTION_CELL_HPP
