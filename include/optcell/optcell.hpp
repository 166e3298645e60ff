#ifndef OPTCELL_HPP
#define OPTCELL_HPP

// optcell - a write-once cell with the layout of Option<T>
//
// OptionCell<T> behaves like Rust's unsync OnceCell<T>, and its
// representation is guaranteed to be that of Option<T>. A mutable array of
// Option<T> can be viewed in place as an array of OptionCell<T>, filled
// once per slot through shared references, and viewed back as Option<T>.
//
// Types follow Rust's ownership and borrowing principles and carry the
// @safe / @unsafe / @lifetime annotations of the Rusty C++ Checker.

#include "optcell/ptr.hpp"
#include "optcell/option.hpp"
#include "optcell/result.hpp"
#include "optcell/unsafe_cell.hpp"
#include "optcell/option_cell.hpp"
#include "optcell/reinterpret.hpp"

// Synchronization and thread-safety markers
#include "optcell/mutex.hpp"
#include "optcell/traits.hpp"

#endif // OPTCELL_HPP
