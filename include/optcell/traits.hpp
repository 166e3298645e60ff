#pragma once

#include <type_traits>

namespace optcell {

// Forward declarations for optcell types
template<typename T> class Option;
template<typename T, typename E> class Result;
template<typename T> class NonNull;
template<typename T> class UnsafeCell;
template<typename T> class OptionCell;
template<typename T> class Mutex;
template<typename T> class MutexGuard;

// Forward declare is_sync for circular dependency with is_send
template<typename T, typename = void>
struct is_sync;

// ============================================================================
// Send Trait - Can transfer ownership across thread boundaries
// ============================================================================

// Default: types are NOT Send
template<typename T, typename = void>
struct is_send : std::false_type {};

// Explicit opt-in for user types (see OPTCELL_MARK_SEND)
template<typename T>
struct is_explicitly_send : std::false_type {};

// Primitives are Send
template<typename T>
struct is_send<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Send if T is Sync
template<typename T>
struct is_send<const T&> : is_sync<T> {};

// T& (mutable ref) is Send if T is Send
template<typename T>
struct is_send<T&> : is_send<T> {};

template<typename T>
struct is_send<T&&> : is_send<T> {};

// Option<T> is Send if T is Send
template<typename T>
struct is_send<Option<T>> : is_send<T> {};

// Result<T, E> is Send if both T and E are Send
template<typename T, typename E>
struct is_send<Result<T, E>> : std::bool_constant<
    is_send<T>::value && is_send<E>::value
> {};

// NonNull<T> is NEVER Send (raw pointer)
template<typename T>
struct is_send<NonNull<T>> : std::false_type {};

// UnsafeCell<T> is Send if T is Send
template<typename T>
struct is_send<UnsafeCell<T>> : is_send<T> {};

// OptionCell<T> is Send if T is Send (but not Sync)
template<typename T>
struct is_send<OptionCell<T>> : is_send<T> {};

// Mutex<T> is Send if T is Send
template<typename T>
struct is_send<Mutex<T>> : is_send<T> {};

// MutexGuard<T> is NEVER Send (must unlock on the locking thread)
template<typename T>
struct is_send<MutexGuard<T>> : std::false_type {};

// Raw pointers are not Send
template<typename T>
struct is_send<T*> : std::false_type {};

template<typename T>
struct is_send<const T*> : std::false_type {};

// ============================================================================
// Sync Trait - Can safely share const T& across threads
// ============================================================================

// Default: types are NOT Sync
template<typename T, typename>
struct is_sync : std::false_type {};

// Primitives are Sync
template<typename T>
struct is_sync<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Sync if T is Sync
template<typename T>
struct is_sync<const T&> : is_sync<T> {};

// T& (mutable ref) is NEVER Sync
template<typename T>
struct is_sync<T&> : std::false_type {};

template<typename T>
struct is_sync<T&&> : std::false_type {};

// Option<T> is Sync if T is Sync
template<typename T>
struct is_sync<Option<T>> : is_sync<T> {};

template<typename T, typename E>
struct is_sync<Result<T, E>> : std::bool_constant<
    is_sync<T>::value && is_sync<E>::value
> {};

// NonNull<T> is NEVER Sync
template<typename T>
struct is_sync<NonNull<T>> : std::false_type {};

// UnsafeCell<T> is NEVER Sync (unsynchronized interior mutability)
template<typename T>
struct is_sync<UnsafeCell<T>> : std::false_type {};

// OptionCell<T> is NEVER Sync: set() through a shared reference is not
// atomic, two threads could both observe the cell empty
template<typename T>
struct is_sync<OptionCell<T>> : std::false_type {};

// Mutex<T> is Sync if T is Send (allows const Mutex<T>& to be shared)
template<typename T>
struct is_sync<Mutex<T>> : is_send<T> {};

// MutexGuard<T> is Sync if T is Sync
template<typename T>
struct is_sync<MutexGuard<T>> : is_sync<T> {};

template<typename T>
struct is_sync<T*> : std::false_type {};

template<typename T>
struct is_sync<const T*> : std::false_type {};

// ============================================================================
// Helper constexpr variables
// ============================================================================

template<typename T>
inline constexpr bool Send = is_send<T>::value;

template<typename T>
inline constexpr bool Sync = is_sync<T>::value;

template<typename T>
inline constexpr bool ThreadSafe = Send<T> && Sync<T>;

} // namespace optcell

// Convenience macro to mark types as Send
// Must be used at global scope.
// Usage: OPTCELL_MARK_SEND(MyType)
#define OPTCELL_MARK_SEND(Type) \
    namespace optcell { \
        template<> struct is_explicitly_send<Type> : std::true_type {}; \
        template<> struct is_send<Type> : std::true_type {}; \
    }

// Convenience macro to mark types as Sync
// Usage: OPTCELL_MARK_SYNC(MyType)
#define OPTCELL_MARK_SYNC(Type) \
    namespace optcell { \
        template<> struct is_sync<Type> : std::true_type {}; \
    }
