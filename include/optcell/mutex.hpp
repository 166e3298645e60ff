#pragma once

#include <mutex>
#include <utility>

#include "option.hpp"

namespace optcell {

template<typename T> class Mutex;

// @safe - MutexGuard - RAII lock guard for Mutex<T>
template<typename T>
class MutexGuard {
private:
    std::unique_lock<std::mutex> lock_;
    T* data_;

    friend class Mutex<T>;

    MutexGuard(std::unique_lock<std::mutex>&& lock, T* data)
        : lock_(std::move(lock)), data_(data) {}

public:
    // @safe - Access to data
    T& operator*() { return *data_; }
    // @safe
    const T& operator*() const { return *data_; }

    // @safe
    T* operator->() { return data_; }
    // @safe
    const T* operator->() const { return data_; }

    // Non-copyable, movable
    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;
    // @safe
    MutexGuard(MutexGuard&&) = default;
    // @safe
    MutexGuard& operator=(MutexGuard&&) = default;

    // @safe - Destructor unlocks automatically
    ~MutexGuard() = default;
};

// @safe - Mutex<T> - Mutual exclusion around a value
// Similar to Rust's std::sync::Mutex<T>. This is how a single-threaded
// primitive such as OptionCell<T> is shared between threads: every access,
// including the empty check inside set(), happens under the lock.
//
// Usage:
//   Mutex<OptionCell<int>> shared;
//   {
//       auto guard = shared.lock();
//       if (guard->set(42).is_ok()) { ... }
//   }  // Lock released here
//
// C++ has no poisoning, so lock() returns the guard directly.
template<typename T>
class Mutex {
private:
    std::mutex mtx_;
    T data_;

public:
    using Guard = MutexGuard<T>;

    // @safe
    Mutex() : data_() {}

    // @safe
    explicit Mutex(T value) : data_(std::move(value)) {}

    // @safe - Blocks until the lock is acquired (has internal @unsafe block)
    [[nodiscard]] MutexGuard<T> lock() {
        // @unsafe
        {
            return MutexGuard<T>(std::unique_lock<std::mutex>(mtx_), &data_);
        }
    }

    // @safe - None if the lock is already held
    [[nodiscard]] Option<MutexGuard<T>> try_lock() {
        // @unsafe
        {
            std::unique_lock<std::mutex> lk(mtx_, std::try_to_lock);
            if (lk.owns_lock()) {
                return Some(MutexGuard<T>(std::move(lk), &data_));
            }
            return None;
        }
    }

    // @safe - Access without locking; exclusive access to the Mutex already
    // rules out other users
    // @lifetime: (&'a mut) -> &'a mut T
    T& get_mut() { return data_; }

    // @safe - Consume the mutex, returning the protected value
    // @lifetime: owned
    T into_inner() && { return std::move(data_); }

    // Mutex is not copyable or movable
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;
    Mutex(Mutex&&) = delete;
    Mutex& operator=(Mutex&&) = delete;

    ~Mutex() = default;
};

} // namespace optcell
