#pragma once

/**
 * @file spin_lock.hpp
 * @brief Definition and implementation of the `spin_lock` class.
 */

#include <atomic>
#include <thread>

namespace base {

/**
 * @brief Minimal lock for very short critical sections. Satisfies Lockable, so it works with `std::lock_guard`.
 */
class spin_lock
{
public:
    spin_lock() noexcept = default;

    spin_lock(const spin_lock& other) = delete;
    spin_lock& operator=(const spin_lock& other) = delete;

    spin_lock(spin_lock&& other) = delete;
    spin_lock& operator=(spin_lock&& other) = delete;

public:
    inline bool try_lock() noexcept
    {
        return !lock_.test_and_set(std::memory_order_acquire);
    }

    inline void lock() noexcept
    {
        while (lock_.test_and_set(std::memory_order_acquire)) {
            while (lock_.test(std::memory_order_relaxed)) {
                std::this_thread::yield();
            }
        }
    }

    inline void unlock() noexcept
    {
        lock_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag lock_;
};

} // namespace base
