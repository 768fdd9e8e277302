#pragma once

#include <mutex>
#include <utility>

namespace folio
{
    // accessor to a reference to the guarded value
    template<typename T, typename TGuard = std::lock_guard<std::mutex>>
    class SynchronizedValueGuard final {
    public:
        SynchronizedValueGuard(std::mutex& mutex, T& _ref) :
            m_Guard{mutex},
            m_Ptr{&_ref}
        {
        }

        T& operator*() & noexcept { return *m_Ptr; }
        T const& operator*() const & noexcept { return *m_Ptr; }
        T* operator->() noexcept { return m_Ptr; }
        T const* operator->() const noexcept { return m_Ptr; }

    private:
        TGuard m_Guard;
        T* m_Ptr;
    };

    // represents a `T` value that can only be accessed via a mutexed guard
    template<typename T>
    class SynchronizedValue final {
    public:
        SynchronizedValue() = default;
        SynchronizedValue(SynchronizedValue const&) = delete;
        SynchronizedValue(SynchronizedValue&&) noexcept = delete;
        SynchronizedValue& operator=(SynchronizedValue const&) = delete;
        SynchronizedValue& operator=(SynchronizedValue&&) noexcept = delete;
        ~SynchronizedValue() noexcept = default;

        template<typename TGuard = std::lock_guard<std::mutex>>
        SynchronizedValueGuard<T, TGuard> lock()
        {
            return SynchronizedValueGuard<T, TGuard>{m_Mutex, m_Value};
        }

        template<typename TGuard = std::lock_guard<std::mutex>>
        SynchronizedValueGuard<T const, TGuard> lock() const
        {
            return SynchronizedValueGuard<T const, TGuard>{m_Mutex, m_Value};
        }

    private:
        mutable std::mutex m_Mutex;
        T m_Value{};
    };
}
