// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MEMETOKEN_SYNC_H
#define MEMETOKEN_SYNC_H

#include <atomic>
#include <cassert>
#include <mutex>
#include <thread>

/**
 * RecursiveMutex - std::recursive_mutex that remembers its owning thread so
 * that callers can assert the lock is held (AssertLockHeld).
 */
class RecursiveMutex
{
private:
    std::recursive_mutex m_mutex;
    std::atomic<std::thread::id> m_owner{std::thread::id()};
    int m_depth{0};

public:
    void lock()
    {
        m_mutex.lock();
        m_owner.store(std::this_thread::get_id());
        ++m_depth;
    }

    void unlock()
    {
        if (--m_depth == 0) {
            m_owner.store(std::thread::id());
        }
        m_mutex.unlock();
    }

    bool try_lock()
    {
        if (!m_mutex.try_lock()) {
            return false;
        }
        m_owner.store(std::this_thread::get_id());
        ++m_depth;
        return true;
    }

    bool IsHeldByCurrentThread() const
    {
        return m_owner.load() == std::this_thread::get_id();
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::lock_guard<RecursiveMutex> PASTE2(criticalblock, __COUNTER__)(cs)

#define AssertLockHeld(cs) assert((cs).IsHeldByCurrentThread())

#endif // MEMETOKEN_SYNC_H
