// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BACKED_SYNC_H
#define BACKED_SYNC_H

#include <mutex>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
CCriticalSection mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);
 */

/**
 * Template mixin that adds -Wthread-safety locking
 * annotations to a subset of the mutex API.
 */
template <typename PARENT>
class AnnotatedMixin : public PARENT
{
public:
    void lock()
    {
        PARENT::lock();
    }

    void unlock()
    {
        PARENT::unlock();
    }

    bool try_lock()
    {
        return PARENT::try_lock();
    }
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting
 */
class CCriticalSection : public AnnotatedMixin<std::recursive_mutex>
{
};

/** Wrapper around std::unique_lock<Mutex> */
template <typename Mutex>
class CMutexLock
{
private:
    std::unique_lock<Mutex> lock;

public:
    CMutexLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine, bool fTry = false)
        : lock(mutexIn, std::defer_lock)
    {
        if (fTry)
            lock.try_lock();
        else
            lock.lock();
    }

    operator bool()
    {
        return lock.owns_lock();
    }
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)

#endif // BACKED_SYNC_H
