#pragma once

#include <pthread.h>

#include <atomic>
#include <memory>
#include <syncset/util/util.hpp>

namespace syncset {

size_t get_cpu_count();

template <class Mutex>
struct unique_lock {
    Mutex &m_mutex;

   public:
    explicit unique_lock(Mutex &mutex) : m_mutex(mutex) { mutex.lock(); }
    ~unique_lock() { m_mutex.unlock(); }
};

template <class Mutex>
struct shared_lock {
    Mutex &m_mutex;

   public:
    explicit shared_lock(Mutex &mutex) : m_mutex(mutex) {
        m_mutex.lock_shared();
    }
    ~shared_lock() { m_mutex.unlock_shared(); }
};

// this wraps pthread_rwlock, which is smaller & faster than boost::shared_mutex.
//
// adapted from:
// http://boost.2283326.n4.nabble.com/boost-shared-mutex-performance-td2659061.html
class SharedMutex : noncopyable {
    pthread_rwlock_t m_rwlock;

   public:
    // glibc prefers readers by default, which lets a steady stream of readers
    // starve writers; recursive read locks are not supported.
    SharedMutex() {
        pthread_rwlockattr_t attr;
        int status = pthread_rwlockattr_init(&attr);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlockattr_init failed");
#ifdef __GLIBC__
        status = pthread_rwlockattr_setkind_np(
            &attr, PTHREAD_RWLOCK_PREFER_WRITER_NONRECURSIVE_NP);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlockattr_setkind_np failed");
#endif  // __GLIBC__
        status = pthread_rwlock_init(&m_rwlock, &attr);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlock_init failed");
        status = pthread_rwlockattr_destroy(&attr);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlockattr_destroy failed");
    }

    ~SharedMutex() {
        int status = pthread_rwlock_destroy(&m_rwlock);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlock_destroy failed");
    }

    void lock() {
        int status = pthread_rwlock_wrlock(&m_rwlock);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlock_wrlock failed");
    }

    // glibc seems to be buggy; don't unlock more often than it has been locked
    // see http://sourceware.org/bugzilla/show_bug.cgi?id=4825
    void unlock() {
        int status = pthread_rwlock_unlock(&m_rwlock);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlock_unlock failed");
    }

    void lock_shared() {
        int status = pthread_rwlock_rdlock(&m_rwlock);
        SYNCSET_ASSERT1(status == 0, "pthread_rwlock_rdlock failed");
    }

    void unlock_shared() { unlock(); }

    typedef unique_lock<SharedMutex> UniqueLock;
    typedef shared_lock<SharedMutex> SharedLock;
};

#if (SYNCSET_DEBUG_LEVEL == 0)

struct AssertSharedMutex {
    void lock() {}
    void unlock() {}
    void lock_shared() {}
    void unlock_shared() {}
};

#else  // (SYNCSET_DEBUG_LEVEL == 0)

// catches unsynchronized access from more than one thread, at least sometimes
class AssertSharedMutex {
    std::atomic<int_fast64_t> m_count;  // unique < 0, shared > 0

   public:
    AssertSharedMutex() : m_count(0) {}

    void lock() { SYNCSET_ASSERT(--m_count < 0, "lock contention"); }
    void unlock() { ++m_count; }
    void lock_shared() {
        SYNCSET_ASSERT(++m_count > 0, "lock_shared contention");
    }
    void unlock_shared() { --m_count; }
};

#endif  // (SYNCSET_DEBUG_LEVEL == 0)

// A SharedMutex that can be switched off at construction.
// When disabled, locking costs one branch and provides no exclusion.
class OptionalSharedMutex : noncopyable {
    std::unique_ptr<SharedMutex> m_mutex;
    AssertSharedMutex m_unsafe;

   public:
    explicit OptionalSharedMutex(bool enabled = true)
        : m_mutex(enabled ? new SharedMutex() : nullptr) {}

    bool enabled() const { return m_mutex != nullptr; }

    void lock() {
        if (likely(m_mutex)) {
            m_mutex->lock();
        } else {
            m_unsafe.lock();
        }
    }

    void unlock() {
        if (likely(m_mutex)) {
            m_mutex->unlock();
        } else {
            m_unsafe.unlock();
        }
    }

    void lock_shared() {
        if (likely(m_mutex)) {
            m_mutex->lock_shared();
        } else {
            m_unsafe.lock_shared();
        }
    }

    void unlock_shared() {
        if (likely(m_mutex)) {
            m_mutex->unlock_shared();
        } else {
            m_unsafe.unlock_shared();
        }
    }

    typedef unique_lock<OptionalSharedMutex> UniqueLock;
    typedef shared_lock<OptionalSharedMutex> SharedLock;
};

}  // namespace syncset
