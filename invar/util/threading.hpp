#pragma once

#include <pthread.h>
#include <invar/util/util.hpp>

namespace invar {

template <class Mutex>
struct unique_lock {
    Mutex& m_mutex;

   public:
    explicit unique_lock(Mutex& mutex) : m_mutex(mutex) { mutex.lock(); }
    ~unique_lock() { m_mutex.unlock(); }
};

template <class Mutex>
struct shared_lock {
    Mutex& m_mutex;

   public:
    explicit shared_lock(Mutex& mutex) : m_mutex(mutex) {
        m_mutex.lock_shared();
    }
    ~shared_lock() { m_mutex.unlock_shared(); }
};

// this wraps pthread_rwlock, which is smaller & faster than
// boost::shared_mutex. Writers are preferred so a stream of snapshot readers
// cannot starve a committing operation.
class SharedMutex : noncopyable {
    pthread_rwlock_t m_rwlock;

   public:
    SharedMutex() {
        pthread_rwlockattr_t attr;
        pthread_rwlockattr_init(&attr);
        pthread_rwlockattr_setkind_np(
            &attr, PTHREAD_RWLOCK_PREFER_WRITER_NONRECURSIVE_NP);
        int status = pthread_rwlock_init(&m_rwlock, &attr);
        pthread_rwlockattr_destroy(&attr);
        INVAR_ASSERT(status == 0, "pthread_rwlock_init failed");
    }

    ~SharedMutex() {
        int status = pthread_rwlock_destroy(&m_rwlock);
        INVAR_ASSERT1(status == 0, "pthread_rwlock_destroy failed");
    }

    void lock() {
        int status = pthread_rwlock_wrlock(&m_rwlock);
        INVAR_ASSERT1(status == 0, "pthread_rwlock_wrlock failed");
    }

    // glibc seems to be buggy; don't unlock more often than it has been
    // locked. see http://sourceware.org/bugzilla/show_bug.cgi?id=4825
    void unlock() {
        int status = pthread_rwlock_unlock(&m_rwlock);
        INVAR_ASSERT1(status == 0, "pthread_rwlock_unlock failed");
    }

    void lock_shared() {
        int status = pthread_rwlock_rdlock(&m_rwlock);
        INVAR_ASSERT1(status == 0, "pthread_rwlock_rdlock failed");
    }

    void unlock_shared() { unlock(); }

    typedef unique_lock<SharedMutex> UniqueLock;
    typedef shared_lock<SharedMutex> SharedLock;
};

}  // namespace invar
