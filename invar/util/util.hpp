#pragma once

#include <stdint.h>
#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace invar {

//----------------------------------------------------------------------------
// compiler-specific

#ifdef __GNUG__
#define likely(x) __builtin_expect(bool(x), true)
#define unlikely(x) __builtin_expect(bool(x), false)
#else  // __GNUG__
#warning "ignoring likely(-), unlikely(-)"
#define likely(x) (x)
#define unlikely(x) (x)
#endif  // __GNUG__

//----------------------------------------------------------------------------
// debugging

#ifndef INVAR_DEBUG_LEVEL
#define INVAR_DEBUG_LEVEL 0
#endif  // INVAR_DEBUG_LEVEL

//----------------------------------------------------------------------------
// convenience

typedef std::default_random_engine rng_t;

class noncopyable {
    noncopyable(const noncopyable&) = delete;
    void operator=(const noncopyable&) = delete;

   public:
    noncopyable() {}
};

namespace fs = boost::filesystem;

//----------------------------------------------------------------------------
// file system

// Runs body in a fresh temporary working directory, removed afterwards.
void in_temp_dir(std::function<void()> body);

//----------------------------------------------------------------------------
// time

float get_elapsed_time();
std::string get_date(bool hour = true);

class Timer {
    typedef std::chrono::high_resolution_clock Clock;
    typedef std::chrono::time_point<Clock> Time;
    Time m_start;

   public:
    Timer() : m_start(Clock::now()) {}
    double elapsed() const {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - m_start);
        return duration.count() * 1e-6;
    }
};

//----------------------------------------------------------------------------
// environment variables

inline const char* getenv_default(const char* key, const char* default_val) {
    const char* val = getenv(key);
    return val ? val : default_val;
}

inline size_t getenv_default(const char* key, size_t default_val) {
    const char* val = getenv(key);
    return val ? atoi(val) : default_val;
}

inline int getenv_default(const char* key, int default_val) {
    const char* val = getenv(key);
    return val ? atoi(val) : default_val;
}

//----------------------------------------------------------------------------
// logging

const char* const DEFAULT_LOG_FILE = "invar.log";
const size_t DEFAULT_LOG_LEVEL = 1;

const std::string g_log_level_name[4] = {"ERROR   ", "WARNING ", "INFO    ",
                                         "DEBUG   "};

class Log {
    struct GlobalState {
        const std::string log_filename;
        std::ofstream log_stream;
        const size_t log_level;
        std::mutex mutex;

        GlobalState();
        void write(const std::string& message) {
            std::unique_lock<std::mutex> lock(mutex);
            log_stream << message << std::flush;
        }
    };
    static GlobalState s_state;

    std::ostringstream m_message;

   public:
    static size_t level() { return s_state.log_level; }

    explicit Log(size_t level) {
        m_message << std::left << std::setw(12) << get_elapsed_time();
        m_message << g_log_level_name[level < 3 ? level : 3];
    }

    ~Log() {
        m_message << '\n';
        s_state.write(m_message.str());
    }

    template <class T>
    Log& operator<<(const T& t) {
        m_message << t;
        return *this;
    }

    struct Context {
        explicit Context(std::string name);
        Context(int argc, char** argv);
        ~Context();
    };

    static int init();
};

#define INVAR_WARN(message)                                       \
    {                                                             \
        if (invar::Log::level() >= 1) {                           \
            invar::Log(1) << message;                             \
        }                                                         \
    }
#define INVAR_INFO(message)                                       \
    {                                                             \
        if (invar::Log::level() >= 2) {                           \
            invar::Log(2) << message;                             \
        }                                                         \
    }
#define INVAR_DEBUG(message)                                      \
    {                                                             \
        if (invar::Log::level() >= 3) {                           \
            invar::Log(3) << message;                             \
        }                                                         \
    }

#define INVAR_PRINT(variable) INVAR_INFO(#variable " = " << (variable))

#define INVAR_ERROR(message)                                          \
    {                                                                 \
        invar::Log(0) << message << "\n\t" << __FILE__ << " : "       \
                      << __LINE__ << "\n\t" << __PRETTY_FUNCTION__    \
                      << "\n";                                        \
        abort();                                                      \
    }

#define INVAR_ASSERT(cond, mess) \
    {                            \
        if (not(cond)) {         \
            INVAR_ERROR(mess)    \
        }                        \
    }

#define INVAR_ASSERT_(level, cond, mess)     \
    {                                        \
        if (INVAR_DEBUG_LEVEL >= (level)) {  \
            INVAR_ASSERT(cond, mess)         \
        }                                    \
    }

#define INVAR_ASSERT1(cond, mess) INVAR_ASSERT_(1, cond, mess)
#define INVAR_ASSERT2(cond, mess) INVAR_ASSERT_(2, cond, mess)
#define INVAR_ASSERT3(cond, mess) INVAR_ASSERT_(3, cond, mess)

#define INVAR_ASSERT_EQ(x, y)                                           \
    INVAR_ASSERT((x) == (y), "expected " #x " == " #y "; actual "       \
                                 << (x) << " vs " << (y))
#define INVAR_ASSERT_LE(x, y)                                           \
    INVAR_ASSERT((x) <= (y), "expected " #x " <= " #y "; actual "       \
                                 << (x) << " vs " << (y))
#define INVAR_ASSERT_LT(x, y)                                           \
    INVAR_ASSERT((x) < (y), "expected " #x " < " #y "; actual "         \
                                << (x) << " vs " << (y))
#define INVAR_ASSERT_NE(x, y)                                           \
    INVAR_ASSERT((x) != (y), "expected " #x " != " #y "; actual "       \
                                 << (x) << " vs " << (y))

//----------------------------------------------------------------------------
// map operations

template <class Map>
const typename Map::mapped_type& map_find(const Map& map,
                                          const typename Map::key_type& key) {
    auto iter = map.find(key);
    INVAR_ASSERT(iter != map.end(), "missing key " << key);
    return iter->second;
}

//----------------------------------------------------------------------------
// vector operations

template <class T>
std::ostream& operator<<(std::ostream& o, const std::vector<T>& x) {
    o << "[";
    if (not x.empty()) {
        o << x[0];
        for (size_t i = 1; i < x.size(); ++i) {
            o << ", " << x[i];
        }
    }
    return o << "]";
}

}  // namespace invar
