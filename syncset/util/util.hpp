#pragma once

#include <stdint.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace syncset {

//----------------------------------------------------------------------------
// compiler-specific

#ifdef __GNUG__
#define likely(x) __builtin_expect(bool(x), true)
#else  // __GNUG__
#warning "ignoring likely(-)"
#define likely(x) (x)
#endif  // __GNUG__

//----------------------------------------------------------------------------
// debugging

#ifndef SYNCSET_DEBUG_LEVEL
#define SYNCSET_DEBUG_LEVEL 0
#endif  // SYNCSET_DEBUG_LEVEL

//----------------------------------------------------------------------------
// convenience

template <class T>
inline T min(T x, T y) {
    return (x < y) ? x : y;
}

typedef std::default_random_engine rng_t;

class noncopyable {
    noncopyable(const noncopyable &) = delete;
    void operator=(const noncopyable &) = delete;

   public:
    noncopyable() {}
};

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

inline const char *getenv_default(const char *key, const char *default_val) {
    const char *val = getenv(key);
    return val ? val : default_val;
}

inline size_t getenv_default(const char *key, size_t default_val) {
    const char *val = getenv(key);
    return val ? atoi(val) : default_val;
}

//----------------------------------------------------------------------------
// logging

const char *const DEFAULT_LOG_FILE = "syncset.log";
const size_t DEFAULT_LOG_LEVEL = 1;

const std::string g_log_level_name[4] = {"ERROR   ", "WARNING ", "INFO    ",
                                         "DEBUG   "};

class Log {
    // lines from concurrent threads must not interleave
    class GlobalState : noncopyable {
        const std::string log_filename;
        std::ofstream log_stream;
        std::mutex log_mutex;

       public:
        const size_t log_level;

        GlobalState();

        void write(const std::string &message) {
            std::lock_guard<std::mutex> lock(log_mutex);
            log_stream << message << std::flush;
        }
    };

    static GlobalState s_state;

    std::ostringstream m_message;

   public:
    static size_t level() { return s_state.log_level; }

    explicit Log(size_t level) {
        m_message << std::left << std::setw(12) << get_elapsed_time();
        m_message << g_log_level_name[min(size_t(3), level)];
    }

    ~Log() {
        m_message << '\n';
        s_state.write(m_message.str());
    }

    template <class T>
    Log &operator<<(const T &t) {
        m_message << t;
        return *this;
    }

    struct Context {
        explicit Context(std::string name);
        Context(int argc, char **argv);
        ~Context();
    };

    static int init();
};

#define SYNCSET_INFO(message) \
    { if (syncset::Log::level() >= 2) { syncset::Log(2) << message; } }
#define SYNCSET_DEBUG(message) \
    { if (syncset::Log::level() >= 3) { syncset::Log(3) << message; } }

#define SYNCSET_ERROR(message) { syncset::Log(0) \
    << message << "\n\t" \
    << __FILE__ << " : " << __LINE__ << "\n\t" \
    << __PRETTY_FUNCTION__ << "\n"; \
    abort(); }

#define SYNCSET_ASSERT(cond, mess) { if (not (cond)) SYNCSET_ERROR(mess) }

#define SYNCSET_ASSERT_(level, cond, mess) \
    { if (SYNCSET_DEBUG_LEVEL >= (level)) SYNCSET_ASSERT(cond, mess) }

#define SYNCSET_ASSERT1(cond, mess) SYNCSET_ASSERT_(1, cond, mess)

#define SYNCSET_ASSERT_EQ(x, y)                                        \
    SYNCSET_ASSERT((x) == (y), "expected " #x " == " #y "; actual "    \
                                   << (x) << " vs " << (y))

}  // namespace syncset
