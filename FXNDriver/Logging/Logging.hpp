#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>

#include <spdlog/spdlog.h>

//
// Category loggers are spdlog loggers named after the category, so every line
// carries a stable "[registry]" / "[discovery]" prefix for filtering.
// Format strings use fmt syntax.
//

namespace FXN::Logging {
spdlog::logger& Registry();
spdlog::logger& Discovery();
spdlog::logger& Transport();
spdlog::logger& Service();

// Applies a global level to every category logger (e.g. from FXN_LOG_LEVEL).
void SetLevel(spdlog::level::level_enum level);
} // namespace FXN::Logging

// ----- time helpers (header-only) -----
namespace FXN::LogDetail {
inline uint64_t NowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};

// Admission check for one rate-limit window. Returns true when the line should
// be emitted; `lost` then holds the number of lines dropped since the last one.
inline bool RlAdmit(RlState& s, uint64_t now_ns, uint64_t interval_ns, uint64_t& lost) {
    lost = 0;
    const uint64_t last = s.last_ns.load(std::memory_order_relaxed);
    if (last != 0 && now_ns - last < interval_ns) {
        s.suppressed.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    if (s.last_ns.exchange(now_ns, std::memory_order_relaxed) != 0) {
        lost = s.suppressed.exchange(0, std::memory_order_relaxed);
    }
    return true;
}

// State for one (callsite, instance) pair, so one unit's repeated warning does
// not silence the same warning for another unit. Entries live for the process.
RlState& KeyedRlState(std::string_view site, std::string_view instance);
} // namespace FXN::LogDetail

// ----- Plain logging -----
#define FXN_LOG(cat, fmt, ...) \
    FXN::Logging::cat().info(fmt, ##__VA_ARGS__)

#define FXN_LOG_TYPE(cat, level, fmt, ...) \
    FXN::Logging::cat().log((level), fmt, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "poll/pending_mismatch"); interval_ms: throttle window
#define FXN_LOG_RL_WITH(cat, state, key, interval_ms, level, fmt, ...)                         \
    do {                                                                                        \
        uint64_t _lost = 0;                                                                     \
        if (FXN::LogDetail::RlAdmit((state), FXN::LogDetail::NowNs(),                           \
                                    (uint64_t)(interval_ms) * 1000000ull, _lost)) {             \
            if (_lost) {                                                                        \
                FXN::Logging::cat().log((level), "[{}] (suppressed={} prior)", key, _lost);     \
            }                                                                                   \
            FXN::Logging::cat().log((level), "[{}] " fmt, key, ##__VA_ARGS__);                  \
        }                                                                                       \
    } while (0)

// One window per callsite.
#define FXN_LOG_RL(cat, key, interval_ms, level, fmt, ...)                                     \
    do {                                                                                        \
        static FXN::LogDetail::RlState _s;                                                      \
        FXN_LOG_RL_WITH(cat, _s, key, interval_ms, level, fmt, ##__VA_ARGS__);                  \
    } while (0)

// One window per callsite and instance (e.g. per unit id).
#define FXN_LOG_RL_FOR(cat, key, instance, interval_ms, level, fmt, ...)                       \
    FXN_LOG_RL_WITH(cat, FXN::LogDetail::KeyedRlState((key), (instance)), key, interval_ms,   \
                    level, fmt, ##__VA_ARGS__)

// Convenience shorthands
#define FXN_LOG_INFO(cat, fmt, ...)    FXN_LOG_TYPE(cat, spdlog::level::info,  fmt, ##__VA_ARGS__)
#define FXN_LOG_WARNING(cat, fmt, ...) FXN_LOG_TYPE(cat, spdlog::level::warn,  fmt, ##__VA_ARGS__)
#define FXN_LOG_ERROR(cat, fmt, ...)   FXN_LOG_TYPE(cat, spdlog::level::err,   fmt, ##__VA_ARGS__)
#define FXN_LOG_DEBUG(cat, fmt, ...)   FXN_LOG_TYPE(cat, spdlog::level::debug, fmt, ##__VA_ARGS__)

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
//   FXN_LOG_V0(Registry, "Poll failed");        // Level 0+ (always)
//   FXN_LOG_V1(Registry, "Unit registered");    // Level 1+ (compact summaries)
//   FXN_LOG_V2(Registry, "Point changed");      // Level 2+ (key transitions)
//   FXN_LOG_V3(Registry, "Polling unit");       // Level 3+ (verbose)
//   FXN_LOG_V4(Discovery, "Reply bytes");       // Level 4+ (full diagnostics)
//
// Levels come from FXN_<CATEGORY>_VERBOSITY (see LogConfig).
//

namespace FXN {
class LogConfig;
}

#define FXN_GET_VERBOSITY(category) \
    (FXN::LogConfig::Shared().Get##category##Verbosity())

#define FXN_LOG_V0(category, fmt, ...) \
    do { \
        if (FXN_GET_VERBOSITY(category) >= 0) { \
            FXN_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define FXN_LOG_V1(category, fmt, ...) \
    do { \
        if (FXN_GET_VERBOSITY(category) >= 1) { \
            FXN_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define FXN_LOG_V2(category, fmt, ...) \
    do { \
        if (FXN_GET_VERBOSITY(category) >= 2) { \
            FXN_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define FXN_LOG_V3(category, fmt, ...) \
    do { \
        if (FXN_GET_VERBOSITY(category) >= 3) { \
            FXN_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define FXN_LOG_V4(category, fmt, ...) \
    do { \
        if (FXN_GET_VERBOSITY(category) >= 4) { \
            FXN_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#include "LogConfig.hpp"
