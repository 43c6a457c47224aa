// Category loggers share one stdout sink; the logger name becomes the
// "[category]" prefix on every line.
#include "Logging.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
std::shared_ptr<spdlog::logger> MakeCategory(const char* category) {
    if (auto existing = spdlog::get(category)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(category);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
    return logger;
}
} // namespace

namespace FXN::Logging {

spdlog::logger& Registry()  { static auto log = MakeCategory("registry");  return *log; }
spdlog::logger& Discovery() { static auto log = MakeCategory("discovery"); return *log; }
spdlog::logger& Transport() { static auto log = MakeCategory("transport"); return *log; }
spdlog::logger& Service()   { static auto log = MakeCategory("service");   return *log; }

void SetLevel(spdlog::level::level_enum level) {
    Registry().set_level(level);
    Discovery().set_level(level);
    Transport().set_level(level);
    Service().set_level(level);
}

} // namespace FXN::Logging

namespace FXN::LogDetail {

RlState& KeyedRlState(std::string_view site, std::string_view instance) {
    static std::mutex lock;
    static std::map<std::string, RlState, std::less<>> states;

    std::string key;
    key.reserve(site.size() + instance.size() + 1);
    key.append(site).append(1, '|').append(instance);

    std::lock_guard<std::mutex> guard(lock);
    return states.try_emplace(std::move(key)).first->second;
}

} // namespace FXN::LogDetail
