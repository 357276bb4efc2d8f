#include "libsvcloc/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace libsvcloc {

namespace {

std::shared_ptr<spdlog::logger> make_default_logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(logger_name);
    created->set_level(spdlog::level::warn);
    return created;
}

struct logger_slot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> current;
};

logger_slot& slot() {
    static logger_slot instance;
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    if (!s.current) {
        s.current = make_default_logger();
    }
    return s.current;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    s.current = std::move(replacement);
}

} // namespace libsvcloc
