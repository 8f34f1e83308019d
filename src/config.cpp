#include "config.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>

namespace courier {

namespace {

// Seconds as a non-negative decimal, e.g. "2", "0.25".
bool parse_seconds(const char* text, std::chrono::milliseconds& out) {
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(v) || v < 0) return false;
    out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(v * 1000.0)));
    return true;
}

bool parse_count(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v <= 0 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

void load_seconds(const char* name, std::chrono::milliseconds& field) {
    const char* v = std::getenv(name);
    if (!v) return;
    if (!parse_seconds(v, field)) {
        std::cerr << "[Config] BAD_VALUE " << name << "=" << v << " keeping=" << field.count() << "ms\n";
    }
}

} // namespace

Config load_config_from_env() {
    Config cfg;
    if (const char* v = std::getenv("COURIER_TASK_DB")) {
        if (*v) cfg.task_db_path = v;
        else std::cerr << "[Config] BAD_VALUE COURIER_TASK_DB is empty keeping=" << cfg.task_db_path << "\n";
    }
    load_seconds("COURIER_DEBOUNCE_SECONDS", cfg.debounce);
    load_seconds("COURIER_DEQUEUE_TIMEOUT_SECONDS", cfg.dequeue_timeout);
    load_seconds("COURIER_POLL_INTERVAL_SECONDS", cfg.background_poll_interval);
    if (const char* v = std::getenv("COURIER_MAX_POLLS")) {
        if (!parse_count(v, cfg.background_max_polls)) {
            std::cerr << "[Config] BAD_VALUE COURIER_MAX_POLLS=" << v
                      << " keeping=" << cfg.background_max_polls << "\n";
        }
    }
    std::cout << "[Config] LOADED db=" << cfg.task_db_path << " debounce=" << cfg.debounce.count()
              << "ms dequeue_timeout=" << cfg.dequeue_timeout.count()
              << "ms poll_interval=" << cfg.background_poll_interval.count()
              << "ms max_polls=" << cfg.background_max_polls << "\n";
    return cfg;
}

} // namespace courier
