#pragma once
#include <chrono>
#include <string>

namespace courier {

struct Config {
    std::string task_db_path = "courier_tasks.db";
    std::chrono::milliseconds debounce{2000};
    std::chrono::milliseconds dequeue_timeout{5000};
    std::chrono::milliseconds background_poll_interval{5000};
    int background_max_polls = 60;
};

// Defaults overridden by COURIER_* environment variables. A value that does
// not parse is reported on stderr and the default kept.
Config load_config_from_env();

} // namespace courier
