#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "apps/nav/PoseTask.hpp"
#include "msg/PoseState.hpp"

namespace monitor {

// -------------------- Monitor task --------------------
// Low-priority "observer" task:
// - Non-blocking reads from the pose state queue (freshest-wins).
// - Prints at a slow cadence so it doesn't perturb the pose task.
// - Computes the snapshot update rate (Hz) from arrivals.

struct MatMonitorConfig {
    nav::MatDimensions mat{};

    // Console
    uint32_t print_period_ms = 1000;
    uint32_t poll_period_ms = 10;

    // Logging
    bool enable_csv = false;
    std::string out_dir = "tools/data/tmp/mat_monitor";
    std::string csv_name = "pose_log.csv";
    uint32_t log_n = 100000;   // stop logging after this many rows
    uint32_t log_every = 1;
};

struct MatMonitorStats {
    uint32_t received = 0;
    uint32_t logged = 0;
    uint32_t csv_files_written = 0;
    msg::PoseState last{};
    bool has_last = false;
};

struct MatMonitorCtx {
    nav::PoseStateQueue* state_in = nullptr;
    const std::atomic<bool>* stop = nullptr;  // optional; runs forever if null
    MatMonitorConfig cfg;
    MatMonitorStats stats;                    // written by the task, read after Join()
};

// OSAL task entry
void TaskEntry(void* arg);

} // namespace monitor
