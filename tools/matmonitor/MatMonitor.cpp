#include "MatMonitor.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <system_error>

#include "apps/nav/EdgePositionConverter.hpp"

namespace monitor {

// ---------------- CSV logging ----------------
static std::ofstream open_csv(
    const MatMonitorCtx& ctx,
    const std::string& header_line    // e.g. "k,t_pub_us,x_mm,y_mm\n"
) {
    std::error_code ec;
    std::filesystem::create_directories(ctx.cfg.out_dir, ec);
    const std::string path = ctx.cfg.out_dir + "/" + ctx.cfg.csv_name;

    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cout << "[MONITOR] ERROR: could not open CSV: " << path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return f;
    }

    std::cout << "[MONITOR] CSV open: " << path << "\n";
    if (!header_line.empty()) {
        f << header_line;
    }
    return f;
}

static void print_state(const msg::PoseState& s, double hz, const nav::MatDimensions& mat) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "[MONITOR] state_hz=" << hz
              << " events=" << s.event_count
              << " samples=" << s.sample_count
              << " throttled=" << s.throttled_count
              << " rejected=" << s.rejected_count << "\n";

    if (!s.tracking) {
        std::cout << "[POSE] UNINITIALIZED\n";
        return;
    }

    const nav::EdgeOffsets e = nav::toEdges({s.x_mm, s.y_mm, s.heading_deg}, nullptr, mat.widthMm);

    std::cout << "[POSE] x=" << s.x_mm << " mm  y=" << s.y_mm
              << " mm  heading=" << s.heading_deg << " deg"
              << "  (" << e.fromBottomMm << " from bottom, "
              << e.fromSideMm << " from " << nav::matSideName(e.side) << ")\n";
    std::cout << "[POSE] telemetry d=" << s.distance_mm << " mm  a=" << s.angle_deg
              << " deg  ref=(" << s.ref_distance_mm << ", " << s.ref_angle_deg << ")"
              << "  manual=" << s.manual_adj_deg << " deg\n";
}

// ---------------- task entry ----------------
void TaskEntry(void* arg) {
    auto* ctx = static_cast<MatMonitorCtx*>(arg);
    if (!ctx || !ctx->state_in) return;

    std::cout << "[MONITOR] started\n";

    std::ofstream csv;
    if (ctx->cfg.enable_csv) {
        csv = open_csv(*ctx,
            "k,t_event_us,t_pub_us,exec_us,x_mm,y_mm,heading_deg,"
            "distance_mm,angle_deg,manual_adj_deg,tracking\n");
    }

    const uint32_t log_every = (ctx->cfg.log_every > 0) ? ctx->cfg.log_every : 1;
    const uint64_t print_period_us = uint64_t(ctx->cfg.print_period_ms) * 1000ull;
    const nav::MatDimensions mat = ctx->cfg.mat;

    uint64_t last_print_us = Rtos::NowUs();
    uint32_t window_count = 0;
    uint32_t k = 0;

    MatMonitorStats& st = ctx->stats;

    auto stopping = [&]() { return ctx->stop && ctx->stop->load(); };

    while (true) {
        msg::PoseState s{};
        while (ctx->state_in->try_receive(s)) {
            st.last = s;
            st.has_last = true;
            st.received++;
            window_count++;

            if (csv.is_open() && st.logged < ctx->cfg.log_n && (k % log_every == 0)) {
                csv << st.logged << "," << s.t_event_us << "," << s.t_pub_us << ","
                    << s.exec_us << ","
                    << s.x_mm << "," << s.y_mm << "," << s.heading_deg << ","
                    << s.distance_mm << "," << s.angle_deg << ","
                    << s.manual_adj_deg << "," << int(s.tracking) << "\n";
                st.logged++;
                if (st.logged == ctx->cfg.log_n) {
                    csv.flush();
                    csv.close();
                    st.csv_files_written++;
                    std::cout << "[MONITOR] Wrote " << ctx->cfg.csv_name
                              << " (" << ctx->cfg.log_n << " rows)\n";
                }
            }
            k++;
        }

        // PRINT ON CONSOLE
        const uint64_t now = Rtos::NowUs();
        if (now - last_print_us >= print_period_us) {
            const double dt_s = double(now - last_print_us) * 1e-6;
            const double hz = (dt_s > 0.0) ? (double(window_count) / dt_s) : 0.0;

            if (st.has_last) {
                print_state(st.last, hz, mat);
            } else {
                std::cout << "[MONITOR] no pose state yet\n";
            }

            last_print_us = now;
            window_count = 0;
        }

        // Drained once more after the stop flag so the final state is seen
        if (stopping()) break;

        Rtos::SleepMs(int(ctx->cfg.poll_period_ms));
    }

    // Already closed once log_n rows were written
    if (csv.is_open()) {
        csv.flush();
        csv.close();
        st.csv_files_written++;
        std::cout << "[MONITOR] Wrote " << ctx->cfg.csv_name << " (" << st.logged << " rows)\n";
    }
    std::cout << "[MONITOR] stopped\n";
}

} // namespace monitor
