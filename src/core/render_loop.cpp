#include "throttle/core/render_loop.hpp"
#include "throttle/common/logger.hpp"

namespace throttle {
namespace core {

RenderLoop::RenderLoop(ProgressState& state, const RenderStrategy& strategy, std::ostream& out)
    : state_(state), strategy_(strategy), out_(out) {}

RenderLoop::~RenderLoop() {
    stop();
}

bool RenderLoop::start() {
    if (running_) {
        return true;
    }

    // Reap a thread that exited on its own after a render failure.
    if (render_thread_.joinable()) {
        render_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }

    running_ = true;
    render_thread_ = std::thread(&RenderLoop::renderThreadMain, this);

    common::Logger::instance().debug("[RenderLoop] Started | strategy={} | interval_ms={}",
                                     strategy_.name(),
                                     state_.settings().refresh_interval.count());
    return true;
}

void RenderLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (render_thread_.joinable()) {
        render_thread_.join();
        common::Logger::instance().debug("[RenderLoop] Stopped | ticks={}", ticks_.load());
    }

    running_ = false;
}

void RenderLoop::renderThreadMain() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            if (stop_requested_) {
                break;
            }
        }

        try {
            renderFrame();
        } catch (const std::exception& e) {
            common::Logger::instance().error("[RenderLoop] Render failed | error={}", e.what());
            running_ = false;
            break;
        }

        if (!waitForNextTick()) {
            break;
        }
    }
}

void RenderLoop::renderFrame() {
    std::lock_guard<std::mutex> lock(state_.mutex());

    std::string output = strategy_.render(state_.snapshot());
    out_ << '\r' << output << std::flush;

    state_.advanceSpinner(SpinnerStrategy::frameCount());
    ++ticks_;
}

bool RenderLoop::waitForNextTick() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, state_.settings().refresh_interval,
                              [this] { return stop_requested_; });
}

}}
