#pragma once

#include "progress_state.hpp"
#include "render_strategy.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <thread>

namespace throttle {
namespace core {

class RenderLoop {
public:
    RenderLoop(ProgressState& state, const RenderStrategy& strategy, std::ostream& out);
    ~RenderLoop();

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    bool start();
    // Returns once the render thread has exited; nothing is written after.
    void stop();

    // False once stopped, or once the thread has exited on a render failure.
    bool isRunning() const { return running_; }
    size_t ticks() const { return ticks_; }

private:
    ProgressState& state_;
    const RenderStrategy& strategy_;
    std::ostream& out_;

    std::thread render_thread_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> ticks_{0};

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    void renderThreadMain();
    void renderFrame();
    bool waitForNextTick();
};

}}
