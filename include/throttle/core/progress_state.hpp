#pragma once

#include "loader_options.hpp"
#include "render_strategy.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace throttle {
namespace core {

// Shared between the caller and the render thread. completed and
// spinner_frame are guarded by mutex; settings never change after
// construction and may be read without it.
class ProgressState {
public:
    explicit ProgressState(LoaderSettings settings);

    const LoaderSettings& settings() const { return settings_; }
    std::mutex& mutex() const { return mutex_; }

    // The methods below expect mutex() to be held by the caller.
    uint64_t completed() const { return completed_; }
    void setCompleted(uint64_t completed) { completed_ = completed; }
    uint64_t add(uint64_t amount);

    size_t spinnerFrame() const { return spinner_frame_; }
    void advanceSpinner(size_t frame_count);

    RenderContext snapshot() const;

private:
    const LoaderSettings settings_;
    mutable std::mutex mutex_;
    uint64_t completed_ = 0;
    size_t spinner_frame_ = 0;
};

}}
