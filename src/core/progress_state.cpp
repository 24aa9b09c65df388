#include "throttle/core/progress_state.hpp"
#include <utility>

namespace throttle {
namespace core {

ProgressState::ProgressState(LoaderSettings settings)
    : settings_(std::move(settings)) {}

uint64_t ProgressState::add(uint64_t amount) {
    completed_ += amount;
    return completed_;
}

void ProgressState::advanceSpinner(size_t frame_count) {
    spinner_frame_ = (spinner_frame_ + 1) % frame_count;
}

RenderContext ProgressState::snapshot() const {
    RenderContext ctx;
    ctx.completed = completed_;
    ctx.total = settings_.total;
    ctx.unit = settings_.unit;
    ctx.description = settings_.description;
    ctx.bar_length = settings_.bar_length;
    ctx.color = settings_.color;
    ctx.fill_char = settings_.fill_char;
    ctx.empty_char = settings_.empty_char;
    ctx.spinner_frame = spinner_frame_;
    return ctx;
}

}}
