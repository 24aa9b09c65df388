#include "throttle/core/progress_loader.hpp"
#include "throttle/common/logger.hpp"

namespace throttle {
namespace core {

std::string to_string(LoaderState state) {
    switch (state) {
        case LoaderState::CREATED: return "created";
        case LoaderState::RUNNING: return "running";
        case LoaderState::STOPPED: return "stopped";
    }
    return "unknown";
}

ProgressLoader::ProgressLoader(const LoaderOptions& options, std::ostream& out)
    : out_(out),
      state_(validateOptions(options)),
      update_callback_(options.update_callback),
      strategy_(makeStrategy(state_.settings(), options.render_callback)) {
    render_loop_ = std::make_unique<RenderLoop>(state_, *strategy_, out_);

    common::Logger::instance().debug("[Loader] Created | total={} | strategy={} | color={} | bar_length={}",
                                     state_.settings().total, strategy_->name(),
                                     to_string(state_.settings().color),
                                     state_.settings().bar_length);
}

ProgressLoader::~ProgressLoader() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        running = lifecycle_ == LoaderState::RUNNING;
    }

    if (running) {
        try {
            close();
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Loader] Close on destruction failed | error={}", e.what());
        }
    }
}

void ProgressLoader::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (lifecycle_ != LoaderState::CREATED) {
        common::Logger::instance().warn("[Loader] Start ignored | state={}", to_string(lifecycle_));
        return;
    }

    render_loop_->start();
    lifecycle_ = LoaderState::RUNNING;

    common::Logger::instance().info("[Loader] Started | description={} | total={}",
                                    state_.settings().description, state_.settings().total);
}

void ProgressLoader::update(uint64_t amount) {
    std::lock_guard<std::mutex> lock(state_.mutex());

    uint64_t completed = state_.add(amount);
    if (update_callback_) {
        update_callback_(completed);
    }
}

void ProgressLoader::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (lifecycle_ == LoaderState::STOPPED) {
        return;
    }

    render_loop_->stop();
    lifecycle_ = LoaderState::STOPPED;

    out_ << '\n' << std::flush;

    common::Logger::instance().info("[Loader] Closed | completed={} | total={} | ticks={}",
                                    completed(), state_.settings().total, render_loop_->ticks());
}

std::string ProgressLoader::render() const {
    std::lock_guard<std::mutex> lock(state_.mutex());
    return strategy_->render(state_.snapshot());
}

void ProgressLoader::setCompleted(uint64_t completed) {
    std::lock_guard<std::mutex> lock(state_.mutex());
    state_.setCompleted(completed);
}

uint64_t ProgressLoader::completed() const {
    std::lock_guard<std::mutex> lock(state_.mutex());
    return state_.completed();
}

LoaderState ProgressLoader::state() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return lifecycle_;
}

void ProgressLoader::abortWithMessage(const std::string& message) {
    common::ErrorContext ctx;
    ctx.component = "loader";
    ctx.details["completed"] = std::to_string(completed());
    ctx.details["total"] = std::to_string(state_.settings().total);
    ctx.details["error"] = message;

    common::Logger::instance().error("[Loader] Item processing failed | {}", common::formatContext(ctx));
    {
        std::lock_guard<std::mutex> lock(state_.mutex());
        out_ << '\n' << message << '\n' << std::flush;
    }
    close();
}

LoaderGuard::LoaderGuard(ProgressLoader& loader) : loader_(loader) {
    loader_.start();
}

LoaderGuard::~LoaderGuard() {
    try {
        loader_.close();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Loader] Close in guard failed | error={}", e.what());
    }
}

}}
