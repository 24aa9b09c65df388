#pragma once

#include "error_codes.hpp"
#include "loader_options.hpp"
#include "progress_state.hpp"
#include "render_loop.hpp"
#include "render_strategy.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <utility>

namespace throttle {
namespace core {

enum class LoaderState {
    CREATED,
    RUNNING,
    STOPPED
};

std::string to_string(LoaderState state);

// Repaints a unit-counted task's status line from a background thread.
// CREATED -> RUNNING -> STOPPED; repeated start() or close() is a no-op.
// Callbacks run under the state lock and must not call back into the loader.
class ProgressLoader {
public:
    explicit ProgressLoader(const LoaderOptions& options, std::ostream& out = std::cout);
    ~ProgressLoader();

    ProgressLoader(const ProgressLoader&) = delete;
    ProgressLoader& operator=(const ProgressLoader&) = delete;

    void start();
    void update(uint64_t amount = 1);
    void close();

    // One frame of the current state, without the leading carriage return.
    std::string render() const;

    // Overwrites completed without running the update callback. Meant for
    // single-frame rendering where no render thread is involved.
    void setCompleted(uint64_t completed);

    uint64_t completed() const;
    LoaderState state() const;
    const LoaderSettings& settings() const { return state_.settings(); }
    const RenderStrategy& strategy() const { return *strategy_; }

    // Calls item_fn(item, *this) per item, one unit of progress each, then
    // closes. On the first throw the message is written, the loader closed
    // and the exception rethrown.
    template<typename Container, typename ItemFn>
    void runOverItems(ItemFn&& item_fn, const Container& items) {
        if (std::begin(items) == std::end(items)) {
            throw EmptyInputError("Item list is empty");
        }

        try {
            for (const auto& item : items) {
                item_fn(item, *this);
                update();
                std::this_thread::sleep_for(state_.settings().item_delay);
            }
        } catch (const std::exception& e) {
            abortWithMessage(e.what());
            throw;
        } catch (...) {
            abortWithMessage("Unknown error while processing item");
            throw;
        }

        close();
    }

private:
    std::ostream& out_;
    ProgressState state_;
    UpdateCallback update_callback_;
    std::unique_ptr<RenderStrategy> strategy_;
    std::unique_ptr<RenderLoop> render_loop_;

    mutable std::mutex lifecycle_mutex_;
    LoaderState lifecycle_ = LoaderState::CREATED;

    void abortWithMessage(const std::string& message);
};

// Starts the loader on construction and closes it on every exit path.
class LoaderGuard {
public:
    explicit LoaderGuard(ProgressLoader& loader);
    ~LoaderGuard();

    LoaderGuard(const LoaderGuard&) = delete;
    LoaderGuard& operator=(const LoaderGuard&) = delete;

    ProgressLoader& loader() { return loader_; }

private:
    ProgressLoader& loader_;
};

// Runs fn(loader) with a started loader and returns its result; the loader
// is closed before this returns or throws.
template<typename Fn>
auto withLoader(const LoaderOptions& options, Fn&& fn, std::ostream& out = std::cout)
    -> decltype(fn(std::declval<ProgressLoader&>())) {
    ProgressLoader loader(options, out);
    LoaderGuard guard(loader);
    return fn(loader);
}

}}
