#pragma once

#include "loader_options.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace throttle {
namespace core {

// Snapshot of everything a strategy may look at for one frame.
struct RenderContext {
    uint64_t completed = 0;
    uint64_t total = 1;
    std::string unit;
    std::string description;
    size_t bar_length = 20;
    Color color = Color::BLUE;
    std::string fill_char = "#";
    std::string empty_char = " ";
    size_t spinner_frame = 0;
};

class RenderStrategy {
public:
    virtual ~RenderStrategy() = default;

    virtual std::string render(const RenderContext& ctx) const = 0;
    virtual const char* name() const = 0;
};

class BarStrategy : public RenderStrategy {
public:
    std::string render(const RenderContext& ctx) const override;
    const char* name() const override { return "bar"; }

    // floor(completed / total * bar_length), not clamped to bar_length.
    static uint64_t filledCells(uint64_t completed, uint64_t total, size_t bar_length);
    static uint64_t percentage(uint64_t completed, uint64_t total);
};

class SpinnerStrategy : public RenderStrategy {
public:
    std::string render(const RenderContext& ctx) const override;
    const char* name() const override { return "spinner"; }

    static size_t frameCount();
};

class DotsStrategy : public RenderStrategy {
public:
    std::string render(const RenderContext& ctx) const override;
    const char* name() const override { return "dots"; }

    static size_t dotCount(uint64_t completed);
};

class ClockStrategy : public RenderStrategy {
public:
    std::string render(const RenderContext& ctx) const override;
    const char* name() const override { return "time_clock"; }

    static size_t glyphIndex(uint64_t completed, uint64_t total);
};

class CallbackStrategy : public RenderStrategy {
public:
    explicit CallbackStrategy(RenderCallback callback);

    std::string render(const RenderContext& ctx) const override;
    const char* name() const override { return "custom"; }

private:
    RenderCallback callback_;
};

// Custom callback first, then the spinner flag, then the style.
std::unique_ptr<RenderStrategy> makeStrategy(const LoaderSettings& settings,
                                             const RenderCallback& render_callback);

}}
