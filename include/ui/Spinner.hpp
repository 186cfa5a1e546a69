#pragma once
#include <array>
#include <cstddef>

// Braille "working" indicator, advanced once per rendered frame.
class Spinner {
public:
    static constexpr std::array<const char*, 10> kFrames = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
    };

    const char* frame() const { return kFrames[index_]; }
    void advance() { index_ = (index_ + 1) % kFrames.size(); }
    void reset() { index_ = 0; }
    size_t index() const { return index_; }

private:
    size_t index_ = 0;
};
