#pragma once
#include <cstdint>
#include <deque>
#include <random>
#include <vector>

// Colour strategy for plate blocks. Values are ACI indices.
class ColorPicker {
public:
    virtual ~ColorPicker() = default;
    // Called when a new drawing starts.
    virtual void reset() = 0;
    virtual int next() = 0;
};

// Bright ACI colours readable on a black background. Hue groups are
// interleaved in a shuffled order so neighbours rarely share a hue.
// Same seed, same sequence.
class VisibleColorPicker : public ColorPicker {
public:
    explicit VisibleColorPicker(uint32_t seed = 5489u);
    void reset() override;
    int next() override;

    static const std::vector<std::vector<int>>& groups();

private:
    void refill();

    std::mt19937 rng_;
    std::deque<int> queue_;
};

class FixedColorPicker : public ColorPicker {
public:
    explicit FixedColorPicker(int aci) : aci_(aci) {}
    void reset() override {}
    int next() override { return aci_; }

private:
    int aci_;
};
