#include "color_picker.h"
#include <numeric>
#include <utility>

const std::vector<std::vector<int>>& VisibleColorPicker::groups() {
    static const std::vector<std::vector<int>> g = {
        { 11, 241 },            // light reds
        { 20, 30 },             // oranges
        { 40, 50 },             // yellows
        { 60, 70 },             // lime
        { 80, 90 },             // greens
        { 100, 110 },           // green-cyans
        { 120, 130 },           // cyans
        { 140, 150, 161, 171 }, // light blues, not ACI 5
        { 191, 201 },           // purples
        { 210, 220, 230 },      // magenta to pink
        { 7 },                  // white on black
    };
    return g;
}

VisibleColorPicker::VisibleColorPicker(uint32_t seed) : rng_(seed) {}

template <class T>
static void shuffle(std::vector<T>& v, std::mt19937& rng) {
    // Fisher-Yates with plain modulo, same order on every standard library.
    for (size_t i = v.size(); i > 1; --i) {
        size_t j = rng() % i;
        std::swap(v[i - 1], v[j]);
    }
}

void VisibleColorPicker::refill() {
    const auto& g = groups();
    std::vector<size_t> order(g.size());
    std::iota(order.begin(), order.end(), size_t{0});
    shuffle(order, rng_);

    std::vector<std::deque<int>> perGroup;
    perGroup.reserve(g.size());
    for (const auto& colors : g) {
        std::vector<int> c = colors;
        shuffle(c, rng_);
        perGroup.emplace_back(c.begin(), c.end());
    }

    bool added = true;
    while (added) {
        added = false;
        for (size_t gi : order) {
            if (perGroup[gi].empty()) continue;
            queue_.push_back(perGroup[gi].front());
            perGroup[gi].pop_front();
            added = true;
        }
    }
}

void VisibleColorPicker::reset() {
    queue_.clear();
    refill();
}

int VisibleColorPicker::next() {
    if (queue_.empty()) refill();
    int c = queue_.front();
    queue_.pop_front();
    return c;
}
