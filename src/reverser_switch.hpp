#pragma once

#include "bindings.hpp"

constexpr int REVERSER_FORWARD_VALUE = 255;
constexpr int REVERSER_NEUTRAL_VALUE = 127;
constexpr int REVERSER_REVERSE_VALUE = 0;

int reverser_position_value(ReverserPosition position);

// Latched reverser position driven by two or three switch inputs.
class ReverserSwitch {
public:
    ReverserPosition position() const { return current; }
    int value() const { return reverser_position_value(current); }
    void reset() { current = ReverserPosition::Neutral; }

    // Inputs reported active in this batch; highest priority wins, nothing active keeps the latch.
    bool apply_three_way(bool forward_active, bool neutral_active, bool reverse_active);

    // Current state of both inputs; both pressed keeps the latch.
    bool apply_two_way(bool forward_active, bool reverse_active);

private:
    ReverserPosition current = ReverserPosition::Neutral;

    bool move_to(ReverserPosition next);
};
