#include "reverser_switch.hpp"

int reverser_position_value(ReverserPosition position) {
    switch (position) {
        case ReverserPosition::Forward: return REVERSER_FORWARD_VALUE;
        case ReverserPosition::Neutral: return REVERSER_NEUTRAL_VALUE;
        case ReverserPosition::Reverse: return REVERSER_REVERSE_VALUE;
    }
    return REVERSER_NEUTRAL_VALUE;
}

bool ReverserSwitch::apply_three_way(bool forward_active, bool neutral_active, bool reverse_active) {
    if (forward_active) return move_to(ReverserPosition::Forward);
    if (neutral_active) return move_to(ReverserPosition::Neutral);
    if (reverse_active) return move_to(ReverserPosition::Reverse);
    return false;
}

bool ReverserSwitch::apply_two_way(bool forward_active, bool reverse_active) {
    if (forward_active && reverse_active) return false;
    if (forward_active) return move_to(ReverserPosition::Forward);
    if (reverse_active) return move_to(ReverserPosition::Reverse);
    return move_to(ReverserPosition::Neutral);
}

bool ReverserSwitch::move_to(ReverserPosition next) {
    if (next == current) return false;
    DEBUG_LOG("[reverser] %s -> %s\n", position_name(current), position_name(next));
    current = next;
    return true;
}
