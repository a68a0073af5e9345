#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Latest value per wire function ID, waiting for the next send tick.
class CommandQueue {
public:
    // Values are clamped to 0..255; a later push for the same ID replaces the earlier one.
    void push(uint16_t function_id, int value);
    std::vector<std::pair<uint16_t, uint8_t>> drain();

    std::optional<uint8_t> peek(uint16_t function_id) const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

private:
    mutable std::mutex mutex;
    std::map<uint16_t, uint8_t> pending;
};
