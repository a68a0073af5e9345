#include "command_queue.hpp"
#include <algorithm>

void CommandQueue::push(uint16_t function_id, int value) {
    std::lock_guard<std::mutex> lock(mutex);
    pending[function_id] = static_cast<uint8_t>(std::clamp(value, 0, 255));
}

std::vector<std::pair<uint16_t, uint8_t>> CommandQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::pair<uint16_t, uint8_t>> out(pending.begin(), pending.end());
    pending.clear();
    return out;
}

std::optional<uint8_t> CommandQueue::peek(uint16_t function_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = pending.find(function_id);
    if (it == pending.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

void CommandQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    pending.clear();
}
