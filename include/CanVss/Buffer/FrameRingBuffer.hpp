#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "CanVss/Core/CANKernelTypes.hpp"

namespace CanVss {

    struct RingEntry {
        uint64_t sequence = 0;
        CANTime timestamp;
        CANFrame frame;
    };

    // Bounded history of received frames, oldest evicted first. Every call is
    // safe against a transport thread pushing concurrently.
    class FrameRingBuffer {
        mutable std::mutex _mtx;
        std::vector<RingEntry> _entries;
        size_t _head = 0;   // oldest entry
        size_t _count = 0;
        uint64_t _next_sequence = 0;
        bool _active = true;
        std::function<void()> _detach;

        // i-th entry in arrival order; caller holds _mtx
        const RingEntry& at(size_t i) const {
            return _entries[(_head + i) % _entries.size()];
        }

    public:
        // Throws std::invalid_argument for a zero capacity.
        explicit FrameRingBuffer(size_t capacity);

        FrameRingBuffer(const FrameRingBuffer&) = delete;
        FrameRingBuffer& operator=(const FrameRingBuffer&) = delete;

        // false once shut down
        bool push(const CANFrame& frame);

        std::optional<CANFrame> get_latest(canid_t id) const;
        std::vector<CANFrame> snapshot() const;
        std::vector<CANFrame> frames_with_id(canid_t id) const;
        std::vector<RingEntry> entries() const;

        size_t size() const;
        size_t capacity() const { return _entries.size(); }
        uint64_t total_pushed() const;
        bool is_active() const;
        void clear();

        void receive_frame(const CANFrame& frame) {
            push(frame);
        }

        // Called once by shutdown() to detach from the transport.
        void on_shutdown(std::function<void()> detach);

        // For a transport notifier thread.
        std::function<void(const CANFrame&)> delivery_callback() {
            return [this](const CANFrame& frame) { push(frame); };
        }

        // One-way and idempotent.
        void shutdown();
    };

}
