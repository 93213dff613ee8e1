#include <chrono>
#include <stdexcept>

#include "CanVss/Buffer/FrameRingBuffer.hpp"
#include "CanVss/Core/Logging.hpp"

namespace CanVss {

    FrameRingBuffer::FrameRingBuffer(size_t capacity) {
        if (capacity == 0)
            throw std::invalid_argument("FrameRingBuffer capacity must be positive");
        _entries.resize(capacity);
    }

    bool FrameRingBuffer::push(const CANFrame& frame) {
        auto now = std::chrono::system_clock::now();

        std::lock_guard lock(_mtx);
        if (!_active)
            return false;

        size_t slot;
        if (_count < _entries.size()) {
            slot = (_head + _count) % _entries.size();
            ++_count;
        }
        else {
            slot = _head;
            _head = (_head + 1) % _entries.size();
        }

        _entries[slot] = RingEntry{ _next_sequence++, now, frame };
        return true;
    }

    std::optional<CANFrame> FrameRingBuffer::get_latest(canid_t id) const {
        std::lock_guard lock(_mtx);
        for (size_t i = _count; i-- > 0;) {
            const auto& entry = at(i);
            if (frame_id(entry.frame) == id)
                return entry.frame;
        }
        return std::nullopt;
    }

    std::vector<CANFrame> FrameRingBuffer::snapshot() const {
        std::lock_guard lock(_mtx);
        std::vector<CANFrame> frames;
        frames.reserve(_count);
        for (size_t i = 0; i < _count; ++i)
            frames.push_back(at(i).frame);
        return frames;
    }

    std::vector<CANFrame> FrameRingBuffer::frames_with_id(canid_t id) const {
        std::lock_guard lock(_mtx);
        std::vector<CANFrame> frames;
        for (size_t i = 0; i < _count; ++i) {
            if (frame_id(at(i).frame) == id)
                frames.push_back(at(i).frame);
        }
        return frames;
    }

    std::vector<RingEntry> FrameRingBuffer::entries() const {
        std::lock_guard lock(_mtx);
        std::vector<RingEntry> out;
        out.reserve(_count);
        for (size_t i = 0; i < _count; ++i)
            out.push_back(at(i));
        return out;
    }

    size_t FrameRingBuffer::size() const {
        std::lock_guard lock(_mtx);
        return _count;
    }

    uint64_t FrameRingBuffer::total_pushed() const {
        std::lock_guard lock(_mtx);
        return _next_sequence;
    }

    bool FrameRingBuffer::is_active() const {
        std::lock_guard lock(_mtx);
        return _active;
    }

    void FrameRingBuffer::clear() {
        std::lock_guard lock(_mtx);
        _head = 0;
        _count = 0;
    }

    void FrameRingBuffer::on_shutdown(std::function<void()> detach) {
        std::lock_guard lock(_mtx);
        _detach = std::move(detach);
    }

    void FrameRingBuffer::shutdown() {
        std::function<void()> detach;
        {
            std::lock_guard lock(_mtx);
            if (!_active)
                return;
            _active = false;
            detach = std::move(_detach);
            _detach = nullptr;
        }

        if (detach)
            detach();
        CANVSS_LOG(debug) << "Frame buffer shut down after " << total_pushed() << " frames";
    }

}
