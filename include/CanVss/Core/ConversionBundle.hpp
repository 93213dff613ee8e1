#pragma once

#include <functional>
#include <tuple>

#include "CanVss/Core/ConversionConcepts.hpp"
#include "CanVss/Engine/ConversionEngine.hpp"

namespace CanVss {

    // One frame in, many sinks out: the frame is kept by the receiver (usually
    // a FrameRingBuffer), converted, and a non-empty result goes to every sink.
    template <typename Receiver, typename... Sinks>
    requires IsFrameReceivable<Receiver> && (IsSignalSink<Sinks> && ...)
    struct ConversionBundle {
        Receiver& receiver;
        ConversionEngine& engine;
        std::tuple<Sinks&...> sinks;

        ConversionBundle(Receiver& receiver, ConversionEngine& engine, Sinks&... sinks) :
            receiver(receiver),
            engine(engine),
            sinks(sinks...)
        {}

        template <typename Func>
        inline void for_each_sink(Func f) {
            std::apply([&](Sinks&... args) { (f(args), ...); }, sinks);
        }

        void receive_frame(const CANFrame& frame) {
            receiver.receive_frame(frame);

            auto signals = engine.convert(frame);
            if (signals.empty())
                return;

            for_each_sink([&](auto& sink) {
                sink.publish(frame_id(frame), signals);
            });
        }

        std::function<void(const CANFrame&)> delivery_callback() {
            return [this](const CANFrame& frame) { receive_frame(frame); };
        }
    };

}
