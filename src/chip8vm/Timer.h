//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_TIMER_H
#define CHIP8VM_TIMER_H

#include <stdint.h>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace chip8vm {
    namespace core {

        //
        // Fixed frequency tick generator, this is the delay/sound timer driver (60Hz).
        // It doesn't run on its own - the host feeds it time points and it tells how many ticks
        // are due since the last update. Time not covering a full tick carries over to the next update.
        //
        class Timer {
        public:
            using clock = std::chrono::steady_clock;
            using Ref = std::shared_ptr<Timer>;
            using TickDelegate = std::function<void()>;

            static constexpr uint64_t kDefaultFreqHz = 60;
            static constexpr uint64_t kNanosPerSec = 1000 * 1000 * 1000;
        public:
            explicit Timer(uint64_t freqHz);
            virtual ~Timer() = default;

            static Ref Create(uint64_t freqHz = kDefaultFreqHz);

            // Length of one period at 'freqHz', nothing if the period doesn't fit in whole nanoseconds (0 or > 1GHz)
            static std::optional<std::chrono::nanoseconds> PeriodOf(uint64_t freqHz);

            // Called once per tick from 'Update'
            void SetTickHandler(TickDelegate newHandler) {
                cbTick = newHandler;
            }

            // Restart counting from this point in time, the tick counter is cleared
            void Reset(clock::time_point tStart);

            // Returns the number of ticks that elapsed since the last update
            // The first update only sets the starting point
            uint32_t Update(clock::time_point tNow);

            uint64_t GetTickCounter() const {
                return tickCounter;
            }
            uint64_t GetFrequency() const {
                return freqSec;
            }
        private:
            uint64_t freqSec = kDefaultFreqHz;
            uint64_t tickCounter = 0;
            // Accumulated 'nanoseconds * frequency' not yet converted to a tick
            uint64_t accumulated = 0;

            bool bHaveFirstTime = false;
            clock::time_point tLast;
            TickDelegate cbTick = nullptr;
        };
    }
}

#endif //CHIP8VM_TIMER_H
