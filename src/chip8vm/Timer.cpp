//
// Created by the chip8vm authors on 19.10.26.
//

#include <chrono>
#include "Timer.h"

using namespace chip8vm;
using namespace chip8vm::core;

Timer::Timer(uint64_t freqHz) : freqSec(freqHz>0?freqHz:kDefaultFreqHz) {

}

Timer::Ref Timer::Create(uint64_t freqHz) {
    return std::make_shared<Timer>(freqHz);
}

std::optional<std::chrono::nanoseconds> Timer::PeriodOf(uint64_t freqHz) {
    if ((freqHz == 0) || (freqHz > kNanosPerSec)) {
        return {};
    }
    return std::chrono::nanoseconds(kNanosPerSec / freqHz);
}

void Timer::Reset(clock::time_point tStart) {
    tLast = tStart;
    bHaveFirstTime = true;
    accumulated = 0;
    tickCounter = 0;
}

//
// Integer only - we accumulate 'elapsed * freq' and emit a tick for every full second of that,
// this way 60Hz doesn't drift even though a period isn't a whole number of nanoseconds
//
uint32_t Timer::Update(clock::time_point tNow) {
    if (!bHaveFirstTime) {
        Reset(tNow);
        return 0;
    }
    // time going backwards, just resync
    if (tNow < tLast) {
        tLast = tNow;
        return 0;
    }

    auto nanoSeconds = std::chrono::duration_cast<std::chrono::nanoseconds>(tNow - tLast).count();
    tLast = tNow;

    accumulated += static_cast<uint64_t>(nanoSeconds) * freqSec;

    uint32_t nTicks = 0;
    while(accumulated >= kNanosPerSec) {
        accumulated -= kNanosPerSec;
        tickCounter++;
        nTicks++;
        if (cbTick != nullptr) {
            cbTick();
        }
    }
    return nTicks;
}
