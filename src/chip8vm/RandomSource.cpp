//
// Created by the chip8vm authors on 19.10.26.
//

#include "RandomSource.h"

using namespace chip8vm;
using namespace chip8vm::core;

DefaultRandomSource::DefaultRandomSource() : engine(std::random_device{}()), uniformDist(0, 255) {

}

DefaultRandomSource::DefaultRandomSource(uint32_t seed) : engine(seed), uniformDist(0, 255) {

}

RandomSource::Ref DefaultRandomSource::Create() {
    return std::make_shared<DefaultRandomSource>();
}

RandomSource::Ref DefaultRandomSource::Create(uint32_t seed) {
    return std::make_shared<DefaultRandomSource>(seed);
}

uint8_t DefaultRandomSource::NextByte() {
    return static_cast<uint8_t>(uniformDist(engine));
}
