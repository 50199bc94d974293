//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_RANDOMSOURCE_H
#define CHIP8VM_RANDOMSOURCE_H

#include <stdint.h>
#include <memory>
#include <random>

namespace chip8vm {
    namespace core {
        // Random byte provider for the 'rnd' instruction, replace it to get deterministic runs
        class RandomSource {
        public:
            using Ref = std::shared_ptr<RandomSource>;
        public:
            RandomSource() = default;
            virtual ~RandomSource() = default;

            virtual uint8_t NextByte() = 0;
        };

        class DefaultRandomSource : public RandomSource {
        public:
            DefaultRandomSource();
            explicit DefaultRandomSource(uint32_t seed);
            virtual ~DefaultRandomSource() = default;

            // Seeded from std::random_device
            static RandomSource::Ref Create();
            // Fixed seed, same sequence every time
            static RandomSource::Ref Create(uint32_t seed);

            uint8_t NextByte() override;
        private:
            std::default_random_engine engine;
            std::uniform_int_distribution<int> uniformDist;
        };
    }
}

#endif //CHIP8VM_RANDOMSOURCE_H
