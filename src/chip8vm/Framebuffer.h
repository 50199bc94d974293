//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_FRAMEBUFFER_H
#define CHIP8VM_FRAMEBUFFER_H

#include <stdint.h>
#include <stddef.h>
#include <array>

namespace chip8vm {
    namespace core {
        // 64x32 monochrome display, row-major, one bool per pixel
        class Framebuffer {
        public:
            static constexpr int kWidth = 64;
            static constexpr int kHeight = 32;
            static constexpr size_t kNumPixels = kWidth * kHeight;
        public:
            Framebuffer() = default;
            virtual ~Framebuffer() = default;

            void Clear();

            // Returns false for coordinates outside the display
            bool GetPixel(int x, int y) const;

            // XOR a pixel on, coordinates wrap around both axes
            // Returns
            //   true - the pixel was on and got turned off (collision)
            //   false - otherwise
            bool XorPixel(int x, int y);

            // Number of pixels currently on
            size_t CountSetPixels() const;

            // The dirty flag is set by any change, the consumer clears it after rendering
            bool IsDirty() const {
                return dirty;
            }
            void ClearDirty() {
                dirty = false;
            }

            const std::array<bool, kNumPixels> &GetPixels() const {
                return pixels;
            }
        protected:
            static size_t IndexOf(int x, int y) {
                return static_cast<size_t>(y * kWidth + x);
            }
        private:
            std::array<bool, kNumPixels> pixels = {};
            bool dirty = false;
        };
    }
}

#endif //CHIP8VM_FRAMEBUFFER_H
