//
// Created by the chip8vm authors on 19.10.26.
//

#include "Framebuffer.h"

using namespace chip8vm;
using namespace chip8vm::core;

void Framebuffer::Clear() {
    pixels.fill(false);
    dirty = true;
}

bool Framebuffer::GetPixel(int x, int y) const {
    if ((x < 0) || (x >= kWidth) || (y < 0) || (y >= kHeight)) {
        return false;
    }
    return pixels[IndexOf(x, y)];
}

bool Framebuffer::XorPixel(int x, int y) {
    // Width and height are powers of two - masking takes care of the wrap, also for negative numbers
    x &= (kWidth - 1);
    y &= (kHeight - 1);

    auto &pixel = pixels[IndexOf(x, y)];
    bool wasSet = pixel;
    pixel = !pixel;
    dirty = true;

    return wasSet;
}

size_t Framebuffer::CountSetPixels() const {
    size_t count = 0;
    for(auto p : pixels) {
        if (p) {
            count++;
        }
    }
    return count;
}
