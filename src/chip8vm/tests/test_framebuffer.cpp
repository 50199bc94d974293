//
// Created by the chip8vm authors on 19.10.26.
//
// Framebuffer.h goes first, it must be self-contained
#include "Framebuffer.h"

#include <stdint.h>
#include <testinterface.h>

using namespace chip8vm;
using namespace chip8vm::core;

extern "C" {
    DLL_EXPORT int test_framebuffer(ITesting *t);
    DLL_EXPORT int test_framebuffer_xor(ITesting *t);
    DLL_EXPORT int test_framebuffer_wrap(ITesting *t);
    DLL_EXPORT int test_framebuffer_clear(ITesting *t);
    DLL_EXPORT int test_framebuffer_getpixel(ITesting *t);
}

DLL_EXPORT int test_framebuffer(ITesting *t) {
    return kTR_Pass;
}

DLL_EXPORT int test_framebuffer_xor(ITesting *t) {
    Framebuffer fb;
    TR_ASSERT(t, !fb.IsDirty());
    TR_ASSERT(t, !fb.XorPixel(10, 20));
    TR_ASSERT(t, fb.GetPixel(10, 20));
    TR_ASSERT(t, fb.IsDirty());
    // second xor turns it off and reports it
    TR_ASSERT(t, fb.XorPixel(10, 20));
    TR_ASSERT(t, !fb.GetPixel(10, 20));
    TR_ASSERT(t, fb.CountSetPixels() == 0);
    return kTR_Pass;
}

DLL_EXPORT int test_framebuffer_wrap(ITesting *t) {
    Framebuffer fb;
    fb.XorPixel(64, 32);
    TR_ASSERT(t, fb.GetPixel(0, 0));
    fb.XorPixel(-1, -1);
    TR_ASSERT(t, fb.GetPixel(63, 31));
    fb.XorPixel(70, 33);
    TR_ASSERT(t, fb.GetPixel(6, 1));
    TR_ASSERT(t, fb.CountSetPixels() == 3);
    return kTR_Pass;
}

DLL_EXPORT int test_framebuffer_clear(ITesting *t) {
    Framebuffer fb;
    for(int x=0;x<Framebuffer::kWidth;x++) {
        fb.XorPixel(x, x / 2);
    }
    TR_ASSERT(t, fb.CountSetPixels() == 64);
    fb.ClearDirty();
    fb.Clear();
    TR_ASSERT(t, fb.CountSetPixels() == 0);
    TR_ASSERT(t, fb.IsDirty());
    return kTR_Pass;
}

DLL_EXPORT int test_framebuffer_getpixel(ITesting *t) {
    Framebuffer fb;
    fb.XorPixel(0, 0);
    // reading doesn't wrap
    TR_ASSERT(t, !fb.GetPixel(64, 0));
    TR_ASSERT(t, !fb.GetPixel(0, 32));
    TR_ASSERT(t, !fb.GetPixel(-64, 0));
    TR_ASSERT(t, fb.GetPixels()[0]);
    TR_ASSERT(t, fb.GetPixels().size() == Framebuffer::kNumPixels);
    return kTR_Pass;
}
