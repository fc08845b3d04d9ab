// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace BQ {

// 8-bit interleaved pixels, 3 (RGB) or 4 (RGBA) channels, rows are not padded
struct img_Image {
    int width = 0;
    int height = 0;
    int channels = 0;

    HeapArray<uint8_t> pixels;

    Size GetStride() const { return (Size)width * channels; }
    bool HasAlpha() const { return channels == 4; }

    uint8_t *GetPixel(int x, int y) { return pixels.ptr + (Size)y * GetStride() + (Size)x * channels; }
    const uint8_t *GetPixel(int x, int y) const { return pixels.ptr + (Size)y * GetStride() + (Size)x * channels; }
};

// Reject anything bigger, supersampled canvases stay well below this
static const int img_MaxDimension = 32768;

bool img_Allocate(int width, int height, int channels, img_Image *out_image);

enum class img_LoadResult {
    Success,
    MissingFile,
    DecodeError
};

// Decoded images are always RGBA, opaque formats get a solid alpha channel
img_LoadResult img_LoadFile(const char *filename, img_Image *out_image);
bool img_DecodeMemory(Span<const uint8_t> data, const char *name, img_Image *out_image);

bool img_Resize(const img_Image &src, int width, int height, img_Image *out_image);
bool img_Crop(const img_Image &src, int left, int top, int width, int height, img_Image *out_image);

// Drop the pixels right of width and below height, rows are compacted in place
void img_Truncate(img_Image *image, int width, int height);

bool img_EncodePng(const img_Image &image, HeapArray<uint8_t> *out_buf);
bool img_SavePng(const img_Image &image, const char *filename);

}
