// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "canvas.hh"

#include <math.h>

namespace BQ {

bool bq_Canvas::Init(int width, int height, int channels, bq_Color color)
{
    if (!img_Allocate(width, height, channels, &image))
        return false;

    FillRect(0, 0, width, height, color);
    return true;
}

bq_Color bq_Canvas::GetPixel(int x, int y) const
{
    BQ_ASSERT(x >= 0 && x < image.width);
    BQ_ASSERT(y >= 0 && y < image.height);

    const uint8_t *ptr = image.GetPixel(x, y);
    bq_Color color = { ptr[0], ptr[1], ptr[2], image.HasAlpha() ? ptr[3] : (uint8_t)255 };

    return color;
}

void bq_Canvas::FillSpan(int y, int left, int right, bq_Color color)
{
    if (y < 0 || y >= image.height)
        return;

    left = std::max(left, 0);
    right = std::min(right, image.width);
    if (left >= right)
        return;

    uint8_t *ptr = image.GetPixel(left, y);

    if (image.HasAlpha()) {
        for (int x = left; x < right; x++, ptr += 4) {
            ptr[0] = color.r;
            ptr[1] = color.g;
            ptr[2] = color.b;
            ptr[3] = color.a;
        }
    } else {
        for (int x = left; x < right; x++, ptr += 3) {
            ptr[0] = color.r;
            ptr[1] = color.g;
            ptr[2] = color.b;
        }
    }
}

void bq_Canvas::FillRect(int left, int top, int right, int bottom, bq_Color color)
{
    top = std::max(top, 0);
    bottom = std::min(bottom, image.height);

    for (int y = top; y < bottom; y++) {
        FillSpan(y, left, right, color);
    }
}

// Number of pixels to skip from the edge of a row at distance dy from the center
// of a corner circle, so that only pixels with their center inside the circle remain
static inline int ComputeCornerInset(int radius, double dy)
{
    if (dy <= 0.0)
        return 0;
    if (dy >= (double)radius)
        return radius;

    double inset = (double)radius - sqrt((double)radius * radius - dy * dy);
    return std::max(0, (int)ceil(inset - 0.5));
}

void bq_Canvas::FillRoundedRect(int left, int top, int right, int bottom, int radius, bq_Color color)
{
    if (right <= left || bottom <= top)
        return;

    radius = std::min(radius, std::min(right - left, bottom - top) / 2);

    if (radius <= 0) {
        FillRect(left, top, right, bottom, color);
        return;
    }

    for (int y = top; y < bottom; y++) {
        double cy = y + 0.5;
        double dy = 0.0;

        if (cy < top + radius) {
            dy = (top + radius) - cy;
        } else if (cy > bottom - radius) {
            dy = cy - (bottom - radius);
        }

        int inset = ComputeCornerInset(radius, dy);
        FillSpan(y, left + inset, right - inset, color);
    }
}

void bq_Canvas::FillQuarterDisc(int cx, int cy, int radius, bq_Corner corner, bq_Color color)
{
    if (radius <= 0)
        return;

    bool left = (corner == bq_Corner::TopLeft || corner == bq_Corner::BottomLeft);
    bool top = (corner == bq_Corner::TopLeft || corner == bq_Corner::TopRight);

    for (int i = 0; i < radius; i++) {
        int y = top ? (cy - 1 - i) : (cy + i);
        double dy = i + 0.5;

        // Keep pixels whose center lies inside the disc, same rule as rounded rectangles
        int len = (int)floor(sqrt((double)radius * radius - dy * dy) + 0.5);

        if (len <= 0)
            continue;

        if (left) {
            FillSpan(y, cx - len, cx, color);
        } else {
            FillSpan(y, cx, cx + len, color);
        }
    }
}

void bq_Canvas::Paste(const img_Image &src, int x, int y)
{
    int x0 = std::max(x, 0);
    int y0 = std::max(y, 0);
    int x1 = std::min(x + src.width, image.width);
    int y1 = std::min(y + src.height, image.height);
    if (x0 >= x1)
        return;

    for (int dy = y0; dy < y1; dy++) {
        const uint8_t *src_ptr = src.GetPixel(x0 - x, dy - y);
        uint8_t *dest_ptr = image.GetPixel(x0, dy);

        if (src.channels == image.channels) {
            MemCpy(dest_ptr, src_ptr, (Size)(x1 - x0) * image.channels);
        } else {
            for (int dx = x0; dx < x1; dx++) {
                dest_ptr[0] = src_ptr[0];
                dest_ptr[1] = src_ptr[1];
                dest_ptr[2] = src_ptr[2];
                if (image.HasAlpha()) {
                    dest_ptr[3] = 255;
                }

                src_ptr += src.channels;
                dest_ptr += image.channels;
            }
        }
    }
}

static inline uint8_t BlendChannel(int src, int dest, int alpha)
{
    int value = src * alpha + dest * (255 - alpha) + 127;
    return (uint8_t)(value / 255);
}

void bq_Canvas::PasteMasked(const img_Image &src, int x, int y)
{
    if (!src.HasAlpha()) {
        Paste(src, x, y);
        return;
    }

    int x0 = std::max(x, 0);
    int y0 = std::max(y, 0);
    int x1 = std::min(x + src.width, image.width);
    int y1 = std::min(y + src.height, image.height);
    if (x0 >= x1)
        return;

    for (int dy = y0; dy < y1; dy++) {
        const uint8_t *src_ptr = src.GetPixel(x0 - x, dy - y);
        uint8_t *dest_ptr = image.GetPixel(x0, dy);

        for (int dx = x0; dx < x1; dx++) {
            int alpha = src_ptr[3];

            if (alpha == 255) {
                dest_ptr[0] = src_ptr[0];
                dest_ptr[1] = src_ptr[1];
                dest_ptr[2] = src_ptr[2];
            } else if (alpha) {
                dest_ptr[0] = BlendChannel(src_ptr[0], dest_ptr[0], alpha);
                dest_ptr[1] = BlendChannel(src_ptr[1], dest_ptr[1], alpha);
                dest_ptr[2] = BlendChannel(src_ptr[2], dest_ptr[2], alpha);
            }
            if (image.HasAlpha()) {
                dest_ptr[3] = (uint8_t)std::max((int)dest_ptr[3], alpha);
            }

            src_ptr += 4;
            dest_ptr += image.channels;
        }
    }
}

bool bq_Canvas::Compare(const bq_Canvas &other, int x, int y, int width, int height, int other_x, int other_y) const
{
    BQ_ASSERT(image.channels == other.image.channels);
    BQ_ASSERT(x >= 0 && y >= 0 && x + width <= image.width && y + height <= image.height);
    BQ_ASSERT(other_x >= 0 && other_y >= 0 &&
              other_x + width <= other.image.width && other_y + height <= other.image.height);

    Size row_len = (Size)width * image.channels;

    for (int i = 0; i < height; i++) {
        const uint8_t *ptr1 = image.GetPixel(x, y + i);
        const uint8_t *ptr2 = other.image.GetPixel(other_x, other_y + i);

        if (memcmp(ptr1, ptr2, (size_t)row_len))
            return false;
    }

    return true;
}

}
