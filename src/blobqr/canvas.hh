// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "lib/native/wrap/image.hh"
#include "color.hh"

namespace BQ {

enum class bq_Corner {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

// Pixel rectangles are half-open: left and top are included, right and bottom are not.
// Everything is drawn hard-edged (no coverage computation), pixels are inside a shape
// when their center is.
class bq_Canvas {
public:
    img_Image image;

    bool Init(int width, int height, int channels, bq_Color color);

    int GetWidth() const { return image.width; }
    int GetHeight() const { return image.height; }

    bq_Color GetPixel(int x, int y) const;

    void FillRect(int left, int top, int right, int bottom, bq_Color color);
    void FillRoundedRect(int left, int top, int right, int bottom, int radius, bq_Color color);

    // Quarter disc centered on (cx, cy), drawn in the quadrant named by corner
    // (TopLeft covers [cx - radius, cx) x [cy - radius, cy))
    void FillQuarterDisc(int cx, int cy, int radius, bq_Corner corner, bq_Color color);

    // Straight copy, alpha is ignored or set to opaque depending on the channels
    void Paste(const img_Image &src, int x, int y);

    // Blend src over the canvas with its own alpha channel as the mask, images
    // without alpha are pasted as is
    void PasteMasked(const img_Image &src, int x, int y);

    bool Compare(const bq_Canvas &other, int x, int y, int width, int height, int other_x, int other_y) const;

private:
    void FillSpan(int y, int left, int right, bq_Color color);
};

}
