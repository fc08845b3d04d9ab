// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "lib/native/wrap/image.hh"

namespace BQ {

struct bq_LogoSpec {
    img_Image image;

    // Placement in canvas pixels, right and bottom excluded
    int patch_left = 0;
    int patch_top = 0;
    int patch_right = 0;
    int patch_bottom = 0;
};

// Scale to cover the box then crop the excess around the center, the result is
// exactly box_width x box_height
bool bq_FitLogo(const img_Image &src, int box_width, int box_height, img_Image *out_image);

// Shrink (never enlarge) so that both sides fit in max_size, keeping the aspect ratio
void bq_ComputeThumbnailSize(int width, int height, int max_size, int *out_width, int *out_height);
bool bq_ThumbnailLogo(const img_Image &src, int max_size, img_Image *out_image);

// Crop to the aspect ratio (aspect_width:aspect_height) then shrink to max_size
bool bq_NormalizeLogo(const img_Image &src, int aspect_width, int aspect_height, int max_size,
                      img_Image *out_image);

static inline int bq_ComputeLogoMaxSize(int canvas_height, int padding) { return canvas_height / 4 - padding; }

// Center the normalized logo on the canvas
void bq_PlaceLogo(int canvas_width, int canvas_height, bq_LogoSpec *out_logo);

}
