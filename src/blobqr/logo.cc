// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "logo.hh"

#include <math.h>

namespace BQ {

bool bq_FitLogo(const img_Image &src, int box_width, int box_height, img_Image *out_image)
{
    BQ_ASSERT(&src != out_image);
    BQ_ASSERT(src.width > 0 && src.height > 0);

    if (box_width <= 0 || box_height <= 0) [[unlikely]] {
        LogError("Invalid logo box %1x%2", box_width, box_height);
        return false;
    }

    double src_ratio = (double)src.width / src.height;
    double box_ratio = (double)box_width / box_height;

    int crop_width;
    int crop_height;
    if (src_ratio > box_ratio) {
        crop_height = src.height;
        crop_width = std::clamp((int)lround(src.height * box_ratio), 1, src.width);
    } else {
        crop_width = src.width;
        crop_height = std::clamp((int)lround(src.width / box_ratio), 1, src.height);
    }

    int crop_left = (src.width - crop_width) / 2;
    int crop_top = (src.height - crop_height) / 2;

    img_Image cropped;
    if (!img_Crop(src, crop_left, crop_top, crop_width, crop_height, &cropped))
        return false;

    if (crop_width == box_width && crop_height == box_height) {
        *out_image = std::move(cropped);
        return true;
    }

    return img_Resize(cropped, box_width, box_height, out_image);
}

void bq_ComputeThumbnailSize(int width, int height, int max_size, int *out_width, int *out_height)
{
    BQ_ASSERT(max_size > 0);

    if (width <= max_size && height <= max_size) {
        *out_width = width;
        *out_height = height;
    } else if (width >= height) {
        *out_width = max_size;
        *out_height = std::max(1, (int)lround((double)height * max_size / width));
    } else {
        *out_width = std::max(1, (int)lround((double)width * max_size / height));
        *out_height = max_size;
    }
}

bool bq_ThumbnailLogo(const img_Image &src, int max_size, img_Image *out_image)
{
    BQ_ASSERT(&src != out_image);

    if (max_size <= 0) [[unlikely]] {
        LogError("Canvas is too small to hold a logo");
        return false;
    }

    int width;
    int height;
    bq_ComputeThumbnailSize(src.width, src.height, max_size, &width, &height);

    if (width == src.width && height == src.height) {
        *out_image = src;
        return true;
    }

    return img_Resize(src, width, height, out_image);
}

bool bq_NormalizeLogo(const img_Image &src, int aspect_width, int aspect_height, int max_size,
                      img_Image *out_image)
{
    BQ_ASSERT(aspect_width > 0 && aspect_height > 0);

    // Largest box with the requested aspect ratio that the source covers at scale 1
    int box_width;
    int box_height;
    if ((int64_t)src.width * aspect_height > (int64_t)src.height * aspect_width) {
        box_height = src.height;
        box_width = std::max(1, (int)lround((double)src.height * aspect_width / aspect_height));
    } else {
        box_width = src.width;
        box_height = std::max(1, (int)lround((double)src.width * aspect_height / aspect_width));
    }

    img_Image fitted;
    if (!bq_FitLogo(src, box_width, box_height, &fitted))
        return false;
    if (!bq_ThumbnailLogo(fitted, max_size, out_image))
        return false;

    return true;
}

void bq_PlaceLogo(int canvas_width, int canvas_height, bq_LogoSpec *out_logo)
{
    const img_Image &image = out_logo->image;

    out_logo->patch_left = (canvas_width - image.width) / 2;
    out_logo->patch_top = (canvas_height - image.height) / 2;
    out_logo->patch_right = out_logo->patch_left + image.width;
    out_logo->patch_bottom = out_logo->patch_top + image.height;
}

}
