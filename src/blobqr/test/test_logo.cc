// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "../canvas.hh"
#include "../logo.hh"

namespace BQ {

// Red band of band_width pixels in the middle, green on both sides
static void MakeBandImage(int width, int height, int band_width, img_Image *out_image)
{
    bq_Canvas canvas;
    bool success = canvas.Init(width, height, 4, { 0, 255, 0, 255 });
    BQ_ASSERT(success);

    int left = (width - band_width) / 2;
    canvas.FillRect(left, 0, left + band_width, height, { 255, 0, 0, 255 });

    std::swap(*out_image, canvas.image);
}

TEST_FUNCTION("logo/ThumbnailSize")
{
    int width;
    int height;

    bq_ComputeThumbnailSize(100, 50, 40, &width, &height);
    TEST_EQ(width, 40);
    TEST_EQ(height, 20);

    bq_ComputeThumbnailSize(50, 100, 40, &width, &height);
    TEST_EQ(width, 20);
    TEST_EQ(height, 40);

    bq_ComputeThumbnailSize(300, 200, 100, &width, &height);
    TEST_EQ(width, 100);
    TEST_EQ(height, 67);

    // Never enlarge
    bq_ComputeThumbnailSize(30, 20, 40, &width, &height);
    TEST_EQ(width, 30);
    TEST_EQ(height, 20);

    // Short side keeps at least one pixel
    bq_ComputeThumbnailSize(1000, 1, 10, &width, &height);
    TEST_EQ(width, 10);
    TEST_EQ(height, 1);
}

TEST_FUNCTION("logo/FitCrop")
{
    img_Image src;
    MakeBandImage(100, 50, 50, &src);

    // Cover crop keeps the centered square, which is the red band
    {
        img_Image fitted;
        TEST(bq_FitLogo(src, 50, 50, &fitted));
        TEST_EQ(fitted.width, 50);
        TEST_EQ(fitted.height, 50);

        bool all_red = true;
        for (int y = 0; y < fitted.height; y++) {
            for (int x = 0; x < fitted.width; x++) {
                const uint8_t *ptr = fitted.GetPixel(x, y);
                all_red &= (ptr[0] == 255 && ptr[1] == 0 && ptr[2] == 0 && ptr[3] == 255);
            }
        }
        TEST(all_red);
    }

    // Exact box size, whatever the source aspect
    {
        img_Image fitted;

        TEST(bq_FitLogo(src, 40, 40, &fitted));
        TEST_EQ(fitted.width, 40);
        TEST_EQ(fitted.height, 40);

        TEST(bq_FitLogo(src, 30, 90, &fitted));
        TEST_EQ(fitted.width, 30);
        TEST_EQ(fitted.height, 90);
        TEST_EQ(fitted.channels, 4);
    }
}

TEST_FUNCTION("logo/Normalize")
{
    img_Image src;
    MakeBandImage(100, 50, 20, &src);

    img_Image logo;

    TEST(bq_NormalizeLogo(src, 1, 1, 30, &logo));
    TEST_EQ(logo.width, 30);
    TEST_EQ(logo.height, 30);

    TEST(bq_NormalizeLogo(src, 2, 1, 30, &logo));
    TEST_EQ(logo.width, 30);
    TEST_EQ(logo.height, 15);

    TEST(bq_NormalizeLogo(src, 1, 2, 30, &logo));
    TEST_EQ(logo.width, 15);
    TEST_EQ(logo.height, 30);

    // Crop without enlarging
    TEST(bq_NormalizeLogo(src, 1, 1, 500, &logo));
    TEST_EQ(logo.width, 50);
    TEST_EQ(logo.height, 50);

    TEST_MUTE_LOG();
    TEST(!bq_NormalizeLogo(src, 1, 1, 0, &logo));
}

TEST_FUNCTION("logo/Placement")
{
    static const int sizes[][3] = {
        { 294, 50, 50 },
        { 294, 65, 40 },
        { 8159, 2035, 2035 },
        { 101, 1, 2 },
        { 100, 33, 34 }
    };

    for (const auto &size: sizes) {
        bq_LogoSpec logo;
        logo.image.width = size[1];
        logo.image.height = size[2];

        bq_PlaceLogo(size[0], size[0], &logo);

        TEST_EQ(logo.patch_right - logo.patch_left, size[1]);
        TEST_EQ(logo.patch_bottom - logo.patch_top, size[2]);
        TEST_LT(std::abs(logo.patch_left + logo.patch_right - size[0]), 2);
        TEST_LT(std::abs(logo.patch_top + logo.patch_bottom - size[0]), 2);
    }
}

}
