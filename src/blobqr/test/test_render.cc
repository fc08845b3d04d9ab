// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "../render.hh"

namespace BQ {

static const bq_Color Red = { 255, 0, 0, 255 };
static const bq_Color Blue = { 0, 0, 255, 255 };

static bq_RenderRequest MakeRequest(const char *payload)
{
    bq_RenderRequest request = {};

    request.payload = payload;
    request.logo_filename = nullptr;

    return request;
}

static bq_Color GetImagePixel(const img_Image &image, int x, int y)
{
    const uint8_t *ptr = image.GetPixel(x, y);
    bq_Color color = { ptr[0], ptr[1], ptr[2], image.HasAlpha() ? ptr[3] : (uint8_t)255 };
    return color;
}

TEST_FUNCTION("render/CornerStyle")
{
    // Isolated module
    {
        qr_Matrix matrix(3, [](int x, int y) { return x == 1 && y == 1; });

        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::TopLeft) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::TopRight) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::BottomLeft) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::BottomRight) == bq_CornerStyle::Rounded);
    }

    // 2x2 block: outer corners rounded, inner junctions sharp
    {
        qr_Matrix matrix(4, [](int x, int y) { return x >= 1 && x <= 2 && y >= 1 && y <= 2; });

        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::TopLeft) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::TopRight) == bq_CornerStyle::Sharp);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::BottomLeft) == bq_CornerStyle::Sharp);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::BottomRight) == bq_CornerStyle::Sharp);

        TEST(bq_GetCornerStyle(matrix, 1, 2, bq_Corner::TopRight) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 1, 2, bq_Corner::TopLeft) == bq_CornerStyle::Sharp);
        TEST(bq_GetCornerStyle(matrix, 2, 1, bq_Corner::BottomLeft) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 2, 2, bq_Corner::BottomRight) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 2, 2, bq_Corner::TopLeft) == bq_CornerStyle::Sharp);
    }

    // Out-of-matrix neighbors count as inactive
    {
        qr_Matrix matrix(2, [](int, int) { return true; });

        TEST(bq_GetCornerStyle(matrix, 0, 0, bq_Corner::TopLeft) == bq_CornerStyle::Rounded);
        TEST(bq_GetCornerStyle(matrix, 0, 0, bq_Corner::BottomRight) == bq_CornerStyle::Sharp);
        TEST(bq_GetCornerStyle(matrix, 1, 1, bq_Corner::BottomRight) == bq_CornerStyle::Rounded);
    }
}

TEST_FUNCTION("render/ModuleRadius")
{
    TEST_EQ(bq_ComputeModuleRadius(20, 0.5), 10);
    TEST_EQ(bq_ComputeModuleRadius(199, 0.5), 99);
    TEST_EQ(bq_ComputeModuleRadius(20, 0.25), 5);
    TEST_EQ(bq_ComputeModuleRadius(20, 0.0), 0);
    TEST_EQ(bq_ComputeModuleRadius(1, 0.5), 0);
}

TEST_FUNCTION("render/DrawModules")
{
    bq_RenderConfig config = {};
    config.box_size = 20;
    config.border_size = 0;

    // Isolated module gets four round corners
    {
        qr_Matrix matrix(3, [](int x, int y) { return x == 1 && y == 1; });

        bq_Canvas canvas;
        TEST(canvas.Init(60, 60, 3, Red));
        bq_DrawModules(matrix, config, &canvas);

        TEST(canvas.GetPixel(20, 20) == bq_White);
        TEST(canvas.GetPixel(39, 20) == bq_White);
        TEST(canvas.GetPixel(20, 39) == bq_White);
        TEST(canvas.GetPixel(39, 39) == bq_White);
        TEST(canvas.GetPixel(30, 30) == bq_Black);
        TEST(canvas.GetPixel(30, 20) == bq_Black);
        TEST(canvas.GetPixel(20, 30) == bq_Black);

        // Inactive tiles are painted too
        TEST(canvas.GetPixel(5, 5) == bq_White);
        TEST(canvas.GetPixel(59, 59) == bq_White);
    }

    // 2x2 block keeps sharp junctions
    {
        qr_Matrix matrix(4, [](int x, int y) { return x >= 1 && x <= 2 && y >= 1 && y <= 2; });

        bq_Canvas canvas;
        TEST(canvas.Init(80, 80, 3, bq_White));
        bq_DrawModules(matrix, config, &canvas);

        TEST(canvas.GetPixel(20, 20) == bq_White);
        TEST(canvas.GetPixel(59, 20) == bq_White);
        TEST(canvas.GetPixel(20, 59) == bq_White);
        TEST(canvas.GetPixel(59, 59) == bq_White);

        TEST(canvas.GetPixel(39, 39) == bq_Black);
        TEST(canvas.GetPixel(40, 40) == bq_Black);
        TEST(canvas.GetPixel(40, 20) == bq_Black);
        TEST(canvas.GetPixel(39, 20) == bq_Black);
        TEST(canvas.GetPixel(20, 40) == bq_Black);
    }

    // Zero radius draws plain squares
    {
        qr_Matrix matrix(3, [](int x, int y) { return x == 1 && y == 1; });

        config.module_radius_ratio = 0.0;

        bq_Canvas canvas;
        TEST(canvas.Init(60, 60, 3, bq_White));
        bq_DrawModules(matrix, config, &canvas);

        TEST(canvas.GetPixel(20, 20) == bq_Black);
        TEST(canvas.GetPixel(39, 39) == bq_Black);
        TEST(canvas.GetPixel(19, 19) == bq_White);
        TEST(canvas.GetPixel(40, 40) == bq_White);
    }
}

TEST_FUNCTION("render/ClearLogoArea")
{
    bq_RenderConfig config = {};
    config.box_size = 10;
    config.border_size = 4;

    qr_Matrix matrix(21, [](int, int) { return true; });
    Size active = matrix.CountActive();

    // Fully outside the matrix, in the quiet zone or past the canvas
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 0, 0, 30, 30), 0);
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 250, 250, 300, 300), 0);
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 0, 100, 40, 200), 0);
    TEST_EQ(matrix.CountActive(), active);

    // Partial overlap clears every touched module
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 95, 95, 105, 105), 4);
    TEST(!matrix.Test(5, 5));
    TEST(!matrix.Test(6, 6));
    TEST(matrix.Test(7, 7));
    TEST(matrix.Test(4, 4));

    // Already cleared modules are not counted twice
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 100, 100, 120, 120), 3);
    TEST(!matrix.Test(7, 7));
    TEST_EQ(matrix.CountActive(), active - 7);

    // Straddling the matrix edge
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 245, 0, 400, 45), 1);
    TEST(!matrix.Test(20, 0));
}

TEST_FUNCTION("render/ClearedNeighbors")
{
    bq_RenderConfig config = {};
    config.box_size = 20;
    config.border_size = 0;

    // Single horizontal run of five modules
    qr_Matrix matrix(5, [](int, int y) { return y == 2; });

    TEST(bq_GetCornerStyle(matrix, 2, 1, bq_Corner::TopRight) == bq_CornerStyle::Sharp);
    TEST(bq_GetCornerStyle(matrix, 2, 3, bq_Corner::TopLeft) == bq_CornerStyle::Sharp);

    {
        bq_Canvas canvas;
        TEST(canvas.Init(100, 100, 3, Red));
        bq_DrawModules(matrix, config, &canvas);

        TEST(canvas.GetPixel(39, 40) == bq_Black);
        TEST(canvas.GetPixel(60, 40) == bq_Black);
    }

    // Clearing the middle module turns the facing corners round
    TEST_EQ(bq_ClearLogoArea(&matrix, config, 40, 40, 60, 60), 1);
    TEST(!matrix.Test(2, 2));

    TEST(bq_GetCornerStyle(matrix, 2, 1, bq_Corner::TopRight) == bq_CornerStyle::Rounded);
    TEST(bq_GetCornerStyle(matrix, 2, 1, bq_Corner::BottomRight) == bq_CornerStyle::Rounded);
    TEST(bq_GetCornerStyle(matrix, 2, 3, bq_Corner::TopLeft) == bq_CornerStyle::Rounded);
    TEST(bq_GetCornerStyle(matrix, 2, 3, bq_Corner::BottomLeft) == bq_CornerStyle::Rounded);
    TEST(bq_GetCornerStyle(matrix, 2, 0, bq_Corner::TopRight) == bq_CornerStyle::Sharp);

    {
        bq_Canvas canvas;
        TEST(canvas.Init(100, 100, 3, Red));
        bq_DrawModules(matrix, config, &canvas);

        TEST(canvas.GetPixel(39, 40) == config.back_color);
        TEST(canvas.GetPixel(39, 59) == config.back_color);
        TEST(canvas.GetPixel(60, 40) == config.back_color);
        TEST(canvas.GetPixel(60, 59) == config.back_color);
        TEST(canvas.GetPixel(50, 50) == config.back_color);
        TEST(canvas.GetPixel(40, 50) == config.back_color);

        // Module bodies and untouched junctions
        TEST(canvas.GetPixel(30, 50) == config.fill_color);
        TEST(canvas.GetPixel(70, 50) == config.fill_color);
        TEST(canvas.GetPixel(19, 40) == config.fill_color);
        TEST(canvas.GetPixel(20, 40) == config.fill_color);
    }
}

TEST_FUNCTION("render/EyeGlyph")
{
    bq_RenderRequest request = MakeRequest("https://example.com");
    request.size = 300;
    request.supersample = 1;

    img_Image image1;
    img_Image image2;
    bq_RenderInfo info;

    TEST(bq_Render(request, &image1, &info) == bq_RenderResult::Success);
    TEST(bq_Render(request, &image2) == bq_RenderResult::Success);

    TEST_EQ(info.box_size, 6);
    TEST_EQ(info.final_size, 294);
    if (info.final_size != 294)
        return;

    // Same inputs give the same pixels
    TEST(image1.pixels.len == image2.pixels.len &&
         !memcmp(image1.pixels.ptr, image2.pixels.ptr, (size_t)image1.pixels.len));

    bq_RenderConfig config = {};
    config.box_size = info.box_size;
    config.border_size = request.border;

    bq_Canvas glyph;
    TEST(bq_BuildEyeGlyph(config, &glyph));
    TEST_EQ(glyph.GetWidth(), 42);

    bq_Canvas canvas;
    canvas.image = std::move(image1);

    int border = 24;
    int eye = 42;

    TEST(canvas.Compare(glyph, border, border, eye, eye, 0, 0));
    TEST(canvas.Compare(glyph, 294 - border - eye, border, eye, eye, 0, 0));
    TEST(canvas.Compare(glyph, border, 294 - border - eye, eye, eye, 0, 0));
    TEST(!canvas.Compare(glyph, 294 - border - eye, 294 - border - eye, eye, eye, 0, 0));

    // Glyph layers: ring, gap, pupil
    TEST(glyph.GetPixel(21, 1) == bq_Black);
    TEST(glyph.GetPixel(21, 7) == bq_White);
    TEST(glyph.GetPixel(21, 21) == bq_Black);
    TEST(glyph.GetPixel(0, 0) == bq_White);
}

TEST_FUNCTION("render/Colors")
{
    bq_RenderRequest request = MakeRequest("https://example.com");
    request.size = 300;
    request.supersample = 1;
    request.fill_color = "red";
    request.eye_color = "#0000FF";

    img_Image image;
    TEST(bq_Render(request, &image) == bq_RenderResult::Success);
    if (image.width != 294)
        return;

    // Eye ring and pupil
    TEST(GetImagePixel(image, 24 + 21, 24 + 1) == Blue);
    TEST(GetImagePixel(image, 24 + 21, 24 + 21) == Red);
    TEST(GetImagePixel(image, 294 - 24 - 21, 24 + 1) == Blue);
    TEST(GetImagePixel(image, 24 + 1, 294 - 24 - 21) == Blue);

    // Timing pattern module (row 6, column 8) is always dark
    TEST(GetImagePixel(image, (8 + 4) * 6 + 3, (6 + 4) * 6 + 3) == Red);

    // Quiet zone
    TEST(GetImagePixel(image, 2, 2) == bq_White);
    TEST(GetImagePixel(image, 290, 150) == bq_White);

    TEST_MUTE_LOG();

    request.eye_color = "blurple";
    TEST(bq_Render(request, &image) == bq_RenderResult::InvalidColor);
}

TEST_FUNCTION("render/Supersampling")
{
    static const int settings[][3] = {
        // Size, factor, border
        { 300, 1, 4 },
        { 300, 2, 4 },
        { 333, 3, 2 },
        { 100, 4, 0 },
        { 10, 4, 4 }
    };

    for (const auto &setting: settings) {
        bq_RenderRequest request = MakeRequest("blobqr");
        request.size = setting[0];
        request.supersample = setting[1];
        request.border = setting[2];

        img_Image image;
        bq_RenderInfo info;

        TEST(bq_Render(request, &image, &info) == bq_RenderResult::Success);

        int total = 41 + 2 * setting[2];
        int box = std::max(1, setting[0] * setting[1] / total);

        TEST_EQ(info.box_size, box);
        TEST_EQ(info.canvas_size, total * box);
        TEST_EQ(info.trimmed_size % setting[1], 0);
        TEST_EQ(info.trimmed_size, info.canvas_size / setting[1] * setting[1]);
        TEST_EQ(info.final_size, info.canvas_size / setting[1]);
        TEST_EQ(image.width, info.final_size);
        TEST_EQ(image.height, info.final_size);
    }
}

TEST_FUNCTION("render/ExampleFile")
{
    BlockAllocator temp_alloc;

    const char *filename = CreateUniqueFile(GetTemporaryDirectory(), "blobqr", ".png", &temp_alloc);
    TEST(filename);
    if (!filename)
        return;
    BQ_DEFER { UnlinkFile(filename); };

    bq_RenderRequest request = MakeRequest("https://example.com");
    request.version = 6;
    request.border = 0;
    request.size = 2048;
    request.supersample = 4;

    bq_RenderInfo info;
    TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::Success);

    TEST_EQ(info.modules, 41);
    TEST_EQ(info.box_size, 199);
    TEST_EQ(info.canvas_size, 8159);
    TEST_EQ(info.trimmed_size, 8156);
    TEST_EQ(info.final_size, 2039);

    img_Image image;
    TEST(img_LoadFile(filename, &image) == img_LoadResult::Success);
    TEST_EQ(image.width, 2039);
    TEST_EQ(image.height, 2039);
}

TEST_FUNCTION("render/Errors")
{
    BlockAllocator temp_alloc;

    TEST_MUTE_LOG();

    const char *filename = CreateUniqueFile(GetTemporaryDirectory(), "blobqr", ".png", &temp_alloc);
    TEST(filename);
    if (!filename)
        return;
    UnlinkFile(filename);
    BQ_DEFER { UnlinkFile(filename); };

    // Payload too large for version 6 at level H
    {
        char payload[201];
        memset(payload, 'a', 200);
        payload[200] = 0;

        bq_RenderRequest request = MakeRequest(payload);
        bq_RenderInfo info;

        TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::PayloadTooLarge);
        TEST(!info.canvas_allocated);
        TEST(!TestFile(filename));

        // Fits once the level is lowered and the version raised
        request.ecc = qr_ErrorCorrection::Low;
        request.version = 10;
        request.size = 100;
        request.supersample = 1;
        TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::Success);
        TEST(TestFile(filename));
        UnlinkFile(filename);
    }

    // NUL bytes cannot be encoded, whatever the capacity
    {
        HeapArray<char> last_error;
        PushLogFilter([&](LogLevel level, const char *, const char *msg, FunctionRef<LogFunc>) {
            if (level == LogLevel::Error) {
                last_error.RemoveFrom(0);
                last_error.Append(Span<const char>(msg));
            }
        });
        BQ_DEFER { PopLogFilter(); };

        bq_RenderRequest request = MakeRequest("https://example.com");
        request.payload = Span<const char>("ab\0cd", 5);
        request.ecc = qr_ErrorCorrection::Low;
        request.version = 40;

        bq_RenderInfo info;
        TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::InvalidPayload);
        TEST(!info.canvas_allocated);
        TEST(!TestFile(filename));

        Span<const char> msg = last_error;
        TEST_EX(TestStr(msg, "Cannot encode text containing NUL bytes"), "Unexpected error '%1'", msg);

        qr_Matrix matrix;
        TEST(qr_EncodeText(request.payload, 40, qr_ErrorCorrection::Low, &matrix) == qr_EncodeResult::InvalidText);
        TEST(!matrix.IsValid());
    }

    // Missing logo
    {
        bq_RenderRequest request = MakeRequest("https://example.com");
        request.logo_filename = "/nonexistent/blobqr/logo.png";

        bq_RenderInfo info;
        TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::LogoNotFound);
        TEST(!info.canvas_allocated);
        TEST(!TestFile(filename));
    }

    // Unreadable logo
    {
        const char *logo_filename = CreateUniqueFile(GetTemporaryDirectory(), "blobqr", ".png", &temp_alloc);
        TEST(logo_filename);
        if (logo_filename) {
            BQ_DEFER { UnlinkFile(logo_filename); };
            TEST(WriteFile(Span<const char>("not a PNG file"), logo_filename, 0));

            bq_RenderRequest request = MakeRequest("https://example.com");
            request.logo_filename = logo_filename;

            bq_RenderInfo info;
            TEST(bq_RenderToFile(request, filename, &info) == bq_RenderResult::LogoDecodeError);
            TEST(!info.canvas_allocated);
        }
    }

    // Version and settings
    {
        bq_RenderRequest request = MakeRequest("https://example.com");
        img_Image image;

        request.version = 0;
        TEST(bq_Render(request, &image) == bq_RenderResult::UnknownVersion);
        request.version = 41;
        TEST(bq_Render(request, &image) == bq_RenderResult::UnknownVersion);
        request.version = 6;

        request.size = 0;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
        request.size = 2048;

        request.supersample = 0;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
        request.supersample = 4;

        request.border = -1;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
        request.border = 4;

        request.module_radius = 0.6;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
        request.module_radius = -0.1;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
        request.module_radius = 0.5;

        // Canvas over the pixel limit
        request.size = 20000;
        request.supersample = 8;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
    }

    // Unwritable output
    {
        bq_RenderRequest request = MakeRequest("https://example.com");
        request.size = 100;
        request.supersample = 1;

        const char *output = Fmt(&temp_alloc, "%1/blobqr_missing_dir/out.png", GetTemporaryDirectory()).ptr;
        TEST(bq_RenderToFile(request, output, nullptr) == bq_RenderResult::OutputWriteError);
    }
}

TEST_FUNCTION("render/Logo")
{
    BlockAllocator temp_alloc;

    const char *logo_filename = CreateUniqueFile(GetTemporaryDirectory(), "blobqr", ".png", &temp_alloc);
    TEST(logo_filename);
    if (!logo_filename)
        return;
    BQ_DEFER { UnlinkFile(logo_filename); };

    bq_RenderRequest request = MakeRequest("https://example.com");
    request.size = 300;
    request.supersample = 1;
    request.logo_filename = logo_filename;

    // Opaque logo, wider than the square box
    {
        bq_Canvas logo;
        TEST(logo.Init(100, 50, 3, Red));
        TEST(img_SavePng(logo.image, logo_filename));

        img_Image image;
        bq_RenderInfo info;
        TEST(bq_Render(request, &image, &info) == bq_RenderResult::Success);
        TEST_GT(info.cleared_modules, 0);

        // Canvas 294, logo cropped to 50x50 and centered at 122
        if (image.width == 294) {
            TEST(GetImagePixel(image, 147, 147) == Red);
            TEST(GetImagePixel(image, 122, 122) == Red);
            TEST(GetImagePixel(image, 171, 171) == Red);
            TEST(GetImagePixel(image, 121, 147) != Red);
            TEST(GetImagePixel(image, 172, 147) != Red);
        }
    }

    // Transparent logo leaves the background patch visible
    {
        bq_Canvas logo;
        TEST(logo.Init(40, 40, 4, bq_Transparent));
        TEST(img_SavePng(logo.image, logo_filename));

        img_Image image;
        TEST(bq_Render(request, &image) == bq_RenderResult::Success);

        if (image.width == 294) {
            TEST(GetImagePixel(image, 147, 147) == bq_White);
            TEST(GetImagePixel(image, 130, 130) == bq_White);
            TEST(GetImagePixel(image, 163, 163) == bq_White);
        }
    }

    // Logo does not fit
    {
        TEST_MUTE_LOG();

        request.size = 21;
        request.border = 0;
        request.logo_padding = 10;

        img_Image image;
        TEST(bq_Render(request, &image) == bq_RenderResult::InvalidSettings);
    }
}

}
