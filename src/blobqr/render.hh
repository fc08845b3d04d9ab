// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "lib/native/wrap/qrcode.hh"
#include "lib/native/wrap/image.hh"
#include "canvas.hh"
#include "color.hh"
#include "logo.hh"

namespace BQ {

struct bq_RenderConfig {
    int box_size = 1;
    int border_size = 4;

    bq_Color fill_color = bq_Black;
    bq_Color back_color = bq_White;
    bq_Color eye_color = bq_Black;

    double module_radius_ratio = 0.5;
};

enum class bq_CornerStyle {
    Sharp,
    Rounded
};

bq_CornerStyle bq_GetCornerStyle(const qr_Matrix &matrix, int row, int col, bq_Corner corner);
int bq_ComputeModuleRadius(int box_size, double ratio);

// Clear every module overlapped (even partially) by the pixel rectangle,
// returns the number of modules that were active
Size bq_ClearLogoArea(qr_Matrix *matrix, const bq_RenderConfig &config,
                      int left, int top, int right, int bottom);

void bq_DrawModules(const qr_Matrix &matrix, const bq_RenderConfig &config, bq_Canvas *out_canvas);

bool bq_BuildEyeGlyph(const bq_RenderConfig &config, bq_Canvas *out_glyph);
void bq_DrawEyes(const bq_Canvas &glyph, const bq_RenderConfig &config, bq_Canvas *out_canvas);

bool bq_ComposeLogo(const bq_LogoSpec &logo, const bq_RenderConfig &config, bq_Canvas *out_canvas);

struct bq_RenderRequest {
    Span<const char> payload = {};
    int size = 2048;
    int supersample = 4;

    int version = 6;
    qr_ErrorCorrection ecc = qr_ErrorCorrection::High;
    int border = 4;

    const char *fill_color = "black";
    const char *eye_color = "black";
    const char *back_color = "white";
    double module_radius = 0.5;

    // Null or empty to render without logo
    const char *logo_filename = "logo.png";
    int logo_aspect[2] = { 1, 1 };
    int logo_padding = 2;
};

enum class bq_RenderResult {
    Success,
    InvalidColor,
    LogoNotFound,
    LogoDecodeError,
    InvalidPayload,
    PayloadTooLarge,
    UnknownVersion,
    InvalidSettings,
    OutputWriteError
};

struct bq_RenderInfo {
    int modules = 0;
    int box_size = 0;
    int canvas_size = 0;
    int trimmed_size = 0;
    int final_size = 0;

    Size cleared_modules = 0;
    bool canvas_allocated = false;
};

static const int bq_MaxSupersample = 16;
static const int bq_MaxBorder = 64;

bq_RenderResult bq_Render(const bq_RenderRequest &request, img_Image *out_image,
                          bq_RenderInfo *out_info = nullptr);
bq_RenderResult bq_RenderToFile(const bq_RenderRequest &request, const char *filename,
                                bq_RenderInfo *out_info = nullptr);

}
