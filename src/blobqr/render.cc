// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "render.hh"

#include <math.h>

namespace BQ {

bq_CornerStyle bq_GetCornerStyle(const qr_Matrix &matrix, int row, int col, bq_Corner corner)
{
    int dy = (corner == bq_Corner::TopLeft || corner == bq_Corner::TopRight) ? -1 : 1;
    int dx = (corner == bq_Corner::TopLeft || corner == bq_Corner::BottomLeft) ? -1 : 1;

    bool vertical = matrix.Test(col, row + dy);
    bool horizontal = matrix.Test(col + dx, row);

    return (vertical || horizontal) ? bq_CornerStyle::Sharp : bq_CornerStyle::Rounded;
}

int bq_ComputeModuleRadius(int box_size, double ratio)
{
    int radius = (int)lround(box_size * ratio);
    return std::clamp(radius, 0, box_size / 2);
}

Size bq_ClearLogoArea(qr_Matrix *matrix, const bq_RenderConfig &config,
                      int left, int top, int right, int bottom)
{
    int box = config.box_size;
    int size = matrix->GetSize();

    // Pixels are never negative here, integer division floors
    int col0 = std::max(left, 0) / box - config.border_size;
    int row0 = std::max(top, 0) / box - config.border_size;
    int col1 = (std::max(right, 0) + box - 1) / box - config.border_size;
    int row1 = (std::max(bottom, 0) + box - 1) / box - config.border_size;

    col0 = std::max(col0, 0);
    row0 = std::max(row0, 0);
    col1 = std::min(col1, size);
    row1 = std::min(row1, size);

    Size cleared = 0;
    for (int row = row0; row < row1; row++) {
        for (int col = col0; col < col1; col++) {
            cleared += matrix->Clear(col, row);
        }
    }

    return cleared;
}

void bq_DrawModules(const qr_Matrix &matrix, const bq_RenderConfig &config, bq_Canvas *out_canvas)
{
    int box = config.box_size;
    int radius = bq_ComputeModuleRadius(box, config.module_radius_ratio);
    int size = matrix.GetSize();

    for (int row = 0; row < size; row++) {
        int y = (row + config.border_size) * box;

        for (int col = 0; col < size; col++) {
            int x = (col + config.border_size) * box;

            if (!matrix.Test(col, row)) {
                out_canvas->FillRect(x, y, x + box, y + box, config.back_color);
                continue;
            }

            // Plus shape
            out_canvas->FillRect(x + radius, y, x + box - radius, y + box, config.fill_color);
            out_canvas->FillRect(x, y + radius, x + box, y + box - radius, config.fill_color);

            if (!radius)
                continue;

            static const bq_Corner corners[] = {
                bq_Corner::TopLeft,
                bq_Corner::TopRight,
                bq_Corner::BottomLeft,
                bq_Corner::BottomRight
            };

            for (bq_Corner corner: corners) {
                bool left = (corner == bq_Corner::TopLeft || corner == bq_Corner::BottomLeft);
                bool top = (corner == bq_Corner::TopLeft || corner == bq_Corner::TopRight);

                int square_left = left ? x : x + box - radius;
                int square_top = top ? y : y + box - radius;
                int cx = left ? x + radius : x + box - radius;
                int cy = top ? y + radius : y + box - radius;

                switch (bq_GetCornerStyle(matrix, row, col, corner)) {
                    case bq_CornerStyle::Sharp: {
                        out_canvas->FillRect(square_left, square_top, square_left + radius,
                                             square_top + radius, config.fill_color);
                    } break;

                    case bq_CornerStyle::Rounded: {
                        out_canvas->FillRect(square_left, square_top, square_left + radius,
                                             square_top + radius, config.back_color);
                        out_canvas->FillQuarterDisc(cx, cy, radius, corner, config.fill_color);
                    } break;
                }
            }
        }
    }
}

bool bq_BuildEyeGlyph(const bq_RenderConfig &config, bq_Canvas *out_glyph)
{
    int box = config.box_size;
    int outer = 7 * box;
    int gap = 5 * box;
    int pupil = 3 * box;

    if (!out_glyph->Init(outer, outer, 3, config.back_color))
        return false;

    int gap_offset = (outer - gap) / 2;
    int pupil_offset = (outer - pupil) / 2;

    out_glyph->FillRoundedRect(0, 0, outer, outer, box, config.eye_color);
    out_glyph->FillRoundedRect(gap_offset, gap_offset, gap_offset + gap, gap_offset + gap,
                               box / 2, config.back_color);
    out_glyph->FillRoundedRect(pupil_offset, pupil_offset, pupil_offset + pupil, pupil_offset + pupil,
                               box / 3, config.fill_color);

    return true;
}

void bq_DrawEyes(const bq_Canvas &glyph, const bq_RenderConfig &config, bq_Canvas *out_canvas)
{
    int border = config.border_size * config.box_size;
    int eye = glyph.GetWidth();

    const Vec2<int> anchors[] = {
        { border, border },
        { out_canvas->GetWidth() - border - eye, border },
        { border, out_canvas->GetHeight() - border - eye }
    };

    for (const Vec2<int> &anchor: anchors) {
        out_canvas->FillRect(anchor.x, anchor.y, anchor.x + eye, anchor.y + eye, config.back_color);
        out_canvas->Paste(glyph.image, anchor.x, anchor.y);
    }
}

bool bq_ComposeLogo(const bq_LogoSpec &logo, const bq_RenderConfig &config, bq_Canvas *out_canvas)
{
    int width = logo.patch_right - logo.patch_left;
    int height = logo.patch_bottom - logo.patch_top;
    int patch_radius = config.box_size / 2;

    // Transparent outside of the rounded patch
    {
        bq_Canvas overlay;
        if (!overlay.Init(width, height, 4, bq_Transparent))
            return false;

        bq_Color color = config.back_color;
        color.a = 255;

        overlay.FillRoundedRect(0, 0, width, height, patch_radius, color);
        out_canvas->PasteMasked(overlay.image, logo.patch_left, logo.patch_top);
    }

    out_canvas->PasteMasked(logo.image, logo.patch_left, logo.patch_top);

    return true;
}

static bool CheckSettings(const bq_RenderRequest &request)
{
    bool valid = true;

    if (request.size < 1 || request.size > img_MaxDimension) {
        LogError("Image size must be between 1 and %1 pixels", img_MaxDimension);
        valid = false;
    }
    if (request.supersample < 1 || request.supersample > bq_MaxSupersample) {
        LogError("Supersampling factor must be between 1 and %1", bq_MaxSupersample);
        valid = false;
    }
    if (request.border < 0 || request.border > bq_MaxBorder) {
        LogError("Border must be between 0 and %1 modules", bq_MaxBorder);
        valid = false;
    }
    if (!(request.module_radius >= 0.0 && request.module_radius <= 0.5)) {
        LogError("Module radius ratio must be between 0 and 0.5");
        valid = false;
    }
    if (request.logo_aspect[0] < 1 || request.logo_aspect[1] < 1) {
        LogError("Logo aspect ratio must use positive values");
        valid = false;
    }
    if (request.logo_padding < 0) {
        LogError("Logo padding cannot be negative");
        valid = false;
    }

    return valid;
}

static bool ParseColors(const bq_RenderRequest &request, bq_RenderConfig *out_config)
{
    bool valid = true;

    valid &= bq_ParseColor(request.fill_color, &out_config->fill_color);
    valid &= bq_ParseColor(request.eye_color, &out_config->eye_color);
    valid &= bq_ParseColor(request.back_color, &out_config->back_color);

    return valid;
}

bq_RenderResult bq_Render(const bq_RenderRequest &request, img_Image *out_image, bq_RenderInfo *out_info)
{
    bq_RenderInfo info = {};
    BQ_DEFER {
        if (out_info) {
            *out_info = info;
        }
    };

    if (!CheckSettings(request))
        return bq_RenderResult::InvalidSettings;
    if (!qr_IsVersionValid(request.version)) {
        LogError("Unknown QR version %1 (must be between %2 and %3)", request.version, qr_VersionMin, qr_VersionMax);
        return bq_RenderResult::UnknownVersion;
    }

    bq_RenderConfig config = {};
    config.border_size = request.border;
    config.module_radius_ratio = request.module_radius;
    if (!ParseColors(request, &config))
        return bq_RenderResult::InvalidColor;

    qr_Matrix matrix;
    switch (qr_EncodeText(request.payload, request.version, request.ecc, &matrix)) {
        case qr_EncodeResult::Success: {} break;
        case qr_EncodeResult::UnknownVersion: return bq_RenderResult::UnknownVersion;
        case qr_EncodeResult::InvalidText: return bq_RenderResult::InvalidPayload;
        case qr_EncodeResult::DataOverflow: return bq_RenderResult::PayloadTooLarge;
    }
    info.modules = matrix.GetSize();

    // Work at supersampled scale
    int factor = request.supersample;
    int span;
    {
        int64_t working = (int64_t)request.size * factor;
        int64_t total = matrix.GetSize() + 2 * config.border_size;
        int64_t box = std::max((int64_t)1, working / total);

        if (total * box > img_MaxDimension) {
            LogError("Supersampled canvas (%1 pixels) exceeds the limit of %2 pixels", total * box, img_MaxDimension);
            return bq_RenderResult::InvalidSettings;
        }

        config.box_size = (int)box;
        span = (int)(total * box);
    }
    info.box_size = config.box_size;
    info.canvas_size = span;

    LogDebug("Box size: %1 pixels, canvas: %2x%2", config.box_size, span);

    // Prepare logo
    bool use_logo = request.logo_filename && request.logo_filename[0];
    bq_LogoSpec logo;
    if (use_logo) {
        img_Image src;
        switch (img_LoadFile(request.logo_filename, &src)) {
            case img_LoadResult::Success: {} break;
            case img_LoadResult::MissingFile: return bq_RenderResult::LogoNotFound;
            case img_LoadResult::DecodeError: return bq_RenderResult::LogoDecodeError;
        }

        int max_size = bq_ComputeLogoMaxSize(span, request.logo_padding * factor);
        if (max_size < 1) {
            LogError("Canvas (%1 pixels) is too small to hold a logo", span);
            return bq_RenderResult::InvalidSettings;
        }

        if (!bq_NormalizeLogo(src, request.logo_aspect[0], request.logo_aspect[1], max_size, &logo.image))
            return bq_RenderResult::LogoDecodeError;
        bq_PlaceLogo(span, span, &logo);

        info.cleared_modules = bq_ClearLogoArea(&matrix, config, logo.patch_left, logo.patch_top,
                                                logo.patch_right, logo.patch_bottom);
        LogDebug("Cleared %1 modules behind logo", info.cleared_modules);
    }

    bq_Canvas canvas;
    if (!canvas.Init(span, span, 3, config.back_color))
        return bq_RenderResult::InvalidSettings;
    info.canvas_allocated = true;

    bq_DrawModules(matrix, config, &canvas);

    // Eyes
    {
        bq_Canvas glyph;
        if (!bq_BuildEyeGlyph(config, &glyph))
            return bq_RenderResult::InvalidSettings;

        bq_DrawEyes(glyph, config, &canvas);
    }

    if (use_logo && !bq_ComposeLogo(logo, config, &canvas))
        return bq_RenderResult::InvalidSettings;

    // Downsample
    {
        int final_size = span / factor;
        int trimmed = final_size * factor;

        img_Truncate(&canvas.image, trimmed, trimmed);
        info.trimmed_size = trimmed;

        if (factor > 1) {
            if (!img_Resize(canvas.image, final_size, final_size, out_image))
                return bq_RenderResult::InvalidSettings;
        } else {
            *out_image = std::move(canvas.image);
        }

        info.final_size = final_size;
    }

    return bq_RenderResult::Success;
}

bq_RenderResult bq_RenderToFile(const bq_RenderRequest &request, const char *filename, bq_RenderInfo *out_info)
{
    img_Image image;

    bq_RenderResult ret = bq_Render(request, &image, out_info);
    if (ret != bq_RenderResult::Success)
        return ret;

    if (!img_SavePng(image, filename))
        return bq_RenderResult::OutputWriteError;

    return bq_RenderResult::Success;
}

}
