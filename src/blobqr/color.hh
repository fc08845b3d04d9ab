// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace BQ {

struct bq_Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    uint8_t a;

    bool operator==(const bq_Color &other) const
        { return r == other.r && g == other.g && b == other.b && a == other.a; }
    bool operator!=(const bq_Color &other) const { return !(*this == other); }
};

static const bq_Color bq_Black = { 0, 0, 0, 255 };
static const bq_Color bq_White = { 255, 255, 255, 255 };
static const bq_Color bq_Transparent = { 0, 0, 0, 0 };

// Accepts CSS color names, #rgb, #rgba, #rrggbb, #rrggbbaa and the rgb(), rgba(),
// hsl(), hsv() and hsb() functional forms
bool bq_ParseColor(Span<const char> str, bq_Color *out_color);

}
