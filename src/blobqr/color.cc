// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "color.hh"

#include <math.h>

namespace BQ {

struct NamedColor {
    const char *name;
    uint32_t rgb;
};

static const NamedColor NamedColors[] = {
    { "aliceblue", 0xF0F8FF },
    { "antiquewhite", 0xFAEBD7 },
    { "aqua", 0x00FFFF },
    { "aquamarine", 0x7FFFD4 },
    { "azure", 0xF0FFFF },
    { "beige", 0xF5F5DC },
    { "bisque", 0xFFE4C4 },
    { "black", 0x000000 },
    { "blanchedalmond", 0xFFEBCD },
    { "blue", 0x0000FF },
    { "blueviolet", 0x8A2BE2 },
    { "brown", 0xA52A2A },
    { "burlywood", 0xDEB887 },
    { "cadetblue", 0x5F9EA0 },
    { "chartreuse", 0x7FFF00 },
    { "chocolate", 0xD2691E },
    { "coral", 0xFF7F50 },
    { "cornflowerblue", 0x6495ED },
    { "cornsilk", 0xFFF8DC },
    { "crimson", 0xDC143C },
    { "cyan", 0x00FFFF },
    { "darkblue", 0x00008B },
    { "darkcyan", 0x008B8B },
    { "darkgoldenrod", 0xB8860B },
    { "darkgray", 0xA9A9A9 },
    { "darkgrey", 0xA9A9A9 },
    { "darkgreen", 0x006400 },
    { "darkkhaki", 0xBDB76B },
    { "darkmagenta", 0x8B008B },
    { "darkolivegreen", 0x556B2F },
    { "darkorange", 0xFF8C00 },
    { "darkorchid", 0x9932CC },
    { "darkred", 0x8B0000 },
    { "darksalmon", 0xE9967A },
    { "darkseagreen", 0x8FBC8F },
    { "darkslateblue", 0x483D8B },
    { "darkslategray", 0x2F4F4F },
    { "darkslategrey", 0x2F4F4F },
    { "darkturquoise", 0x00CED1 },
    { "darkviolet", 0x9400D3 },
    { "deeppink", 0xFF1493 },
    { "deepskyblue", 0x00BFFF },
    { "dimgray", 0x696969 },
    { "dimgrey", 0x696969 },
    { "dodgerblue", 0x1E90FF },
    { "firebrick", 0xB22222 },
    { "floralwhite", 0xFFFAF0 },
    { "forestgreen", 0x228B22 },
    { "fuchsia", 0xFF00FF },
    { "gainsboro", 0xDCDCDC },
    { "ghostwhite", 0xF8F8FF },
    { "gold", 0xFFD700 },
    { "goldenrod", 0xDAA520 },
    { "gray", 0x808080 },
    { "grey", 0x808080 },
    { "green", 0x008000 },
    { "greenyellow", 0xADFF2F },
    { "honeydew", 0xF0FFF0 },
    { "hotpink", 0xFF69B4 },
    { "indianred", 0xCD5C5C },
    { "indigo", 0x4B0082 },
    { "ivory", 0xFFFFF0 },
    { "khaki", 0xF0E68C },
    { "lavender", 0xE6E6FA },
    { "lavenderblush", 0xFFF0F5 },
    { "lawngreen", 0x7CFC00 },
    { "lemonchiffon", 0xFFFACD },
    { "lightblue", 0xADD8E6 },
    { "lightcoral", 0xF08080 },
    { "lightcyan", 0xE0FFFF },
    { "lightgoldenrodyellow", 0xFAFAD2 },
    { "lightgreen", 0x90EE90 },
    { "lightgray", 0xD3D3D3 },
    { "lightgrey", 0xD3D3D3 },
    { "lightpink", 0xFFB6C1 },
    { "lightsalmon", 0xFFA07A },
    { "lightseagreen", 0x20B2AA },
    { "lightskyblue", 0x87CEFA },
    { "lightslategray", 0x778899 },
    { "lightslategrey", 0x778899 },
    { "lightsteelblue", 0xB0C4DE },
    { "lightyellow", 0xFFFFE0 },
    { "lime", 0x00FF00 },
    { "limegreen", 0x32CD32 },
    { "linen", 0xFAF0E6 },
    { "magenta", 0xFF00FF },
    { "maroon", 0x800000 },
    { "mediumaquamarine", 0x66CDAA },
    { "mediumblue", 0x0000CD },
    { "mediumorchid", 0xBA55D3 },
    { "mediumpurple", 0x9370DB },
    { "mediumseagreen", 0x3CB371 },
    { "mediumslateblue", 0x7B68EE },
    { "mediumspringgreen", 0x00FA9A },
    { "mediumturquoise", 0x48D1CC },
    { "mediumvioletred", 0xC71585 },
    { "midnightblue", 0x191970 },
    { "mintcream", 0xF5FFFA },
    { "mistyrose", 0xFFE4E1 },
    { "moccasin", 0xFFE4B5 },
    { "navajowhite", 0xFFDEAD },
    { "navy", 0x000080 },
    { "oldlace", 0xFDF5E6 },
    { "olive", 0x808000 },
    { "olivedrab", 0x6B8E23 },
    { "orange", 0xFFA500 },
    { "orangered", 0xFF4500 },
    { "orchid", 0xDA70D6 },
    { "palegoldenrod", 0xEEE8AA },
    { "palegreen", 0x98FB98 },
    { "paleturquoise", 0xAFEEEE },
    { "palevioletred", 0xDB7093 },
    { "papayawhip", 0xFFEFD5 },
    { "peachpuff", 0xFFDAB9 },
    { "peru", 0xCD853F },
    { "pink", 0xFFC0CB },
    { "plum", 0xDDA0DD },
    { "powderblue", 0xB0E0E6 },
    { "purple", 0x800080 },
    { "rebeccapurple", 0x663399 },
    { "red", 0xFF0000 },
    { "rosybrown", 0xBC8F8F },
    { "royalblue", 0x4169E1 },
    { "saddlebrown", 0x8B4513 },
    { "salmon", 0xFA8072 },
    { "sandybrown", 0xF4A460 },
    { "seagreen", 0x2E8B57 },
    { "seashell", 0xFFF5EE },
    { "sienna", 0xA0522D },
    { "silver", 0xC0C0C0 },
    { "skyblue", 0x87CEEB },
    { "slateblue", 0x6A5ACD },
    { "slategray", 0x708090 },
    { "slategrey", 0x708090 },
    { "snow", 0xFFFAFA },
    { "springgreen", 0x00FF7F },
    { "steelblue", 0x4682B4 },
    { "tan", 0xD2B48C },
    { "teal", 0x008080 },
    { "thistle", 0xD8BFD8 },
    { "tomato", 0xFF6347 },
    { "turquoise", 0x40E0D0 },
    { "violet", 0xEE82EE },
    { "wheat", 0xF5DEB3 },
    { "white", 0xFFFFFF },
    { "whitesmoke", 0xF5F5F5 },
    { "yellow", 0xFFFF00 },
    { "yellowgreen", 0x9ACD32 }
};

static inline int ParseHexDigit(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else {
        return -1;
    }
}

static bool ParseHexColor(Span<const char> hex, bq_Color *out_color)
{
    int digits[8];

    if (hex.len != 3 && hex.len != 4 && hex.len != 6 && hex.len != 8)
        return false;

    for (Size i = 0; i < hex.len; i++) {
        digits[i] = ParseHexDigit(hex[i]);
        if (digits[i] < 0)
            return false;
    }

    bq_Color color = bq_Black;

    if (hex.len <= 4) {
        color.r = (uint8_t)(digits[0] * 17);
        color.g = (uint8_t)(digits[1] * 17);
        color.b = (uint8_t)(digits[2] * 17);
        if (hex.len == 4) {
            color.a = (uint8_t)(digits[3] * 17);
        }
    } else {
        color.r = (uint8_t)(digits[0] * 16 + digits[1]);
        color.g = (uint8_t)(digits[2] * 16 + digits[3]);
        color.b = (uint8_t)(digits[4] * 16 + digits[5]);
        if (hex.len == 8) {
            color.a = (uint8_t)(digits[6] * 16 + digits[7]);
        }
    }

    *out_color = color;
    return true;
}

// Split 'name(a, b, c)' into its arguments, returns the argument count or -1
static Size SplitFunction(Span<const char> str, Span<const char> name, Span<Span<const char>> out_args)
{
    if (str.len <= name.len + 1 || !TestStrI(str.Take(0, name.len), name))
        return -1;
    str = TrimStr(str.Take(name.len, str.len - name.len));

    if (str.len < 2 || str[0] != '(' || str[str.len - 1] != ')')
        return -1;
    str = str.Take(1, str.len - 2);

    Size count = 0;
    while (str.len) {
        if (count >= out_args.len)
            return -1;

        Span<const char> arg = TrimStr(SplitStr(str, ',', &str));
        if (!arg.len)
            return -1;

        out_args[count++] = arg;
    }

    return count;
}

// Plain integers (0-255) or percentages
static bool ParseChannel(Span<const char> str, uint8_t *out_value)
{
    if (str.len && str[str.len - 1] == '%') {
        double percent;
        if (!ParseDouble(str.Take(0, str.len - 1), &percent, BQ_DEFAULT_PARSE_FLAGS & ~(int)ParseFlag::Log))
            return false;
        if (percent < 0.0 || percent > 100.0)
            return false;

        *out_value = (uint8_t)(percent * 255.0 / 100.0 + 0.5);
    } else {
        int value;
        if (!ParseInt(str, &value, BQ_DEFAULT_PARSE_FLAGS & ~(int)ParseFlag::Log))
            return false;
        if (value < 0 || value > 255)
            return false;

        *out_value = (uint8_t)value;
    }

    return true;
}

static bool ParsePercent(Span<const char> str, double *out_fraction)
{
    if (!str.len || str[str.len - 1] != '%')
        return false;

    double percent;
    if (!ParseDouble(str.Take(0, str.len - 1), &percent, BQ_DEFAULT_PARSE_FLAGS & ~(int)ParseFlag::Log))
        return false;
    if (percent < 0.0 || percent > 100.0)
        return false;

    *out_fraction = percent / 100.0;
    return true;
}

static bool ParseHue(Span<const char> str, double *out_hue)
{
    double hue;
    if (!ParseDouble(str, &hue, BQ_DEFAULT_PARSE_FLAGS & ~(int)ParseFlag::Log))
        return false;

    hue = fmod(hue, 360.0);
    if (hue < 0.0) {
        hue += 360.0;
    }

    *out_hue = hue / 360.0;
    return true;
}

static inline uint8_t FractionToChannel(double value)
{
    value = std::clamp(value, 0.0, 1.0);
    return (uint8_t)(value * 255.0 + 0.5);
}

static double HlsComponent(double m1, double m2, double hue)
{
    hue = hue - floor(hue);

    if (hue < 1.0 / 6.0)
        return m1 + (m2 - m1) * hue * 6.0;
    if (hue < 0.5)
        return m2;
    if (hue < 2.0 / 3.0)
        return m1 + (m2 - m1) * (2.0 / 3.0 - hue) * 6.0;
    return m1;
}

static bq_Color HslToColor(double h, double s, double l)
{
    if (s == 0.0) {
        uint8_t v = FractionToChannel(l);
        return { v, v, v, 255 };
    }

    double m2 = (l <= 0.5) ? (l * (1.0 + s)) : (l + s - l * s);
    double m1 = 2.0 * l - m2;

    bq_Color color = {
        FractionToChannel(HlsComponent(m1, m2, h + 1.0 / 3.0)),
        FractionToChannel(HlsComponent(m1, m2, h)),
        FractionToChannel(HlsComponent(m1, m2, h - 1.0 / 3.0)),
        255
    };
    return color;
}

static bq_Color HsvToColor(double h, double s, double v)
{
    if (s == 0.0) {
        uint8_t c = FractionToChannel(v);
        return { c, c, c, 255 };
    }

    int sector = (int)(h * 6.0) % 6;
    double f = h * 6.0 - floor(h * 6.0);
    double p = v * (1.0 - s);
    double q = v * (1.0 - s * f);
    double t = v * (1.0 - s * (1.0 - f));

    double r, g, b;
    switch (sector) {
        case 0: { r = v; g = t; b = p; } break;
        case 1: { r = q; g = v; b = p; } break;
        case 2: { r = p; g = v; b = t; } break;
        case 3: { r = p; g = q; b = v; } break;
        case 4: { r = t; g = p; b = v; } break;
        default: { r = v; g = p; b = q; } break;
    }

    bq_Color color = { FractionToChannel(r), FractionToChannel(g), FractionToChannel(b), 255 };
    return color;
}

static bool ParseFunctionColor(Span<const char> str, bq_Color *out_color)
{
    Span<const char> args[4];
    Size count;

    if ((count = SplitFunction(str, "rgba", args)) >= 0) {
        if (count != 4)
            return false;

        bq_Color color;
        if (!ParseChannel(args[0], &color.r) || !ParseChannel(args[1], &color.g) ||
                !ParseChannel(args[2], &color.b) || !ParseChannel(args[3], &color.a))
            return false;

        *out_color = color;
        return true;
    } else if ((count = SplitFunction(str, "rgb", args)) >= 0) {
        if (count != 3)
            return false;

        bq_Color color = bq_Black;
        if (!ParseChannel(args[0], &color.r) || !ParseChannel(args[1], &color.g) ||
                !ParseChannel(args[2], &color.b))
            return false;

        *out_color = color;
        return true;
    } else if ((count = SplitFunction(str, "hsl", args)) >= 0) {
        double h, s, l;

        if (count != 3)
            return false;
        if (!ParseHue(args[0], &h) || !ParsePercent(args[1], &s) || !ParsePercent(args[2], &l))
            return false;

        *out_color = HslToColor(h, s, l);
        return true;
    } else if ((count = SplitFunction(str, "hsv", args)) >= 0 ||
               (count = SplitFunction(str, "hsb", args)) >= 0) {
        double h, s, v;

        if (count != 3)
            return false;
        if (!ParseHue(args[0], &h) || !ParsePercent(args[1], &s) || !ParsePercent(args[2], &v))
            return false;

        *out_color = HsvToColor(h, s, v);
        return true;
    }

    return false;
}

bool bq_ParseColor(Span<const char> str, bq_Color *out_color)
{
    str = TrimStr(str);

    if (str.len && str[0] == '#') {
        if (ParseHexColor(str.Take(1, str.len - 1), out_color))
            return true;
    } else if (str.len && str[str.len - 1] == ')') {
        if (ParseFunctionColor(str, out_color))
            return true;
    } else {
        for (const NamedColor &named: NamedColors) {
            if (TestStrI(str, named.name)) {
                out_color->r = (uint8_t)((named.rgb >> 16) & 0xFF);
                out_color->g = (uint8_t)((named.rgb >> 8) & 0xFF);
                out_color->b = (uint8_t)((named.rgb >> 0) & 0xFF);
                out_color->a = 255;

                return true;
            }
        }
    }

    LogError("Invalid color format '%1', use names like 'red' or hex like '#FF0000'", str);
    return false;
}

}
