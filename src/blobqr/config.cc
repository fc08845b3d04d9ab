// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "config.hh"

namespace BQ {

bool bq_ParseAspect(Span<const char> str, int *out_width, int *out_height)
{
    Span<const char> remain = str;
    Span<const char> width_str = TrimStr(SplitStr(remain, ':', &remain));
    Span<const char> height_str = TrimStr(remain);

    int width;
    int height;
    unsigned int flags = (int)ParseFlag::Validate | (int)ParseFlag::End;
    if (!ParseInt(width_str, &width, flags) || !ParseInt(height_str, &height, flags) ||
            width < 1 || height < 1) {
        LogError("Malformed aspect ratio '%1', expected W:H with positive values", str);
        return false;
    }

    *out_width = width;
    *out_height = height;
    return true;
}

static const char *CheckColor(Span<const char> str, Allocator *alloc)
{
    bq_Color color;
    if (!bq_ParseColor(str, &color))
        return nullptr;

    return DuplicateString(str, alloc).ptr;
}

bool bq_LoadConfig(Span<const char> text, const char *filename, bq_Config *out_config)
{
    bq_Config config;
    bq_RenderRequest *request = &config.request;

    IniParser ini(text, filename);
    ini.PushLogFilter();
    BQ_DEFER { PopLogFilter(); };

    bool valid = true;
    {
        IniProperty prop;
        while (ini.Next(&prop)) {
            if (prop.section == "Output") {
                if (prop.key == "Size") {
                    valid &= ParseInt(prop.value, &request->size);
                } else if (prop.key == "File") {
                    config.output_filename = DuplicateString(prop.value, &config.str_alloc).ptr;
                } else if (prop.key == "Supersample") {
                    valid &= ParseInt(prop.value, &request->supersample);
                } else {
                    LogError("Unknown attribute '%1'", prop.key);
                    valid = false;
                }
            } else if (prop.section == "Code") {
                if (prop.key == "Version") {
                    valid &= ParseInt(prop.value, &request->version);
                } else if (prop.key == "ErrorCorrection") {
                    if (!OptionToEnumI(qr_ErrorCorrectionNames, prop.value, &request->ecc)) {
                        LogError("Unknown error correction level '%1'", prop.value);
                        valid = false;
                    }
                } else if (prop.key == "Border") {
                    valid &= ParseInt(prop.value, &request->border);
                } else {
                    LogError("Unknown attribute '%1'", prop.key);
                    valid = false;
                }
            } else if (prop.section == "Style") {
                if (prop.key == "FillColor") {
                    request->fill_color = CheckColor(prop.value, &config.str_alloc);
                    valid &= !!request->fill_color;
                } else if (prop.key == "EyeColor") {
                    request->eye_color = CheckColor(prop.value, &config.str_alloc);
                    valid &= !!request->eye_color;
                } else if (prop.key == "BackColor") {
                    request->back_color = CheckColor(prop.value, &config.str_alloc);
                    valid &= !!request->back_color;
                } else if (prop.key == "ModuleRadius") {
                    valid &= ParseDouble(prop.value, &request->module_radius);
                } else {
                    LogError("Unknown attribute '%1'", prop.key);
                    valid = false;
                }
            } else if (prop.section == "Logo") {
                if (prop.key == "File") {
                    request->logo_filename = DuplicateString(prop.value, &config.str_alloc).ptr;
                } else if (prop.key == "Aspect") {
                    valid &= bq_ParseAspect(prop.value, &request->logo_aspect[0], &request->logo_aspect[1]);
                } else if (prop.key == "Padding") {
                    valid &= ParseInt(prop.value, &request->logo_padding);
                } else {
                    LogError("Unknown attribute '%1'", prop.key);
                    valid = false;
                }
            } else {
                LogError("Unknown section '%1'", prop.section);
                while (ini.NextInSection(&prop));
                valid = false;
            }
        }
    }
    if (!ini.IsValid() || !valid)
        return false;

    std::swap(*out_config, config);
    return true;
}

bool bq_LoadConfig(const char *filename, bq_Config *out_config)
{
    HeapArray<char> text;
    if (ReadFile(filename, Mebibytes(1), &text) < 0)
        return false;

    return bq_LoadConfig(text, filename, out_config);
}

static const char *PromptValue(const char *prompt, const char *default_value, Allocator *alloc)
{
    const char *str = Prompt(prompt, default_value, alloc);
    if (!str)
        return nullptr;

    Span<const char> trimmed = TrimStr(Span<const char>(str));
    if (!trimmed.len)
        return default_value ? default_value : "";

    return DuplicateString(trimmed, alloc).ptr;
}

bool bq_PromptConfig(bq_Config *config, const char **out_payload, Allocator *alloc)
{
    static const int DefaultSize = bq_RenderRequest().size;

    bq_RenderRequest *request = &config->request;

    PrintLn("%!..+--- 🎨 Custom QR Code Generator ---%!0");
    PrintLn("Press Enter to use the default value.");
    PrintLn();

    for (;;) {
        const char *url = PromptValue("Enter URL (required)", *out_payload, alloc);
        if (!url)
            return false;

        if (url[0]) {
            *out_payload = url;
            break;
        }

        LogError("URL cannot be empty.");
    }

    // Size
    {
        const char *default_size = Fmt(alloc, "%1", request->size).ptr;
        const char *str = PromptValue("Desired size (width)", default_size, alloc);
        if (!str)
            return false;

        int size;
        if (ParseInt(str, &size, (int)ParseFlag::Validate | (int)ParseFlag::End) && size >= 1) {
            request->size = size;
        } else {
            LogWarning("Invalid number. Using %1.", DefaultSize);
            request->size = DefaultSize;
        }
    }

    request->fill_color = PromptValue("Module color (e.g. red, #FFFFFF)", request->fill_color, alloc);
    if (!request->fill_color)
        return false;
    request->eye_color = PromptValue("Eye color (e.g. red, #FF0000)", request->eye_color, alloc);
    if (!request->eye_color)
        return false;

    // An empty default keeps the logo disabled when the user presses Enter
    {
        bool use_logo = request->logo_filename && request->logo_filename[0];
        const char *logo = PromptValue("Path to logo", use_logo ? request->logo_filename : "", alloc);
        if (!logo)
            return false;

        request->logo_filename = logo[0] ? logo : nullptr;
    }

    config->output_filename = PromptValue("Output filename", config->output_filename, alloc);
    if (!config->output_filename)
        return false;

    return true;
}

}
