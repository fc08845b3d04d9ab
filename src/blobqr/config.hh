// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "render.hh"

namespace BQ {

struct bq_Config {
    bq_RenderRequest request;
    const char *output_filename = "my_custom_qr.png";

    BlockAllocator str_alloc;
};

bool bq_ParseAspect(Span<const char> str, int *out_width, int *out_height);

bool bq_LoadConfig(Span<const char> text, const char *filename, bq_Config *out_config);
bool bq_LoadConfig(const char *filename, bq_Config *out_config);

// Ask for the payload and the main settings on stdin, an empty answer keeps the
// current value. Returns false on EOF or read error.
bool bq_PromptConfig(bq_Config *config, const char **out_payload, Allocator *alloc);

}
