// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "config.hh"
#include "render.hh"

namespace BQ {

static const char *const DefaultConfigEnv = "BLOBQR_CONFIG_FILE";

int Main(int argc, char **argv)
{
    BlockAllocator temp_alloc;

    // Options
    bq_Config config;
    const char *config_filename = GetEnv(DefaultConfigEnv);
    const char *payload = nullptr;
    bool interactive = false;

    const auto print_usage = [&](FILE *fp) {
        const bq_RenderRequest &request = config.request;

        PrintLn(fp, R"(Usage: %!..+%1 [options...] [URL]%!0

Options:
    %!..+-C, --config_file filename%!0     Load render settings from INI file
    %!..+-o, --output filename%!0          Output PNG file
                                   %!D..(default: %2)%!0
    %!..+-s, --size pixels%!0              Final image width/height
                                   %!D..(default: %3)%!0

        %!..+--fill color%!0               Module color
                                   %!D..(default: %4)%!0
        %!..+--eye color%!0                Eye marker color
                                   %!D..(default: %5)%!0
        %!..+--back color%!0               Background color
                                   %!D..(default: %6)%!0

    %!..+-l, --logo filename%!0            Logo image
                                   %!D..(default: %7)%!0
        %!..+--no_logo%!0                  Render without logo

        %!..+--qr_version version%!0       QR version, 1 to 40
                                   %!D..(default: %8)%!0
        %!..+--ecc level%!0                Error correction L, M, Q or H
                                   %!D..(default: %9)%!0
        %!..+--border modules%!0           Quiet zone in modules
                                   %!D..(default: %10)%!0
        %!..+--radius ratio%!0             Module corner radius ratio
                                   %!D..(default: %11)%!0
        %!..+--supersample factor%!0       Supersampling factor
                                   %!D..(default: %12)%!0

    %!..+-i, --interactive%!0              Prompt for values (default when no URL is given)

        %!..+--version%!0                  Print version
        %!..+--help%!0                     Print help

Settings are also read from the INI file named by %!..+%13%!0 if set.
Command-line options override values from the configuration file.)",
                BuildTarget, config.output_filename, request.size,
                request.fill_color, request.eye_color, request.back_color,
                request.logo_filename ? request.logo_filename : "none",
                request.version, qr_ErrorCorrectionNames[(int)request.ecc], request.border,
                request.module_radius, request.supersample, DefaultConfigEnv);
    };

    // Handle version
    if (argc >= 2 && TestStr(argv[1], "--version")) {
        PrintLn("%!R..%1%!0 %!..+%2%!0", BuildTarget, BuildVersion);
        return 0;
    }

    // Find config filename
    {
        OptionParser opt(argc, argv, OptionMode::Skip);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else if (opt.TestHasFailed()) {
                return 1;
            }
        }
    }

    if (config_filename && config_filename[0] && !bq_LoadConfig(config_filename, &config))
        return 1;

    // Parse arguments
    {
        bq_RenderRequest *request = &config.request;
        OptionParser opt(argc, argv);

        while (opt.Next()) {
            if (opt.Test("-C", "--config_file", OptionType::Value)) {
                // Already handled
            } else if (opt.Test("-o", "--output", OptionType::Value)) {
                config.output_filename = opt.current_value;
            } else if (opt.Test("-s", "--size", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &request->size))
                    return 1;
            } else if (opt.Test("--fill", OptionType::Value)) {
                request->fill_color = opt.current_value;
            } else if (opt.Test("--eye", OptionType::Value)) {
                request->eye_color = opt.current_value;
            } else if (opt.Test("--back", OptionType::Value)) {
                request->back_color = opt.current_value;
            } else if (opt.Test("-l", "--logo", OptionType::Value)) {
                request->logo_filename = opt.current_value;
            } else if (opt.Test("--no_logo")) {
                request->logo_filename = nullptr;
            } else if (opt.Test("--qr_version", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &request->version))
                    return 1;
            } else if (opt.Test("--ecc", OptionType::Value)) {
                if (!OptionToEnumI(qr_ErrorCorrectionNames, opt.current_value, &request->ecc)) {
                    LogError("Unknown error correction level '%1'", opt.current_value);
                    return 1;
                }
            } else if (opt.Test("--border", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &request->border))
                    return 1;
            } else if (opt.Test("--radius", OptionType::Value)) {
                if (!ParseDouble(opt.current_value, &request->module_radius))
                    return 1;
            } else if (opt.Test("--supersample", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &request->supersample))
                    return 1;
            } else if (opt.Test("-i", "--interactive")) {
                interactive = true;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        payload = opt.ConsumeNonOption();
        opt.LogUnusedArguments();
    }

    if (interactive || !payload) {
        if (!bq_PromptConfig(&config, &payload, &temp_alloc))
            return 1;

        PrintLn();
        PrintLn("...Generating QR code...");
    }

    config.request.payload = payload;

    bq_RenderInfo info;
    if (bq_RenderToFile(config.request, config.output_filename, &info) != bq_RenderResult::Success)
        return 1;

    PrintLn("%!G..✅ Success!%!0 QR code (%1x%2 px) saved to: %!..+%3%!0",
            info.final_size, info.final_size, config.output_filename);
    return 0;
}

}

// C++ namespaces are stupid
int main(int argc, char **argv) { return BQ::RunApp(argc, argv); }
