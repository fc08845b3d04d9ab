// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "base.hh"

#if defined(BQ_BUILD_TARGET)
    extern "C" const char *BuildTarget = BQ_STRINGIFY(BQ_BUILD_TARGET);
#else
    extern "C" const char *BuildTarget = "????";
#endif
#if defined(BQ_BUILD_VERSION)
    extern "C" const char *BuildVersion = BQ_STRINGIFY(BQ_BUILD_VERSION);
#else
    extern "C" const char *BuildVersion = "(unknown version)";
#endif
