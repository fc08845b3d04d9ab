// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace BQ {

enum class qr_ErrorCorrection {
    Low,
    Medium,
    Quartile,
    High
};
static const char *const qr_ErrorCorrectionNames[] = {
    "L",
    "M",
    "Q",
    "H"
};

static const int qr_VersionMin = 1;
static const int qr_VersionMax = 40;

static inline bool qr_IsVersionValid(int version) { return version >= qr_VersionMin && version <= qr_VersionMax; }
static inline int qr_ModulesForVersion(int version) { return 17 + 4 * version; }

// Square module grid. Modules can only be cleared once the matrix exists,
// reads outside the grid return false.
class qr_Matrix {
    int size = 0;
    HeapArray<bool> modules;

public:
    qr_Matrix() = default;
    qr_Matrix(int size, FunctionRef<bool(int x, int y)> func);

    int GetSize() const { return size; }
    bool IsValid() const { return size > 0; }

    bool Test(int x, int y) const
    {
        if (x < 0 || x >= size || y < 0 || y >= size)
            return false;
        return modules[(Size)y * size + x];
    }

    // Returns true if the module was active
    bool Clear(int x, int y);

    Size CountActive() const;
};

enum class qr_EncodeResult {
    Success,
    UnknownVersion,
    InvalidText,
    DataOverflow
};

qr_EncodeResult qr_EncodeText(Span<const char> text, int version, qr_ErrorCorrection ecc, qr_Matrix *out_matrix);

}
