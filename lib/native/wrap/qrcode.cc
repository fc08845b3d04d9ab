// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "qrcode.hh"
#include "qrcodegen.h"

namespace BQ {

qr_Matrix::qr_Matrix(int size, FunctionRef<bool(int x, int y)> func)
    : size(size)
{
    BQ_ASSERT(size > 0);

    modules.Reserve((Size)size * size);

    for (int y = 0; y < size; y++) {
        for (int x = 0; x < size; x++) {
            modules.Append(func(x, y));
        }
    }
}

bool qr_Matrix::Clear(int x, int y)
{
    if (x < 0 || x >= size || y < 0 || y >= size)
        return false;

    bool &module = modules[(Size)y * size + x];
    bool active = module;

    module = false;
    return active;
}

Size qr_Matrix::CountActive() const
{
    Size count = 0;
    for (bool module: modules) {
        count += module;
    }
    return count;
}

static qrcodegen_Ecc ConvertEcc(qr_ErrorCorrection ecc)
{
    switch (ecc) {
        case qr_ErrorCorrection::Low: return qrcodegen_Ecc_LOW;
        case qr_ErrorCorrection::Medium: return qrcodegen_Ecc_MEDIUM;
        case qr_ErrorCorrection::Quartile: return qrcodegen_Ecc_QUARTILE;
        case qr_ErrorCorrection::High: return qrcodegen_Ecc_HIGH;
    }

    BQ_UNREACHABLE();
}

qr_EncodeResult qr_EncodeText(Span<const char> text, int version, qr_ErrorCorrection ecc, qr_Matrix *out_matrix)
{
    if (!qr_IsVersionValid(version)) {
        LogError("Unknown QR version %1 (must be between %2 and %3)", version, qr_VersionMin, qr_VersionMax);
        return qr_EncodeResult::UnknownVersion;
    }

    uint8_t qr[qrcodegen_BUFFER_LEN_MAX];
    uint8_t tmp[qrcodegen_BUFFER_LEN_MAX];
    static_assert(qrcodegen_BUFFER_LEN_MAX < Kibibytes(8));

    // qrcodegen stops at the first NUL byte
    if (text.len && memchr(text.ptr, 0, (size_t)text.len)) [[unlikely]] {
        LogError("Cannot encode text containing NUL bytes");
        return qr_EncodeResult::InvalidText;
    }

    // The payload can never fit if it does not fit the temporary buffer
    if (text.len >= BQ_SIZE(tmp)) [[unlikely]] {
        LogError("Cannot encode %1 bytes with QR version %2 (level %3)",
                 text.len, version, qr_ErrorCorrectionNames[(int)ecc]);
        return qr_EncodeResult::DataOverflow;
    }

    // qrcodegen wants a NUL-terminated string
    HeapArray<char> str;
    str.Append(text);
    str.Append('\0');

    // The version is fixed and the error correction level is never boosted, so the
    // same settings always produce a symbol with the same geometry.
    bool success = qrcodegen_encodeText(str.ptr, tmp, qr, ConvertEcc(ecc),
                                        version, version, qrcodegen_Mask_AUTO, false);
    if (!success) {
        LogError("Cannot encode %1 bytes with QR version %2 (level %3), use a larger version or a lower error correction level",
                 text.len, version, qr_ErrorCorrectionNames[(int)ecc]);
        return qr_EncodeResult::DataOverflow;
    }

    int size = qrcodegen_getSize(qr);
    BQ_ASSERT(size == qr_ModulesForVersion(version));

    *out_matrix = qr_Matrix(size, [&](int x, int y) { return qrcodegen_getModule(qr, x, y); });
    return qr_EncodeResult::Success;
}

}
