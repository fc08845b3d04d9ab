// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "image.hh"

BQ_PUSH_NO_WARNINGS
#define STBI_NO_STDIO
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"
#include "miniz.h"
BQ_POP_NO_WARNINGS

namespace BQ {

bool img_Allocate(int width, int height, int channels, img_Image *out_image)
{
    BQ_ASSERT(channels == 3 || channels == 4);

    if (width <= 0 || height <= 0 || width > img_MaxDimension || height > img_MaxDimension) [[unlikely]] {
        LogError("Invalid image size %1x%2 (max = %3)", width, height, img_MaxDimension);
        return false;
    }

    Size len = (Size)width * height * channels;

    out_image->width = width;
    out_image->height = height;
    out_image->channels = channels;
    out_image->pixels.RemoveFrom(0);
    out_image->pixels.Reserve(len);
    out_image->pixels.len = len;

    return true;
}

img_LoadResult img_LoadFile(const char *filename, img_Image *out_image)
{
    if (!TestFile(filename)) {
        LogError("Image file '%1' does not exist", filename);
        return img_LoadResult::MissingFile;
    }

    HeapArray<uint8_t> data;
    if (ReadFile(filename, Mebibytes(64), &data) < 0)
        return img_LoadResult::DecodeError;

    if (!img_DecodeMemory(data, filename, out_image))
        return img_LoadResult::DecodeError;

    return img_LoadResult::Success;
}

bool img_DecodeMemory(Span<const uint8_t> data, const char *name, img_Image *out_image)
{
    if (data.len > INT_MAX) [[unlikely]] {
        LogError("Image '%1' is too big", name);
        return false;
    }

    int width, height, channels;
    uint8_t *img = stbi_load_from_memory(data.ptr, (int)data.len, &width, &height, &channels, 4);
    if (!img) {
        LogError("Failed to decode image '%1': %2", name, stbi_failure_reason());
        return false;
    }
    BQ_DEFER { stbi_image_free(img); };

    if (!img_Allocate(width, height, 4, out_image))
        return false;
    MemCpy(out_image->pixels.ptr, img, out_image->pixels.len);

    return true;
}

bool img_Resize(const img_Image &src, int width, int height, img_Image *out_image)
{
    BQ_ASSERT(&src != out_image);

    if (!img_Allocate(width, height, src.channels, out_image))
        return false;

    stbir_pixel_layout layout = src.HasAlpha() ? STBIR_RGBA : STBIR_RGB;

    // Work on raw 8-bit values (no sRGB linearization), with a Mitchell filter
    // for both upsampling and downsampling
    STBIR_RESIZE resize;
    stbir_resize_init(&resize, src.pixels.ptr, src.width, src.height, (int)src.GetStride(),
                      out_image->pixels.ptr, width, height, (int)out_image->GetStride(),
                      layout, STBIR_TYPE_UINT8);
    stbir_set_edgemodes(&resize, STBIR_EDGE_CLAMP, STBIR_EDGE_CLAMP);
    stbir_set_filters(&resize, STBIR_FILTER_MITCHELL, STBIR_FILTER_MITCHELL);

    if (!stbir_resize_extended(&resize)) {
        LogError("Failed to resize image from %1x%2 to %3x%4", src.width, src.height, width, height);
        return false;
    }

    return true;
}

bool img_Crop(const img_Image &src, int left, int top, int width, int height, img_Image *out_image)
{
    BQ_ASSERT(&src != out_image);

    if (left < 0 || top < 0 || width <= 0 || height <= 0 ||
            left > src.width - width || top > src.height - height) [[unlikely]] {
        LogError("Crop rectangle %1x%2+%3+%4 is outside %5x%6 image", width, height, left, top,
                 src.width, src.height);
        return false;
    }

    if (!img_Allocate(width, height, src.channels, out_image))
        return false;

    Size row_len = out_image->GetStride();
    for (int y = 0; y < height; y++) {
        MemCpy(out_image->GetPixel(0, y), src.GetPixel(left, top + y), row_len);
    }

    return true;
}

void img_Truncate(img_Image *image, int width, int height)
{
    BQ_ASSERT(width > 0 && width <= image->width);
    BQ_ASSERT(height > 0 && height <= image->height);

    if (width == image->width && height == image->height)
        return;

    Size src_stride = image->GetStride();
    Size dest_stride = (Size)width * image->channels;

    // First row never moves
    for (int y = 1; y < height; y++) {
        MemMove(image->pixels.ptr + y * dest_stride, image->pixels.ptr + y * src_stride, dest_stride);
    }

    image->width = width;
    image->height = height;
    image->pixels.RemoveFrom((Size)height * dest_stride);
}

bool img_EncodePng(const img_Image &image, HeapArray<uint8_t> *out_buf)
{
    static const uint8_t PngHeader[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    static const uint8_t PngFooter[] = { 0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82 };

    BQ_ASSERT(image.channels == 3 || image.channels == 4);
    BQ_ASSERT(image.pixels.len == (Size)image.width * image.height * image.channels);

    Size start_len = out_buf->len;
    BQ_DEFER_N(out_guard) { out_buf->RemoveFrom(start_len); };

    out_buf->Append(PngHeader);

#pragma pack(push, 1)
    struct ChunkHeader {
        uint32_t len;
        uint8_t type[4];
    };
    struct IHDR {
        uint32_t width;
        uint32_t height;
        uint8_t bit_depth;
        uint8_t color_type;
        uint8_t compression;
        uint8_t filter;
        uint8_t interlace;
    };
#pragma pack(pop)

    // Write IHDR chunk
    {
        ChunkHeader chunk = {};
        IHDR ihdr = {};

        chunk.len = BigEndian((uint32_t)BQ_SIZE(ihdr));
        MemCpy(chunk.type, "IHDR", 4);
        ihdr.width = BigEndian((uint32_t)image.width);
        ihdr.height = BigEndian((uint32_t)image.height);
        ihdr.bit_depth = 8;
        ihdr.color_type = image.HasAlpha() ? 6 : 2;
        ihdr.compression = 0;
        ihdr.filter = 0;
        ihdr.interlace = 0;

        uint32_t crc32 = 0;
        crc32 = CRC32(crc32, MakeSpan((const uint8_t *)&chunk + 4, BQ_SIZE(chunk) - 4));
        crc32 = CRC32(crc32, MakeSpan((const uint8_t *)&ihdr, BQ_SIZE(ihdr)));
        crc32 = BigEndian(crc32);

        out_buf->Append(MakeSpan((const uint8_t *)&chunk, BQ_SIZE(chunk)));
        out_buf->Append(MakeSpan((const uint8_t *)&ihdr, BQ_SIZE(ihdr)));
        out_buf->Append(MakeSpan((const uint8_t *)&crc32, 4));
    }

    // Write image data (IDAT)
    {
        Size chunk_offset = out_buf->len;

        ChunkHeader chunk = {};
        chunk.len = 0; // Unknown for now
        MemCpy(chunk.type, "IDAT", 4);
        out_buf->Append(MakeSpan((const uint8_t *)&chunk, BQ_SIZE(chunk)));

        tdefl_compressor *deflator = (tdefl_compressor *)AllocateRaw(nullptr, BQ_SIZE(tdefl_compressor),
                                                                     (int)AllocFlag::Zero);
        BQ_DEFER { ReleaseRaw(nullptr, deflator, BQ_SIZE(tdefl_compressor)); };

        int flags = (int)tdefl_create_comp_flags_from_zip_params(MZ_DEFAULT_LEVEL, MZ_DEFAULT_WINDOW_BITS,
                                                                 MZ_DEFAULT_STRATEGY);

        tdefl_status status = tdefl_init(deflator, [](const void *buf, int len, void *udata) {
            HeapArray<uint8_t> *out_buf = (HeapArray<uint8_t> *)udata;
            out_buf->Append(MakeSpan((const uint8_t *)buf, (Size)len));
            return (mz_bool)1;
        }, out_buf, flags);
        if (status != TDEFL_STATUS_OKAY) {
            LogError("Failed to initialize Deflate compression for PNG image");
            return false;
        }

        HeapArray<uint8_t> scanline;
        scanline.Reserve(image.GetStride() + 1);

        for (int y = 0; y < image.height; y++) {
            scanline.RemoveFrom(0);
            scanline.Append((uint8_t)0); // Scanline filter
            scanline.Append(MakeSpan(image.GetPixel(0, y), image.GetStride()));

            status = tdefl_compress_buffer(deflator, scanline.ptr, (size_t)scanline.len, TDEFL_NO_FLUSH);
            if (status < TDEFL_STATUS_OKAY) {
                LogError("Failed to deflate PNG image data");
                return false;
            }
        }

        status = tdefl_compress_buffer(deflator, nullptr, 0, TDEFL_FINISH);
        if (status != TDEFL_STATUS_DONE) {
            LogError("Failed to end Deflate stream for PNG image");
            return false;
        }

        Size data_len = out_buf->len - chunk_offset - BQ_SIZE(ChunkHeader);

        if (data_len > INT32_MAX) [[unlikely]] {
            LogError("PNG image data is too big");
            return false;
        }

        // Fix length
        {
            uint32_t len = BigEndian((uint32_t)data_len);
            MemCpy(out_buf->ptr + chunk_offset, &len, BQ_SIZE(len));
        }

        uint32_t crc32 = 0;
        crc32 = CRC32(crc32, out_buf->Take(chunk_offset + 4, out_buf->len - chunk_offset - 4));
        crc32 = BigEndian(crc32);

        out_buf->Append(MakeSpan((const uint8_t *)&crc32, 4));
    }

    // End image (IEND)
    out_buf->Append(PngFooter);

    out_guard.Disable();
    return true;
}

bool img_SavePng(const img_Image &image, const char *filename)
{
    HeapArray<uint8_t> png;

    if (!img_EncodePng(image, &png))
        return false;
    if (!WriteFile(png, filename, (int)WriteFlag::Atomic))
        return false;

    return true;
}

}
