// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "base.hh"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace BQ {

// ------------------------------------------------------------------------
// Utility
// ------------------------------------------------------------------------

extern "C" void AssertMessage(const char *filename, int line, const char *cond)
{
    PrintLn(stderr, "%1:%2: Assertion '%3' failed", filename, line, cond);
}

// ------------------------------------------------------------------------
// Memory / Allocator
// ------------------------------------------------------------------------

class MallocAllocator: public Allocator {
protected:
    void *Allocate(Size size, unsigned int flags) override
    {
        void *ptr = malloc((size_t)size);
        BQ_CRITICAL(ptr || !size, "Failed to allocate %1 bytes of memory", size);

        if (flags & (int)AllocFlag::Zero) {
            MemSet(ptr, 0, size);
        }

        return ptr;
    }

    void *Resize(void *ptr, Size old_size, Size new_size, unsigned int flags) override
    {
        if (!new_size) {
            Release(ptr, old_size);
            ptr = nullptr;
        } else {
            void *new_ptr = realloc(ptr, (size_t)new_size);
            BQ_CRITICAL(new_ptr, "Failed to resize %1 bytes memory block to %2", old_size, new_size);

            if ((flags & (int)AllocFlag::Zero) && new_size > old_size) {
                MemSet((uint8_t *)new_ptr + old_size, 0, new_size - old_size);
            }

            ptr = new_ptr;
        }

        return ptr;
    }

    void Release(const void *ptr, Size) override
    {
        free((void *)ptr);
    }
};

Allocator *GetDefaultAllocator()
{
    static Allocator *default_allocator = new MallocAllocator;
    return default_allocator;
}

static inline Size AlignLen(Size len, Size align)
{
    return (len + align - 1) / align * align;
}

BlockAllocator& BlockAllocator::operator=(BlockAllocator &&other)
{
    ReleaseAll();

    block_size = other.block_size;
    buckets = other.buckets;
    last_alloc = other.last_alloc;

    other.buckets = nullptr;
    other.last_alloc = nullptr;

    return *this;
}

void BlockAllocator::ReleaseAll()
{
    Bucket *bucket = buckets;

    while (bucket) {
        Bucket *next = bucket->next;
        free(bucket);
        bucket = next;
    }

    buckets = nullptr;
    last_alloc = nullptr;
}

BlockAllocator::Bucket *BlockAllocator::AddBucket(Size capacity)
{
    Bucket *bucket = (Bucket *)malloc((size_t)(BQ_SIZE(Bucket) + capacity));
    BQ_CRITICAL(bucket, "Failed to allocate %1 bytes of memory", capacity);

    bucket->used = 0;
    bucket->capacity = capacity;

    // Keep the current bucket first, large separate buckets go behind it
    if (buckets && capacity > block_size) {
        bucket->next = buckets->next;
        buckets->next = bucket;
    } else {
        bucket->next = buckets;
        buckets = bucket;
    }

    return bucket;
}

void *BlockAllocator::Allocate(Size size, unsigned int flags)
{
    BQ_ASSERT(size >= 0);

    // Keep alignement requirements
    Size aligned_size = AlignLen(size, 8);

    uint8_t *ptr;
    if (aligned_size > block_size / 2) {
        Bucket *bucket = AddBucket(aligned_size);
        bucket->used = aligned_size;

        ptr = bucket->data;
    } else {
        Bucket *bucket = buckets;

        if (!bucket || bucket->capacity > block_size || bucket->used + aligned_size > bucket->capacity) {
            bucket = AddBucket(block_size);
        }

        ptr = bucket->data + bucket->used;
        bucket->used += aligned_size;

        last_alloc = ptr;
    }

    if (flags & (int)AllocFlag::Zero) {
        MemSet(ptr, 0, size);
    }

    return ptr;
}

void *BlockAllocator::Resize(void *ptr, Size old_size, Size new_size, unsigned int flags)
{
    BQ_ASSERT(old_size >= 0);
    BQ_ASSERT(new_size >= 0);

    if (!ptr) {
        old_size = 0;
    }

    Size aligned_old_size = AlignLen(old_size, 8);
    Size aligned_new_size = AlignLen(new_size, 8);
    Size aligned_delta = aligned_new_size - aligned_old_size;

    // Try fast path
    if (ptr && ptr == last_alloc && buckets->used + aligned_delta <= buckets->capacity &&
            aligned_new_size <= block_size / 2) {
        buckets->used += aligned_delta;

        if ((flags & (int)AllocFlag::Zero) && new_size > old_size) {
            MemSet((uint8_t *)ptr + old_size, 0, new_size - old_size);
        }

        return ptr;
    }

    void *new_ptr = Allocate(new_size, flags & ~(int)AllocFlag::Zero);

    if (new_size > old_size) {
        MemCpy(new_ptr, ptr, old_size);

        if (flags & (int)AllocFlag::Zero) {
            MemSet((uint8_t *)new_ptr + old_size, 0, new_size - old_size);
        }
    } else {
        MemCpy(new_ptr, ptr, new_size);
    }

    return new_ptr;
}

void BlockAllocator::Release(const void *ptr, Size size)
{
    BQ_ASSERT(size >= 0);

    if (ptr && ptr == last_alloc) {
        buckets->used -= AlignLen(size, 8);
        last_alloc = nullptr;
    }
}

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

bool CopyString(const char *str, Span<char> buf)
{
    BQ_ASSERT(buf.len > 0);

    Size i = 0;
    for (; str[i]; i++) {
        if (i >= buf.len - 1) [[unlikely]] {
            buf[buf.len - 1] = 0;
            return false;
        }
        buf[i] = str[i];
    }
    buf[i] = 0;

    return true;
}

bool CopyString(Span<const char> str, Span<char> buf)
{
    BQ_ASSERT(buf.len > 0);

    if (str.len > buf.len - 1) [[unlikely]] {
        MemCpy(buf.ptr, str.ptr, buf.len - 1);
        buf[buf.len - 1] = 0;
        return false;
    }

    MemCpy(buf.ptr, str.ptr, str.len);
    buf[str.len] = 0;

    return true;
}

Span<char> DuplicateString(Span<const char> str, Allocator *alloc)
{
    BQ_ASSERT(alloc);

    char *new_str = (char *)AllocateRaw(alloc, str.len + 1);
    MemCpy(new_str, str.ptr, str.len);
    new_str[str.len] = 0;
    return MakeSpan(new_str, str.len);
}

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

static Span<const char> FormatUnsignedToDecimal(uint64_t value, char out_buf[32])
{
    Size offset = 32;
    do {
        out_buf[--offset] = (char)('0' + (value % 10));
        value /= 10;
    } while (value);

    return MakeSpan(out_buf + offset, 32 - offset);
}

static Span<const char> FormatDouble(double value, int min_prec, int max_prec, char out_buf[128])
{
    int prec = std::clamp(max_prec, 0, 16);
    int len = snprintf(out_buf, 128, "%.*f", prec, value);

    if (len < 0 || len >= 128) [[unlikely]]
        return "?";

    // Strip trailing zeros beyond the minimum precision
    if (prec > min_prec) {
        const char *dot = strchr(out_buf, '.');

        if (dot) {
            Size keep = (Size)(dot - out_buf) + 1 + min_prec;

            while (len > keep && out_buf[len - 1] == '0') {
                len--;
            }
            if (len && out_buf[len - 1] == '.') {
                len--;
            }
        }
    }

    return MakeSpan(out_buf, (Size)len);
}

template <typename AppendFunc>
static inline void AppendPad(Size pad, char padding, AppendFunc append)
{
    for (Size i = 0; i < pad; i++) {
        append(MakeSpan(&padding, 1));
    }
}

template <typename AppendFunc>
static inline void ProcessArg(const FmtArg &arg, AppendFunc append)
{
    switch (arg.type) {
        case FmtType::Str: { append(arg.u.str); } break;

        case FmtType::PadStr: {
            append(arg.u.str);
            AppendPad(arg.pad - arg.u.str.len, arg.padding, append);
        } break;

        case FmtType::Char: { append(MakeSpan(&arg.u.ch, 1)); } break;
        case FmtType::Bool: { append(arg.u.b ? "true" : "false"); } break;

        case FmtType::Integer: {
            char buf[32];

            if (arg.u.i < 0) {
                Span<const char> str = FormatUnsignedToDecimal(0 - (uint64_t)arg.u.i, buf);

                append("-");
                AppendPad((Size)arg.pad - str.len - 1, arg.padding, append);
                append(str);
            } else {
                Span<const char> str = FormatUnsignedToDecimal((uint64_t)arg.u.i, buf);

                AppendPad((Size)arg.pad - str.len, arg.padding, append);
                append(str);
            }
        } break;
        case FmtType::Unsigned: {
            char buf[32];
            Span<const char> str = FormatUnsignedToDecimal(arg.u.u, buf);

            AppendPad((Size)arg.pad - str.len, arg.padding, append);
            append(str);
        } break;

        case FmtType::Double: {
            double value = arg.u.d.value;

            if (value != value) {
                append("NaN");
            } else if (value == std::numeric_limits<double>::infinity()) {
                append("Inf");
            } else if (value == -std::numeric_limits<double>::infinity()) {
                append("-Inf");
            } else {
                char buf[128];
                append(FormatDouble(value, arg.u.d.min_prec, arg.u.d.max_prec, buf));
            }
        } break;
    }
}

template <typename AppendFunc>
static inline Size ProcessAnsiSpecifier(const char *spec, bool vt100, AppendFunc append)
{
    LocalArray<char, 32> buf;
    bool valid = true;

    buf.Append("\x1B[");

    Size idx = 0;

    // Foreground color
    switch (spec[++idx]) {
        case 'd': { buf.Append("30"); } break;
        case 'r': { buf.Append("31"); } break;
        case 'g': { buf.Append("32"); } break;
        case 'y': { buf.Append("33"); } break;
        case 'b': { buf.Append("34"); } break;
        case 'm': { buf.Append("35"); } break;
        case 'c': { buf.Append("36"); } break;
        case 'w': { buf.Append("37"); } break;
        case 'D': { buf.Append("90"); } break;
        case 'R': { buf.Append("91"); } break;
        case 'G': { buf.Append("92"); } break;
        case 'Y': { buf.Append("93"); } break;
        case 'B': { buf.Append("94"); } break;
        case 'M': { buf.Append("95"); } break;
        case 'C': { buf.Append("96"); } break;
        case 'W': { buf.Append("97"); } break;
        case '.': { buf.Append("39"); } break;
        case '0': {
            buf.Append("0");
            goto end;
        } break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

    // Background color
    switch (spec[++idx]) {
        case 'd': { buf.Append(";40"); } break;
        case 'r': { buf.Append(";41"); } break;
        case 'g': { buf.Append(";42"); } break;
        case 'y': { buf.Append(";43"); } break;
        case 'b': { buf.Append(";44"); } break;
        case 'm': { buf.Append(";45"); } break;
        case 'c': { buf.Append(";46"); } break;
        case 'w': { buf.Append(";47"); } break;
        case '.': { buf.Append(";49"); } break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

    // Bold/dim/underline/invert
    switch (spec[++idx]) {
        case '+': { buf.Append(";1"); } break;
        case '-': { buf.Append(";2"); } break;
        case '_': { buf.Append(";4"); } break;
        case '^': { buf.Append(";7"); } break;
        case '.': {} break;
        case 0: {
            valid = false;
            goto end;
        } break;
        default: { valid = false; } break;
    }

end:
    if (!valid)
        return idx;

    if (vt100) {
        buf.Append("m");
        append(MakeSpan(buf.data, buf.len));
    }

    return idx;
}

template <typename AppendFunc>
static inline void DoFormat(const char *fmt, Span<const FmtArg> args, bool vt100, AppendFunc append)
{
    const char *fmt_ptr = fmt;
    for (;;) {
        // Find the next marker (or the end of string) and write everything before it
        const char *marker_ptr = fmt_ptr;
        while (marker_ptr[0] && marker_ptr[0] != '%') {
            marker_ptr++;
        }
        append(MakeSpan(fmt_ptr, (Size)(marker_ptr - fmt_ptr)));
        if (!marker_ptr[0])
            break;

        // Try to interpret this marker as a number
        Size idx = 0;
        Size idx_end = 1;
        for (;;) {
            // Unsigned cast makes the test below quicker, don't remove it or it'll break
            unsigned int digit = (unsigned int)marker_ptr[idx_end] - '0';
            if (digit > 9)
                break;
            idx = (Size)(idx * 10) + (Size)digit;
            idx_end++;
        }

        // That was indeed a number
        if (idx_end > 1) {
            idx--;
            if (idx < args.len) {
                ProcessArg(args[idx], append);
            }
            fmt_ptr = marker_ptr + idx_end;
        } else if (marker_ptr[1] == '%') {
            append("%");
            fmt_ptr = marker_ptr + 2;
        } else if (marker_ptr[1] == '/') {
            append(MakeSpan(BQ_PATH_SEPARATORS, 1));
            fmt_ptr = marker_ptr + 2;
        } else if (marker_ptr[1] == '!') {
            fmt_ptr = marker_ptr + 2 + ProcessAnsiSpecifier(marker_ptr + 1, vt100, append);
        } else if (marker_ptr[1]) {
            append(MakeSpan(marker_ptr, 1));
            fmt_ptr = marker_ptr + 1;
        } else {
            break;
        }
    }
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf)
{
    BQ_ASSERT(out_buf.len >= 0);

    if (!out_buf.len)
        return {};
    out_buf.len--;

    Size available_len = out_buf.len;

    DoFormat(fmt, args, vt100, [&](Span<const char> frag) {
        Size copy_len = std::min(frag.len, available_len);

        MemCpy(out_buf.end() - available_len, frag.ptr, copy_len);
        available_len -= copy_len;
    });

    out_buf.len -= available_len;
    out_buf.ptr[out_buf.len] = 0;

    return out_buf;
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf)
{
    Size start_len = out_buf->len;

    out_buf->Grow(BQ_FMT_STRING_BASE_CAPACITY);
    DoFormat(fmt, args, vt100, [&](Span<const char> frag) {
        out_buf->Grow(frag.len + 1);
        MemCpy(out_buf->end(), frag.ptr, frag.len);
        out_buf->len += frag.len;
    });
    out_buf->ptr[out_buf->len] = 0;

    return out_buf->Take(start_len, out_buf->len - start_len);
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Allocator *alloc)
{
    BQ_ASSERT(alloc);

    HeapArray<char> buf(alloc);
    FmtFmt(fmt, args, vt100, &buf);

    return buf.TrimAndLeak(1);
}

void PrintFmt(const char *fmt, Span<const FmtArg> args, FILE *out_fp)
{
    LocalArray<char, BQ_FMT_STRING_PRINT_BUFFER_SIZE> buf;
    DoFormat(fmt, args, FileIsVt100(out_fp), [&](Span<const char> frag) {
        if (frag.len > BQ_LEN(buf.data) - buf.len) {
            fwrite(buf.data, 1, (size_t)buf.len, out_fp);
            buf.len = 0;
        }
        if (frag.len >= BQ_LEN(buf.data)) {
            fwrite(frag.ptr, 1, (size_t)frag.len, out_fp);
        } else {
            MemCpy(buf.data + buf.len, frag.ptr, frag.len);
            buf.len += frag.len;
        }
    });
    fwrite(buf.data, 1, (size_t)buf.len, out_fp);
}

void PrintLnFmt(const char *fmt, Span<const FmtArg> args, FILE *out_fp)
{
    PrintFmt(fmt, args, out_fp);
    fputc('\n', out_fp);
}

// ------------------------------------------------------------------------
// Debug and errors
// ------------------------------------------------------------------------

static std::function<LogFunc> log_handler = DefaultLogHandler;
static bool log_vt100 = FileIsVt100(stderr);

static std::function<LogFilterFunc> *log_filters[16];
static Size log_filters_len;

const char *GetEnv(const char *name)
{
    return getenv(name);
}

static void RunLogFilter(Size idx, LogLevel level, const char *ctx, const char *msg)
{
    const std::function<LogFilterFunc> &func = *log_filters[idx];

    func(level, ctx, msg, [&](LogLevel level, const char *ctx, const char *msg) {
        if (idx > 0) {
            RunLogFilter(idx - 1, level, ctx, msg);
        } else {
            log_handler(level, ctx, msg);
        }
    });
}

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args)
{
    static bool skip = false;

    // Avoid deadlock if a log filter or the handler tries to log something while handling a previous call
    if (skip)
        return;
    skip = true;
    BQ_DEFER { skip = false; };

    char msg_buf[2048];
    {
        Size len = FmtFmt(fmt, args, log_vt100, msg_buf).len;

        if (len == BQ_SIZE(msg_buf) - 1) {
            strncpy(msg_buf + BQ_SIZE(msg_buf) - 32, "... [truncated]", 32);
            msg_buf[BQ_SIZE(msg_buf) - 1] = 0;
        }
    }

    if (log_filters_len) {
        RunLogFilter(log_filters_len - 1, level, ctx, msg_buf);
    } else {
        log_handler(level, ctx, msg_buf);
    }
}

void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg)
{
    switch (level)  {
        case LogLevel::Debug:
        case LogLevel::Info: { Print(stderr, "%!D..%1%!0%2\n", ctx ? ctx : "", msg); } break;
        case LogLevel::Warning: { Print(stderr, "%!M..%1%!0%2\n", ctx ? ctx : "", msg); } break;
        case LogLevel::Error: { Print(stderr, "%!R..%1%!0%2\n", ctx ? ctx : "", msg); } break;
    }

    fflush(stderr);
}

void PushLogFilter(const std::function<LogFilterFunc> &func)
{
    BQ_ASSERT(log_filters_len < BQ_LEN(log_filters));
    log_filters[log_filters_len++] = new std::function<LogFilterFunc>(func);
}

void PopLogFilter()
{
    BQ_ASSERT(log_filters_len > 0);
    delete log_filters[--log_filters_len];
}

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

Span<const char> GetPathDirectory(Span<const char> filename)
{
    Span<const char> directory;
    SplitStrReverseAny(filename, BQ_PATH_SEPARATORS, &directory);

    return directory.len ? directory : ".";
}

bool TestFile(const char *filename)
{
    struct stat sb;
    return !stat(filename, &sb) && S_ISREG(sb.st_mode);
}

bool UnlinkFile(const char *filename, bool error_if_missing)
{
    if (unlink(filename) < 0) {
        if (errno == ENOENT && !error_if_missing)
            return true;

        LogError("Failed to remove file '%1': %2", filename, strerror(errno));
        return false;
    }

    return true;
}

bool RenameFile(const char *src_filename, const char *dest_filename)
{
    if (rename(src_filename, dest_filename) < 0) {
        LogError("Failed to rename '%1' to '%2': %3", src_filename, dest_filename, strerror(errno));
        return false;
    }

    return true;
}

bool FileIsVt100(FILE *fp)
{
    static int cache[3] = { -1, -1, -1 };

    int fd = fileno(fp);
    if (fd < 0 || fd > 2)
        return false;

    if (cache[fd] < 0) {
        const char *term = GetEnv("TERM");
        bool vt100 = isatty(fd) && !(term && TestStr(term, "dumb")) && !GetEnv("NO_COLOR");

        cache[fd] = vt100;
    }

    return cache[fd];
}

const char *GetTemporaryDirectory()
{
    static char temp_dir[4096];

    if (!temp_dir[0]) {
        Span<const char> env = GetEnv("TMPDIR");

        while (env.len > 0 && IsPathSeparator(env[env.len - 1])) {
            env.len--;
        }

        if (env.len && env.len < BQ_SIZE(temp_dir)) {
            CopyString(env, temp_dir);
        } else {
            CopyString("/tmp", temp_dir);
        }
    }

    return temp_dir;
}

static void FmtRandomName(Size len, HeapArray<char> *out_buf)
{
    static const char Chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";

    uint8_t raw[32];
    BQ_ASSERT(len <= BQ_SIZE(raw));

    if (getentropy(raw, (size_t)len) < 0) {
        // Fall back to a weak source, collisions are handled by the caller
        for (Size i = 0; i < len; i++) {
            raw[i] = (uint8_t)rand();
        }
    }

    for (Size i = 0; i < len; i++) {
        out_buf->Append(Chars[raw[i] % (BQ_SIZE(Chars) - 1)]);
    }
}

const char *CreateUniqueFile(Span<const char> directory, const char *prefix, const char *extension,
                             Allocator *alloc)
{
    BQ_ASSERT(alloc);

    HeapArray<char> filename(alloc);
    filename.Append(directory);
    filename.Append(*BQ_PATH_SEPARATORS);
    if (prefix) {
        filename.Append(prefix);
        filename.Append('.');
    }

    Size change_offset = filename.len;

    for (Size i = 0; i < 1000; i++) {
        filename.RemoveFrom(change_offset);
        FmtRandomName(24, &filename);
        filename.Append(Span<const char>(extension));
        filename.Grow(1);
        filename.ptr[filename.len] = 0;

        int fd = open(filename.ptr, O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);

        if (fd >= 0) {
            close(fd);

            const char *ret = filename.TrimAndLeak(1).ptr;
            return ret;
        }
        if (errno != EEXIST) {
            LogError("Failed to create temporary file in '%1': %2", directory, strerror(errno));
            return nullptr;
        }
    }

    LogError("Failed to create unique file in '%1'", directory);
    return nullptr;
}

template <typename T>
static Size ReadFileImpl(const char *filename, Size max_len, HeapArray<T> *out_buf)
{
    int fd = open(filename, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        LogError("Cannot open '%1': %2", filename, strerror(errno));
        return -1;
    }
    BQ_DEFER { close(fd); };

    Size start_len = out_buf->len;
    BQ_DEFER_N(buf_guard) { out_buf->RemoveFrom(start_len); };

    struct stat sb;
    if (!fstat(fd, &sb) && S_ISREG(sb.st_mode)) {
        if (max_len >= 0 && sb.st_size > max_len) {
            LogError("File '%1' is too large (limit = %2 bytes)", filename, max_len);
            return -1;
        }
        out_buf->Grow((Size)sb.st_size);
    }

    for (;;) {
        out_buf->Grow(Kibibytes(16));

        ssize_t bytes = read(fd, out_buf->end(), (size_t)out_buf->Available());

        if (bytes < 0) {
            if (errno == EINTR)
                continue;

            LogError("Error while reading file '%1': %2", filename, strerror(errno));
            return -1;
        }
        if (!bytes)
            break;

        out_buf->len += (Size)bytes;

        if (max_len >= 0 && out_buf->len - start_len > max_len) {
            LogError("File '%1' is too large (limit = %2 bytes)", filename, max_len);
            return -1;
        }
    }

    buf_guard.Disable();
    return out_buf->len - start_len;
}

Size ReadFile(const char *filename, Size max_len, HeapArray<uint8_t> *out_buf)
    { return ReadFileImpl(filename, max_len, out_buf); }
Size ReadFile(const char *filename, Size max_len, HeapArray<char> *out_buf)
    { return ReadFileImpl(filename, max_len, out_buf); }

static bool WriteDescriptor(int fd, Span<const uint8_t> buf, const char *filename)
{
    while (buf.len) {
        ssize_t written = write(fd, buf.ptr, (size_t)buf.len);

        if (written < 0) {
            if (errno == EINTR)
                continue;

            LogError("Failed to write to '%1': %2", filename, strerror(errno));
            return false;
        }

        buf.ptr += written;
        buf.len -= (Size)written;
    }

    return true;
}

bool WriteFile(Span<const uint8_t> buf, const char *filename, unsigned int flags)
{
    BlockAllocator temp_alloc;

    const char *dest_filename = filename;
    const char *write_filename = filename;

    if (flags & (int)WriteFlag::Atomic) {
        Span<const char> directory = GetPathDirectory(filename);
        Span<const char> basename = SplitStrReverseAny(filename, BQ_PATH_SEPARATORS);
        const char *prefix = DuplicateString(basename, &temp_alloc).ptr;

        write_filename = CreateUniqueFile(directory, prefix, ".tmp", &temp_alloc);
        if (!write_filename)
            return false;
    }

    bool success = false;
    BQ_DEFER {
        if (!success && write_filename != dest_filename) {
            unlink(write_filename);
        }
    };

    int fd = open(write_filename, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        LogError("Cannot open '%1': %2", write_filename, strerror(errno));
        return false;
    }

    if (!WriteDescriptor(fd, buf, write_filename)) {
        close(fd);
        return false;
    }
    if (fsync(fd) < 0 && errno != EINVAL) {
        LogError("Failed to sync '%1': %2", write_filename, strerror(errno));
        close(fd);
        return false;
    }
    if (close(fd) < 0) {
        LogError("Failed to close '%1': %2", write_filename, strerror(errno));
        return false;
    }

    if (write_filename != dest_filename && !RenameFile(write_filename, dest_filename))
        return false;

    success = true;
    return true;
}

// ------------------------------------------------------------------------
// Main
// ------------------------------------------------------------------------

void InitApp()
{
    // Make sure the default log handler output is not interleaved with buffered stdout
    setvbuf(stdout, nullptr, _IOLBF, 0);
}

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

bool ParseDouble(Span<const char> str, double *out_value, unsigned int flags, Span<const char> *out_remaining)
{
    char buf[128];
    if (!str.len || str.len >= BQ_SIZE(buf)) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Malformed decimal number '%1'", str);
        }
        return false;
    }
    CopyString(str, buf);

    // strtod() accepts things (hexadecimal, inf, leading whitespace) we don't want
    for (Size i = 0; i < str.len; i++) {
        char c = str[i];

        if (!IsAsciiDigit(c) && c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
            if (!i || (flags & (int)ParseFlag::End)) {
                if (flags & (int)ParseFlag::Log) {
                    LogError("Malformed decimal number '%1'", str);
                }
                return false;
            }

            buf[i] = 0;
            break;
        }
    }

    char *end;
    errno = 0;
    double value = strtod(buf, &end);

    if (end == buf || errno == ERANGE) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Malformed decimal number '%1'", str);
        }
        return false;
    }
    if ((flags & (int)ParseFlag::End) && *end) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Malformed decimal number '%1'", str);
        }
        return false;
    }

    Size consumed = (Size)(end - buf);

    *out_value = value;
    if (out_remaining) {
        *out_remaining = str.Take(consumed, str.len - consumed);
    }
    return true;
}

// ------------------------------------------------------------------------
// INI
// ------------------------------------------------------------------------

IniParser::IniParser(Span<const char> text, const char *filename)
    : filename(filename)
{
    this->text.Append(text);
    this->text.Grow(1);
    this->text.ptr[this->text.len] = 0;

    remain = this->text;
}

void IniParser::PushLogFilter()
{
    BQ::PushLogFilter([this](LogLevel level, const char *, const char *msg, FunctionRef<LogFunc> func) {
        char ctx[1024];

        if (line_number > 0) {
            Fmt(ctx, "%1(%2): ", filename, line_number);
        } else {
            Fmt(ctx, "%1: ", filename);
        }

        func(level, ctx, msg);
    });
}

IniParser::LineType IniParser::FindNextLine(IniProperty *out_prop)
{
    if (error) [[unlikely]]
        return LineType::Exit;

    BQ_DEFER_N(err_guard) { error = true; };

    while (remain.len) {
        Span<char> line = SplitStrLine(remain, &remain);
        line_number++;

        line = TrimStr(line);

        if (!line.len || line[0] == ';' || line[0] == '#') {
            // Ignore this line (empty or comment)
        } else if (line[0] == '[') {
            if (line.len < 2 || line[line.len - 1] != ']') {
                LogError("Malformed [section] line");
                return LineType::Exit;
            }

            Span<const char> section = TrimStr(line.Take(1, line.len - 2));
            if (!section.len) {
                LogError("Empty section name");
                return LineType::Exit;
            }

            current_section.RemoveFrom(0);
            current_section.Grow(section.len + 1);
            current_section.Append(section);
            current_section.ptr[current_section.len] = 0;

            err_guard.Disable();
            return LineType::Section;
        } else {
            Span<char> value;

            Span<char> key = TrimStr(SplitStr(line, '=', &value));
            if (!key.len || key.end() == line.end()) {
                LogError("Expected [section] or <key> = <value> pair");
                return LineType::Exit;
            }
            key.ptr[key.len] = 0;

            value = TrimStr(value);
            *value.end() = 0;

            out_prop->section = current_section;
            out_prop->key = key;
            out_prop->value = value;

            err_guard.Disable();
            return LineType::KeyValue;
        }
    }

    eof = true;

    err_guard.Disable();
    return LineType::Exit;
}

bool IniParser::Next(IniProperty *out_prop)
{
    LineType type;
    while ((type = FindNextLine(out_prop)) == LineType::Section);
    return type == LineType::KeyValue;
}

bool IniParser::NextInSection(IniProperty *out_prop)
{
    LineType type = FindNextLine(out_prop);
    return type == LineType::KeyValue;
}

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

static inline bool IsOption(const char *arg)
{
    return arg[0] == '-' && arg[1];
}

static inline bool IsLongOption(const char *arg)
{
    return arg[0] == '-' && arg[1] == '-' && arg[2];
}

static inline bool IsDashDash(const char *arg)
{
    return arg[0] == '-' && arg[1] == '-' && !arg[2];
}

const char *OptionParser::Next()
{
    current_option = nullptr;
    current_value = nullptr;
    test_failed = false;

    // Support aggregate short options, such as '-fbar'. Note that this can also be
    // parsed as the short option '-f' with value 'bar', if the user calls
    // ConsumeValue() after getting '-f'.
    if (smallopt_offset) {
        const char *opt = args[pos];

        buf[1] = opt[smallopt_offset];
        current_option = buf;

        if (!opt[++smallopt_offset]) {
            smallopt_offset = 0;
            pos++;
        }

        return current_option;
    }

    if (mode == OptionMode::Stop && (pos >= limit || !IsOption(args[pos]))) {
        limit = pos;
        return nullptr;
    }

    // Skip non-options, do the permutation once we reach an option or the last argument
    Size next_index = pos;
    while (next_index < limit && !IsOption(args[next_index])) {
        next_index++;
    }
    if (mode == OptionMode::Rotate) {
        std::rotate(args.ptr + pos, args.ptr + next_index, args.end());
        limit -= (next_index - pos);
    } else if (mode == OptionMode::Skip) {
        pos = next_index;
    }
    if (pos >= limit)
        return nullptr;

    const char *opt = args[pos];

    if (IsLongOption(opt)) {
        const char *needle = strchr(opt, '=');
        if (needle) {
            // We can reorder args, but we don't want to change strings. So copy the
            // option up to '=' in our buffer. And store the part after '=' as the
            // current value.
            Size len = needle - opt;
            if (len > BQ_SIZE(buf) - 1) {
                len = BQ_SIZE(buf) - 1;
            }
            MemCpy(buf, opt, len);
            buf[len] = 0;
            current_option = buf;
            current_value = needle + 1;
        } else {
            current_option = opt;
        }
        pos++;
    } else if (IsDashDash(opt)) {
        // We may have previously moved non-options to the end of args. For example,
        // at this point 'a b c -- d e' is reordered to '-- d e a b c'. Fix it.
        std::rotate(args.ptr + pos + 1, args.ptr + limit, args.end());
        limit = pos;
        pos++;
    } else if (opt[2]) {
        // We either have aggregated short options or one short option with a value,
        // depending on whether or not the user calls ConsumeValue().
        buf[0] = '-';
        buf[1] = opt[1];
        buf[2] = 0;
        current_option = buf;
        smallopt_offset = opt[2] ? 2 : 0;

        if (mode == OptionMode::Skip) {
            ConsumeValue();
        }
    } else {
        current_option = opt;
        pos++;
    }

    return current_option;
}

const char *OptionParser::ConsumeValue()
{
    if (current_value)
        return current_value;

    // Support '-fbar' where bar is the value, but only for the first short option
    // if it's an aggregate.
    if (smallopt_offset == 2 && args[pos][2]) {
        smallopt_offset = 0;
        current_value = args[pos] + 2;
        pos++;
    // Support '-f bar' and '--foo bar', see Next() for '--foo=bar'
    } else if (current_option != buf && pos < limit && !IsOption(args[pos])) {
        current_value = args[pos];
        pos++;
    }

    return current_value;
}

const char *OptionParser::ConsumeNonOption()
{
    if (pos == args.len)
        return nullptr;
    // Beyond limit there are only non-options, the limit is moved when we move non-options
    // to the end or upon encountering a double dash '--'.
    if (pos < limit && IsOption(args[pos]))
        return nullptr;

    return args[pos++];
}

bool OptionParser::Test(const char *test1, const char *test2, OptionType type)
{
    BQ_ASSERT(test1 && IsOption(test1));
    BQ_ASSERT(!test2 || IsOption(test2));

    if (TestStr(test1, current_option) || (test2 && TestStr(test2, current_option))) {
        switch (type) {
            case OptionType::NoValue: {
                if (current_value) {
                    LogError("Option '%1' does not support values", current_option);
                    test_failed = true;
                    return false;
                }
            } break;
            case OptionType::Value: {
                if (!ConsumeValue()) {
                    LogError("Option '%1' requires a value", current_option);
                    test_failed = true;
                    return false;
                }
            } break;
            case OptionType::OptionalValue: {
                ConsumeValue();
            } break;
        }

        return true;
    } else {
        return false;
    }
}

void OptionParser::LogUnknownError() const
{
    if (!TestHasFailed()) {
        LogError("Unknown option '%1'", current_option);
    }
}

void OptionParser::LogUnusedArguments() const
{
    if (pos < args.len) {
       LogWarning("Unused command-line arguments");
    }
}

// ------------------------------------------------------------------------
// Console prompter
// ------------------------------------------------------------------------

const char *Prompt(const char *prompt, const char *default_value, Allocator *alloc)
{
    BQ_ASSERT(alloc);

    if (default_value && default_value[0]) {
        Print(stdout, "%!..+%1%!0 [%2]: ", prompt, default_value);
    } else {
        Print(stdout, "%!..+%1%!0: ", prompt);
    }
    fflush(stdout);

    HeapArray<char> line(alloc);
    for (;;) {
        char buf[512];

        if (!fgets(buf, BQ_SIZE(buf), stdin)) {
            if (ferror(stdin)) {
                LogError("Failed to read from standard input: %1", strerror(errno));
                return nullptr;
            }
            if (!line.len)
                return nullptr;
            break;
        }

        Size len = (Size)strlen(buf);
        line.Append(MakeSpan((const char *)buf, len));

        if (len && buf[len - 1] == '\n')
            break;
    }

    Span<const char> answer = TrimStr(line.Take(), "\r\n");

    if (!answer.len && default_value)
        return default_value;

    const char *ret = DuplicateString(answer, alloc).ptr;
    return ret;
}

// ------------------------------------------------------------------------
// Checksums
// ------------------------------------------------------------------------

static constexpr auto Crc32Table = []() {
    struct { uint32_t values[256]; } table = {};

    for (uint32_t i = 0; i < 256; i++) {
        uint32_t c = i;

        for (int k = 0; k < 8; k++) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }

        table.values[i] = c;
    }

    return table;
}();

uint32_t CRC32(uint32_t state, Span<const uint8_t> buf)
{
    state = ~state;

    Size right = buf.len & (BQ_SIZE_MAX - 3);

    for (Size i = 0; i < right; i += 4) {
        state = (state >> 8) ^ Crc32Table.values[(state ^ buf[i + 0]) & 0xFF];
        state = (state >> 8) ^ Crc32Table.values[(state ^ buf[i + 1]) & 0xFF];
        state = (state >> 8) ^ Crc32Table.values[(state ^ buf[i + 2]) & 0xFF];
        state = (state >> 8) ^ Crc32Table.values[(state ^ buf[i + 3]) & 0xFF];
    }
    for (Size i = right; i < buf.len; i++) {
        state = (state >> 8) ^ Crc32Table.values[(state ^ buf[i]) & 0xFF];
    }

    return ~state;
}

}
