// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <inttypes.h>
#include <limits.h>
#include <limits>
#include <new>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <type_traits>
#include <utility>

namespace BQ {

// ------------------------------------------------------------------------
// Config
// ------------------------------------------------------------------------

#if !defined(NDEBUG)
    #define BQ_DEBUG
#endif

#define BQ_BLOCK_ALLOCATOR_DEFAULT_SIZE Kibibytes(4)

#define BQ_HEAPARRAY_BASE_CAPACITY 8
#define BQ_HEAPARRAY_GROWTH_FACTOR 2.0

#define BQ_FMT_STRING_BASE_CAPACITY 256
#define BQ_FMT_STRING_PRINT_BUFFER_SIZE 1024

// ------------------------------------------------------------------------
// Utility
// ------------------------------------------------------------------------

extern "C" const char *BuildTarget;
extern "C" const char *BuildVersion;

#if defined(__x86_64__) || defined(_M_X64) || defined(__aarch64__) || defined(_M_ARM64) || __riscv_xlen == 64
    typedef int64_t Size;
    #define BQ_SIZE_MAX INT64_MAX
#else
    typedef int32_t Size;
    #define BQ_SIZE_MAX INT32_MAX
#endif

#if defined(_MSC_VER) || __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    #define BQ_LITTLE_ENDIAN
#elif __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    #define BQ_BIG_ENDIAN
#else
    #error This code base is not designed to support platforms with crazy endianness
#endif

#if defined(_WIN32)
    #define BQ_PATH_SEPARATORS "\\/"
#else
    #define BQ_PATH_SEPARATORS "/"
#endif

#define BQ_STRINGIFY_(a) #a
#define BQ_STRINGIFY(a) BQ_STRINGIFY_(a)
#define BQ_CONCAT_(a, b) a ## b
#define BQ_CONCAT(a, b) BQ_CONCAT_(a, b)
#define BQ_UNIQUE_NAME(prefix) BQ_CONCAT(prefix, __LINE__)

#if defined(__GNUC__) || defined(__clang__)
    #define BQ_PUSH_NO_WARNINGS \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"") \
        _Pragma("GCC diagnostic ignored \"-Wconversion\"") \
        _Pragma("GCC diagnostic ignored \"-Wsign-conversion\"") \
        _Pragma("GCC diagnostic ignored \"-Wunused-function\"") \
        _Pragma("GCC diagnostic ignored \"-Wunused-parameter\"") \
        _Pragma("GCC diagnostic ignored \"-Wmissing-field-initializers\"")
    #define BQ_POP_NO_WARNINGS \
        _Pragma("GCC diagnostic pop")

    #define BQ_DEBUG_BREAK() __builtin_trap()
#elif defined(_MSC_VER)
    #define BQ_PUSH_NO_WARNINGS __pragma(warning(push, 0))
    #define BQ_POP_NO_WARNINGS __pragma(warning(pop))

    #define BQ_DEBUG_BREAK() __debugbreak()
#else
    #error Compiler not supported
#endif

extern "C" void AssertMessage(const char *filename, int line, const char *cond);

#define BQ_CRITICAL(Cond, ...) \
    do { \
        if (!(Cond)) [[unlikely]] { \
            BQ::PrintLn(stderr, __VA_ARGS__); \
            abort(); \
        } \
    } while (false)
#if defined(BQ_DEBUG)
    #define BQ_ASSERT(Cond) \
        do { \
            if (!(Cond)) [[unlikely]] { \
                BQ::AssertMessage(__FILE__, __LINE__, BQ_STRINGIFY(Cond)); \
                BQ_DEBUG_BREAK(); \
                abort(); \
            } \
        } while (false)
#else
    #define BQ_ASSERT(Cond) \
        do { \
            (void)sizeof(Cond); \
        } while (false)
#endif

#if defined(BQ_DEBUG)
    #define BQ_UNREACHABLE() \
        do { \
            BQ::AssertMessage(__FILE__, __LINE__, "Reached code marked as UNREACHABLE"); \
            BQ_DEBUG_BREAK(); \
            abort(); \
        } while (false)
#elif defined(__GNUC__) || defined(__clang__)
    #define BQ_UNREACHABLE() __builtin_unreachable()
#else
    #define BQ_UNREACHABLE() __assume(0)
#endif

#define BQ_DELETE_COPY(Cls) \
    Cls(const Cls&) = delete; \
    Cls &operator=(const Cls&) = delete;

constexpr Size Mebibytes(Size len) { return len * 1024 * 1024; }
constexpr Size Kibibytes(Size len) { return len * 1024; }

#define BQ_SIZE(Type) ((BQ::Size)sizeof(Type))
template <typename T, unsigned N>
char (&ComputeArraySize(T const (&)[N]))[N];
#define BQ_LEN(Array) BQ_SIZE(BQ::ComputeArraySize(Array))

static constexpr inline uint32_t ReverseBytes(uint32_t u)
{
    return ((u & 0x000000FF) << 24) |
           ((u & 0x0000FF00) << 8)  |
           ((u & 0x00FF0000) >> 8)  |
           ((u & 0xFF000000) >> 24);
}

#if defined(BQ_BIG_ENDIAN)
    template <typename T>
    constexpr T BigEndian(T v) { return v; }
#else
    template <typename T>
    constexpr T BigEndian(T v) { return ReverseBytes(v); }
#endif

static inline void *MemCpy(void *__restrict__ dest, const void *__restrict__ src, Size len)
{
    BQ_ASSERT(len >= 0);

    if (len) {
        memcpy(dest, src, (size_t)len);
    }
    return dest;
}

static inline void *MemMove(void *dest, const void *src, Size len)
{
    BQ_ASSERT(len >= 0);

    if (len) {
        memmove(dest, src, (size_t)len);
    }
    return dest;
}

static inline void *MemSet(void *dest, int c, Size len)
{
    BQ_ASSERT(len >= 0);

    if (len) {
        memset(dest, c, (size_t)len);
    }
    return dest;
}

template <typename Fun>
class DeferGuard {
    BQ_DELETE_COPY(DeferGuard)

    Fun f;
    bool enabled;

public:
    DeferGuard() = delete;
    DeferGuard(Fun f_, bool enable = true) : f(std::move(f_)), enabled(enable) {}
    ~DeferGuard()
    {
        if (enabled) {
            f();
        }
    }

    DeferGuard(DeferGuard &&other)
        : f(std::move(other.f)), enabled(other.enabled)
    {
        other.enabled = false;
    }

    void Disable() { enabled = false; }
};

struct DeferGuardHelper {};
template <typename Fun>
DeferGuard<Fun> operator+(DeferGuardHelper, Fun &&f)
{
    return DeferGuard<Fun>(std::forward<Fun>(f));
}

// Write 'BQ_DEFER { code };' to do something at the end of the current scope, you
// can use BQ_DEFER_N(Name) if you need to disable the guard for some reason.
#define BQ_DEFER \
    auto BQ_UNIQUE_NAME(defer) = BQ::DeferGuardHelper() + [&]()
#define BQ_DEFER_N(Name) \
    auto Name = BQ::DeferGuardHelper() + [&]()

template<typename Fn> class FunctionRef;
template<typename Ret, typename ...Params>
class FunctionRef<Ret(Params...)> {
    Ret (*callback)(intptr_t callable, Params ...params) = nullptr;
    intptr_t callable;

    template<typename Callable>
    static Ret callback_fn(intptr_t callable, Params ...params)
        { return (*reinterpret_cast<Callable*>(callable))(std::forward<Params>(params)...); }

public:
    FunctionRef() = default;

    template <typename Callable>
    FunctionRef(Callable &&callable,
                std::enable_if_t<!std::is_same<std::remove_cv_t<std::remove_reference_t<Callable>>, FunctionRef>::value> * = nullptr,
                std::enable_if_t<std::is_void<Ret>::value ||
                                 std::is_convertible<decltype(std::declval<Callable>()(std::declval<Params>()...)),
                                                     Ret>::value> * = nullptr)
      : callback(callback_fn<typename std::remove_reference<Callable>::type>),
        callable(reinterpret_cast<intptr_t>(&callable)) {}

    Ret operator()(Params ...params) const
        { return callback(callable, std::forward<Params>(params)...); }

    bool IsValid() const { return callback; }
};

template <typename T>
struct Vec2 {
    T x;
    T y;
};

// ------------------------------------------------------------------------
// Memory / Allocator
// ------------------------------------------------------------------------

template <typename T>
struct Span {
    T *ptr;
    Size len;

    Span() = default;
    constexpr Span(T &value) : ptr(&value), len(1) {}
    constexpr Span(std::initializer_list<T> l) : ptr(l.begin()), len((Size)l.size()) {}
    constexpr Span(T *ptr_, Size len_) : ptr(ptr_), len(len_) {}
    template <Size N>
    constexpr Span(T (&arr)[N]) : ptr(arr), len(N) {}

    constexpr void Reset()
    {
        ptr = nullptr;
        len = 0;
    }

    constexpr T *begin() { return ptr; }
    constexpr const T *begin() const { return ptr; }
    constexpr T *end() { return ptr + len; }
    constexpr const T *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr T &operator[](Size idx)
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }
    constexpr const T &operator[](Size idx) const
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    constexpr operator Span<const T>() const { return Span<const T>(ptr, len); }

    constexpr bool operator==(const Span &other) const
    {
        if (len != other.len)
            return false;

        for (Size i = 0; i < len; i++) {
            if (ptr[i] != other.ptr[i])
                return false;
        }

        return true;
    }
    constexpr bool operator!=(const Span &other) const { return !(*this == other); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        BQ_ASSERT(sub_len >= 0 && sub_len <= len);
        BQ_ASSERT(offset >= 0 && offset <= len - sub_len);

        Span<T> sub = { ptr + offset, sub_len };
        return sub;
    }

    template <typename U>
    constexpr Span<U> As() const { return Span<U>((U *)ptr, len); }
};

// Use strlen() to build Span<const char> instead of the template-based
// array constructor.
template <>
struct Span<const char> {
    const char *ptr;
    Size len;

    Span() = default;
    constexpr Span(const char &ch) : ptr(&ch), len(1) {}
    constexpr Span(const char *ptr_, Size len_) : ptr(ptr_), len(len_) {}
    template <Size N>
    Span(const char (&arr)[N]) : ptr(arr), len((Size)strnlen(arr, N)) {}
    constexpr Span(const char *const &str) : ptr(str), len(str ? (Size)__builtin_strlen(str) : 0) {}

    constexpr void Reset()
    {
        ptr = nullptr;
        len = 0;
    }

    constexpr const char *begin() const { return ptr; }
    constexpr const char *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr char operator[](Size idx) const
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    // The implementation comes later, after TestStr() is available
    constexpr bool operator==(Span<const char> other) const;
    constexpr bool operator==(const char *other) const;
    constexpr bool operator!=(Span<const char> other) const { return !(*this == other); }
    constexpr bool operator!=(const char *other) const { return !(*this == other); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        BQ_ASSERT(sub_len >= 0 && sub_len <= len);
        BQ_ASSERT(offset >= 0 && offset <= len - sub_len);

        Span<const char> sub = { ptr + offset, sub_len };
        return sub;
    }

    template <typename U>
    constexpr Span<U> As() const { return Span<U>((U *)ptr, len); }
};

template <typename T>
static constexpr inline Span<T> MakeSpan(T *ptr, Size len)
{
    return Span<T>(ptr, len);
}
template <typename T>
static constexpr inline Span<T> MakeSpan(T *ptr, T *end)
{
    return Span<T>(ptr, end - ptr);
}
template <typename T, Size N>
static constexpr inline Span<T> MakeSpan(T (&arr)[N])
{
    return Span<T>(arr, N);
}

enum class AllocFlag {
    Zero = 1
};

class Allocator {
    BQ_DELETE_COPY(Allocator)

public:
    Allocator() = default;
    virtual ~Allocator() = default;

    virtual void *Allocate(Size size, unsigned int flags = 0) = 0;
    virtual void *Resize(void *ptr, Size old_size, Size new_size, unsigned int flags = 0) = 0;
    virtual void Release(const void *ptr, Size size) = 0;
};

Allocator *GetDefaultAllocator();

static inline void *AllocateRaw(Allocator *alloc, Size size, unsigned int flags = 0)
{
    BQ_ASSERT(size >= 0);

    if (!alloc) {
        alloc = GetDefaultAllocator();
    }

    void *ptr = alloc->Allocate(size, flags);
    return ptr;
}

static inline void *ResizeRaw(Allocator *alloc, void *ptr, Size old_size, Size new_size,
                              unsigned int flags = 0)
{
    BQ_ASSERT(new_size >= 0);

    if (!alloc) {
        alloc = GetDefaultAllocator();
    }

    ptr = alloc->Resize(ptr, old_size, new_size, flags);
    return ptr;
}

static inline void ReleaseRaw(Allocator *alloc, const void *ptr, Size size)
{
    if (!alloc) {
        alloc = GetDefaultAllocator();
    }

    alloc->Release(ptr, size);
}

// Bump allocator for short-lived strings and buffers, everything is released
// at once when the allocator is destroyed or reset.
class BlockAllocator: public Allocator {
    struct Bucket {
        Bucket *next;
        Size used;
        Size capacity;
        uint8_t data[];
    };

    Size block_size;

    Bucket *buckets = nullptr;
    uint8_t *last_alloc = nullptr;

public:
    BlockAllocator(Size block_size = BQ_BLOCK_ALLOCATOR_DEFAULT_SIZE)
        : block_size(block_size)
    {
        BQ_ASSERT(block_size > 0);
    }
    ~BlockAllocator() override { ReleaseAll(); }

    BlockAllocator(BlockAllocator &&other) { *this = std::move(other); }
    BlockAllocator& operator=(BlockAllocator &&other);

    void ReleaseAll();

    void *Allocate(Size size, unsigned int flags = 0) override;
    void *Resize(void *ptr, Size old_size, Size new_size, unsigned int flags = 0) override;
    void Release(const void *ptr, Size size) override;

private:
    Bucket *AddBucket(Size capacity);
};

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

bool CopyString(const char *str, Span<char> buf);
bool CopyString(Span<const char> str, Span<char> buf);
Span<char> DuplicateString(Span<const char> str, Allocator *alloc);

static constexpr inline bool IsAsciiDigit(int c)
{
    return (c >= '0' && c <= '9');
}

static constexpr inline char LowerAscii(int c)
{
    if (c >= 'A' && c <= 'Z') {
        return (char)(c + 32);
    } else {
        return (char)c;
    }
}

static constexpr inline bool TestStr(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;
    for (Size i = 0; i < str1.len; i++) {
        if (str1[i] != str2[i])
            return false;
    }
    return true;
}
static constexpr inline bool TestStr(Span<const char> str1, const char *str2)
{
    Size i;
    for (i = 0; i < str1.len && str2[i]; i++) {
        if (str1[i] != str2[i])
            return false;
    }
    return (i == str1.len) && !str2[i];
}
static constexpr inline bool TestStr(const char *str1, Span<const char> str2)
    { return TestStr(str2, str1); }
static constexpr inline bool TestStr(const char *str1, const char *str2)
    { return !__builtin_strcmp(str1, str2); }

constexpr inline bool Span<const char>::operator==(Span<const char> other) const
    { return TestStr(*this, other); }
constexpr inline bool Span<const char>::operator==(const char *other) const
    { return TestStr(*this, other); }

static constexpr inline bool TestStrI(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;
    for (Size i = 0; i < str1.len; i++) {
        if (LowerAscii(str1[i]) != LowerAscii(str2[i]))
            return false;
    }
    return true;
}
static constexpr inline bool TestStrI(Span<const char> str1, const char *str2)
    { return TestStrI(str1, Span<const char>(str2)); }
static constexpr inline bool TestStrI(const char *str1, const char *str2)
    { return TestStrI(Span<const char>(str1), Span<const char>(str2)); }

static constexpr inline int CmpStr(Span<const char> str1, Span<const char> str2)
{
    for (Size i = 0; i < str1.len && i < str2.len; i++) {
        int delta = str1[i] - str2[i];
        if (delta)
            return delta;
    }
    if (str1.len < str2.len) {
        return -str2[str1.len];
    } else if (str1.len > str2.len) {
        return str1[str2.len];
    } else {
        return 0;
    }
}
static constexpr inline int CmpStr(const char *str1, const char *str2)
    { return __builtin_strcmp(str1, str2); }

static inline Span<char> SplitStr(Span<char> str, char split_char, Span<char> *out_remainder = nullptr)
{
    Size part_len = 0;
    while (part_len < str.len) {
        if (str[part_len] == split_char) {
            if (out_remainder) {
                *out_remainder = str.Take(part_len + 1, str.len - part_len - 1);
            }
            return str.Take(0, part_len);
        }
        part_len++;
    }

    if (out_remainder) {
        *out_remainder = str.Take(str.len, 0);
    }
    return str;
}
static inline Span<const char> SplitStr(Span<const char> str, char split_char, Span<const char> *out_remainder = nullptr)
    { return SplitStr(MakeSpan((char *)str.ptr, str.len), split_char, (Span<char> *)out_remainder); }

static inline Span<char> SplitStrLine(Span<char> str, Span<char> *out_remainder = nullptr)
{
    Span<char> part = SplitStr(str, '\n', out_remainder);
    if (part.len < str.len && part.len && part[part.len - 1] == '\r') {
        part.len--;
    }
    return part;
}

static inline Span<const char> SplitStrReverseAny(Span<const char> str, const char *split_chars,
                                                  Span<const char> *out_remainder = nullptr)
{
    Size remainder_len = str.len - 1;
    while (remainder_len >= 0) {
        if (strchr(split_chars, str[remainder_len])) {
            if (out_remainder) {
                *out_remainder = str.Take(0, remainder_len);
            }
            return str.Take(remainder_len + 1, str.len - remainder_len - 1);
        }
        remainder_len--;
    }

    if (out_remainder) {
        *out_remainder = str.Take(0, 0);
    }
    return str;
}

static inline Span<char> TrimStrLeft(Span<char> str, const char *trim_chars = " \t\r\n")
{
    while (str.len && strchr(trim_chars, str[0]) && str[0]) {
        str.ptr++;
        str.len--;
    }

    return str;
}
static inline Span<char> TrimStrRight(Span<char> str, const char *trim_chars = " \t\r\n")
{
    while (str.len && strchr(trim_chars, str[str.len - 1]) && str[str.len - 1]) {
        str.len--;
    }

    return str;
}
static inline Span<char> TrimStr(Span<char> str, const char *trim_chars = " \t\r\n")
{
    str = TrimStrRight(str, trim_chars);
    str = TrimStrLeft(str, trim_chars);

    return str;
}
static inline Span<const char> TrimStr(Span<const char> str, const char *trim_chars = " \t\r\n")
    { return TrimStr(MakeSpan((char *)str.ptr, str.len), trim_chars); }

// ------------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------------

template <typename T, Size N>
class LocalArray {
public:
    T data[N];
    Size len = 0;

    typedef T value_type;
    typedef T *iterator_type;

    LocalArray() = default;
    LocalArray(std::initializer_list<T> l)
    {
        BQ_ASSERT(l.size() <= N);
        for (const T &value: l) {
            data[len++] = value;
        }
    }

    operator Span<T>() { return Span<T>(data, len); }
    operator Span<const T>() const { return Span<const T>(data, len); }

    T *begin() { return data; }
    const T *begin() const { return data; }
    T *end() { return data + len; }
    const T *end() const { return data + len; }

    Size Available() const { return N - len; }

    T &operator[](Size idx)
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }
    const T &operator[](Size idx) const
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }

    T *Append(const T &value)
    {
        BQ_ASSERT(len < N);

        T *it = data + len;
        *it = value;
        len++;

        return it;
    }
    T *Append(Span<const T> values)
    {
        BQ_ASSERT(values.len <= N - len);

        T *it = data + len;
        for (Size i = 0; i < values.len; i++) {
            data[len + i] = values[i];
        }
        len += values.len;

        return it;
    }

    void RemoveFrom(Size first)
    {
        BQ_ASSERT(first >= 0 && first <= len);
        len = first;
    }

    Span<T> Take(Size offset, Size sub_len) const { return Span<T>((T *)data, len).Take(offset, sub_len); }
};

template <typename T>
class HeapArray {
public:
    T *ptr = nullptr;
    Size len = 0;
    Size capacity = 0;
    Allocator *allocator = nullptr;

    typedef T value_type;
    typedef T *iterator_type;

    HeapArray() = default;
    HeapArray(Allocator *alloc, Size min_capacity = 0) : allocator(alloc)
        { SetCapacity(min_capacity); }
    HeapArray(std::initializer_list<T> l)
    {
        Reserve((Size)l.size());
        for (const T &it: l) {
            Append(it);
        }
    }
    ~HeapArray() { Clear(); }

    HeapArray(HeapArray &&other) { *this = std::move(other); }
    HeapArray &operator=(HeapArray &&other)
    {
        Clear();

        ptr = other.ptr;
        len = other.len;
        capacity = other.capacity;
        allocator = other.allocator;

        other.ptr = nullptr;
        other.len = 0;
        other.capacity = 0;

        return *this;
    }
    HeapArray(const HeapArray &other) { *this = other; }
    HeapArray &operator=(const HeapArray &other)
    {
        if (this == &other)
            return *this;

        RemoveFrom(0);
        Append(other);

        return *this;
    }

    void Clear()
    {
        RemoveFrom(0);
        SetCapacity(0);
    }

    operator Span<T>() { return Span<T>(ptr, len); }
    operator Span<const T>() const { return Span<const T>(ptr, len); }

    T *begin() { return ptr; }
    const T *begin() const { return ptr; }
    T *end() { return ptr + len; }
    const T *end() const { return ptr + len; }

    Size Available() const { return capacity - len; }

    T &operator[](Size idx)
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }
    const T &operator[](Size idx) const
    {
        BQ_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    void SetCapacity(Size new_capacity)
    {
        BQ_ASSERT(new_capacity >= 0);

        if (new_capacity != capacity) {
            if (len > new_capacity) {
                RemoveFrom(new_capacity);
            }

            if constexpr(std::is_trivially_copyable<T>::value) {
                ptr = (T *)ResizeRaw(allocator, ptr, capacity * BQ_SIZE(T), new_capacity * BQ_SIZE(T));
            } else {
                T *new_ptr = new_capacity ? (T *)AllocateRaw(allocator, new_capacity * BQ_SIZE(T)) : nullptr;

                for (Size i = 0; i < len; i++) {
                    new (new_ptr + i) T(std::move(ptr[i]));
                    ptr[i].~T();
                }
                ReleaseRaw(allocator, ptr, capacity * BQ_SIZE(T));

                ptr = new_ptr;
            }
            capacity = new_capacity;
        }
    }

    void Reserve(Size min_capacity)
    {
        if (min_capacity > capacity) {
            SetCapacity(min_capacity);
        }
    }

    T *Grow(Size reserve_capacity = 1)
    {
        BQ_ASSERT(reserve_capacity >= 0);

        if (reserve_capacity > capacity - len) {
            Size needed = len + reserve_capacity;

            Size new_capacity;
            if (needed <= BQ_HEAPARRAY_BASE_CAPACITY) {
                new_capacity = BQ_HEAPARRAY_BASE_CAPACITY;
            } else {
                new_capacity = std::max(needed, (Size)((double)capacity * BQ_HEAPARRAY_GROWTH_FACTOR));
            }

            SetCapacity(new_capacity);
        }

        return ptr + len;
    }

    void Trim(Size extra_capacity = 0) { SetCapacity(len + extra_capacity); }

    T *Append(const T &value)
    {
        Grow();

        T *first = ptr + len;
        new (ptr + len) T(value);
        len++;

        return first;
    }
    T *Append(T &&value)
    {
        Grow();

        T *first = ptr + len;
        new (ptr + len) T(std::move(value));
        len++;

        return first;
    }
    T *Append(Span<const T> values)
    {
        Grow(values.len);

        T *first = ptr + len;
        for (const T &value: values) {
            new (ptr + len) T(value);
            len++;
        }

        return first;
    }

    void RemoveFrom(Size first)
    {
        BQ_ASSERT(first >= 0 && first <= len);

        if constexpr(!std::is_trivially_destructible<T>::value) {
            for (Size i = first; i < len; i++) {
                ptr[i].~T();
            }
        }
        len = first;
    }

    Span<T> Take() const { return Span<T>(ptr, len); }
    Span<T> Take(Size offset, Size sub_len) const { return Span<T>(ptr, len).Take(offset, sub_len); }

    Span<T> Leak()
    {
        Span<T> span = *this;

        ptr = nullptr;
        len = 0;
        capacity = 0;

        return span;
    }
    Span<T> TrimAndLeak(Size extra_capacity = 0)
    {
        Trim(extra_capacity);
        return Leak();
    }
};

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

enum class FmtType {
    Str,
    PadStr,
    Char,
    Bool,
    Integer,
    Unsigned,
    Double
};

class FmtArg {
public:
    FmtType type;
    union {
        Span<const char> str;
        char ch;
        bool b;
        int64_t i;
        uint64_t u;
        struct {
            double value;
            int min_prec;
            int max_prec;
        } d;
    } u;

    int pad = 0;
    char padding = 0;

    FmtArg() = default;
    FmtArg(std::nullptr_t) : FmtArg(FmtType::Str) { u.str = "(null)"; }
    FmtArg(const char *str) : FmtArg(FmtType::Str) { u.str = str ? str : "(null)"; }
    FmtArg(Span<const char> str) : FmtArg(FmtType::Str) { u.str = str; }
    FmtArg(Span<char> str) : FmtArg(FmtType::Str) { u.str = str; }
    FmtArg(char c) : FmtArg(FmtType::Char) { u.ch = c; }
    FmtArg(bool b) : FmtArg(FmtType::Bool) { u.b = b; }
    FmtArg(unsigned char i) : FmtArg(FmtType::Unsigned) { u.u = i; }
    FmtArg(short i) : FmtArg(FmtType::Integer) { u.i = i; }
    FmtArg(unsigned short i) : FmtArg(FmtType::Unsigned) { u.u = i; }
    FmtArg(int i) : FmtArg(FmtType::Integer) { u.i = i; }
    FmtArg(unsigned int i) : FmtArg(FmtType::Unsigned) { u.u = i; }
    FmtArg(long i) : FmtArg(FmtType::Integer) { u.i = i; }
    FmtArg(unsigned long i) : FmtArg(FmtType::Unsigned) { u.u = i; }
    FmtArg(long long i) : FmtArg(FmtType::Integer) { u.i = i; }
    FmtArg(unsigned long long i) : FmtArg(FmtType::Unsigned) { u.u = i; }
    FmtArg(float f) : FmtArg(FmtType::Double) { u.d = { (double)f, 0, INT_MAX }; }
    FmtArg(double d) : FmtArg(FmtType::Double) { u.d = { d, 0, INT_MAX }; }

protected:
    FmtArg(FmtType type) : type(type) {}
};

static inline FmtArg FmtPad(Span<const char> str, int pad, char padding = ' ')
{
    FmtArg arg;
    arg.type = FmtType::PadStr;
    arg.u.str = str;
    arg.pad = pad;
    arg.padding = padding;
    return arg;
}

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf);
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf);
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Allocator *alloc);
void PrintFmt(const char *fmt, Span<const FmtArg> args, FILE *out_fp);
void PrintLnFmt(const char *fmt, Span<const FmtArg> args, FILE *out_fp);

#define DEFINE_FMT_VARIANT(Ret, Type) \
    static inline Ret Fmt(Type out, const char *fmt) \
    { \
        return FmtFmt(fmt, {}, false, out); \
    } \
    template <typename... Args> \
    Ret Fmt(Type out, const char *fmt, Args... args) \
    { \
        const FmtArg fmt_args[] = { FmtArg(args)... }; \
        return FmtFmt(fmt, fmt_args, false, out); \
    }
#define DEFINE_PRINT_VARIANT(Name, Ret, Type) \
    static inline Ret Name(Type out, const char *fmt) \
    { \
        return Name##Fmt(fmt, {}, out); \
    } \
    template <typename... Args> \
    Ret Name(Type out, const char *fmt, Args... args) \
    { \
        const FmtArg fmt_args[] = { FmtArg(args)... }; \
        return Name##Fmt(fmt, fmt_args, out); \
    }

DEFINE_FMT_VARIANT(Span<char>, Span<char>)
DEFINE_FMT_VARIANT(Span<char>, HeapArray<char> *)
DEFINE_FMT_VARIANT(Span<char>, Allocator *)
DEFINE_PRINT_VARIANT(Print, void, FILE *)
DEFINE_PRINT_VARIANT(PrintLn, void, FILE *)

#undef DEFINE_FMT_VARIANT
#undef DEFINE_PRINT_VARIANT

// Print formatted strings to stdout
template <typename... Args>
void Print(const char *fmt, Args... args)
{
    Print(stdout, fmt, args...);
}
template <typename... Args>
void PrintLn(const char *fmt, Args... args)
{
    PrintLn(stdout, fmt, args...);
}

// PrintLn variants without format strings
static inline void PrintLn(FILE *out_fp) { fputc('\n', out_fp); }
static inline void PrintLn() { putchar('\n'); }

// ------------------------------------------------------------------------
// Debug and errors
// ------------------------------------------------------------------------

typedef void LogFunc(LogLevel level, const char *ctx, const char *msg);
typedef void LogFilterFunc(LogLevel level, const char *ctx, const char *msg,
                           FunctionRef<LogFunc> func);

const char *GetEnv(const char *name);

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args);

static inline void Log(LogLevel level, const char *ctx)
{
    LogFmt(level, ctx, "", {});
}
static inline void Log(LogLevel level, const char *ctx, const char *fmt)
{
    LogFmt(level, ctx, fmt, {});
}
template <typename... Args>
static inline void Log(LogLevel level, const char *ctx, const char *fmt, Args... args)
{
    const FmtArg fmt_args[] = { FmtArg(args)... };
    LogFmt(level, ctx, fmt, fmt_args);
}

#if defined(BQ_DEBUG)
    template <typename... Args>
    static inline void LogDebug(Args... args) { Log(LogLevel::Debug, "Debug: ", args...); }
#else
    template <typename... Args>
    static inline void LogDebug(Args...) {}
#endif
template <typename... Args>
static inline void LogWarning(Args... args) { Log(LogLevel::Warning, "Warning: ", args...); }
template <typename... Args>
static inline void LogError(Args... args) { Log(LogLevel::Error, "Error: ", args...); }

void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg);

void PushLogFilter(const std::function<LogFilterFunc> &func);
void PopLogFilter();

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

static inline bool IsPathSeparator(char c)
{
#if defined(_WIN32)
    return c == '/' || c == '\\';
#else
    return c == '/';
#endif
}

Span<const char> GetPathDirectory(Span<const char> filename);

bool TestFile(const char *filename);
bool UnlinkFile(const char *filename, bool error_if_missing = false);
bool RenameFile(const char *src_filename, const char *dest_filename);

bool FileIsVt100(FILE *fp);

const char *GetTemporaryDirectory();
const char *CreateUniqueFile(Span<const char> directory, const char *prefix, const char *extension,
                             Allocator *alloc);

// Returns -1 on error (already logged)
Size ReadFile(const char *filename, Size max_len, HeapArray<uint8_t> *out_buf);
Size ReadFile(const char *filename, Size max_len, HeapArray<char> *out_buf);

enum class WriteFlag {
    Atomic = 1 << 0
};

bool WriteFile(Span<const uint8_t> buf, const char *filename, unsigned int flags = 0);
static inline bool WriteFile(Span<const char> buf, const char *filename, unsigned int flags = 0)
    { return WriteFile(buf.As<const uint8_t>(), filename, flags); }

// ------------------------------------------------------------------------
// Main
// ------------------------------------------------------------------------

void InitApp();

int Main(int argc, char **argv);

static inline int RunApp(int argc, char **argv)
{
    InitApp();
    return Main(argc, argv);
}

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

enum class ParseFlag {
    Log = 1 << 0,
    Validate = 1 << 1,
    End = 1 << 2
};
#define BQ_DEFAULT_PARSE_FLAGS ((int)ParseFlag::Log | (int)ParseFlag::Validate | (int)ParseFlag::End)

template <typename T>
bool ParseInt(Span<const char> str, T *out_value, unsigned int flags = BQ_DEFAULT_PARSE_FLAGS,
              Span<const char> *out_remaining = nullptr)
{
    if (!str.len) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Cannot convert empty string to integer");
        }
        return false;
    }

    uint64_t value = 0;

    Size pos = 0;
    uint64_t neg = 0;
    if (str.len >= 2) {
        if (std::numeric_limits<T>::min() < 0 && str[0] == '-') {
            pos = 1;
            neg = UINT64_MAX;
        } else if (str[0] == '+') {
            pos = 1;
        }
    }

    for (; pos < str.len; pos++) {
        unsigned int digit = (unsigned int)(str[pos] - '0');
        if (digit > 9) [[unlikely]] {
            if (!pos || flags & (int)ParseFlag::End) {
                if (flags & (int)ParseFlag::Log) {
                    LogError("Malformed integer number '%1'", str);
                }
                return false;
            } else {
                break;
            }
        }

        uint64_t new_value = (value * 10) + digit;
        if (new_value < value) [[unlikely]]
            goto overflow;
        value = new_value;
    }
    if (value > (uint64_t)std::numeric_limits<T>::max()) [[unlikely]]
        goto overflow;
    value = ((value ^ neg) - neg);

    if (out_remaining) {
        *out_remaining = str.Take(pos, str.len - pos);
    }
    *out_value = (T)value;
    return true;

overflow:
    if (flags & (int)ParseFlag::Log) {
        LogError("Integer overflow for number '%1' (max = %2)", str,
                 std::numeric_limits<T>::max());
    }
    return false;
}

bool ParseDouble(Span<const char> str, double *out_value, unsigned int flags = BQ_DEFAULT_PARSE_FLAGS,
                 Span<const char> *out_remaining = nullptr);

// ------------------------------------------------------------------------
// INI
// ------------------------------------------------------------------------

struct IniProperty {
    Span<const char> section;
    Span<const char> key;
    Span<const char> value;
};

class IniParser {
    BQ_DELETE_COPY(IniParser)

    enum class LineType {
        Section,
        KeyValue,
        Exit
    };

    const char *filename;
    HeapArray<char> text;
    Span<char> remain;
    int line_number = 0;

    HeapArray<char> current_section;

    bool eof = false;
    bool error = false;

public:
    IniParser(Span<const char> text, const char *filename);

    bool IsValid() const { return !error; }
    bool IsEOF() const { return eof; }

    bool Next(IniProperty *out_prop);
    bool NextInSection(IniProperty *out_prop);

    // Prefix errors logged by the caller with the filename and current line
    void PushLogFilter();

private:
    LineType FindNextLine(IniProperty *out_prop);
};

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

enum class OptionMode {
    Rotate,
    Skip,
    Stop
};

enum class OptionType {
    NoValue,
    Value,
    OptionalValue
};

class OptionParser {
    BQ_DELETE_COPY(OptionParser)

    Span<const char *> args;
    OptionMode mode;

    Size pos = 0;
    Size limit;
    Size smallopt_offset = 0;
    char buf[80];

    bool test_failed = false;

public:
    const char *current_option = nullptr;
    const char *current_value = nullptr;

    OptionParser(Span<const char *> args, OptionMode mode = OptionMode::Rotate)
        : args(args), mode(mode), limit(args.len) {}
    OptionParser(int argc, char **argv, OptionMode mode = OptionMode::Rotate)
        : args((const char **)argv, argc), mode(mode), pos(1), limit(args.len) {}

    const char *Next();

    const char *ConsumeValue();
    const char *ConsumeNonOption();

    bool Test(const char *test1, const char *test2, OptionType type = OptionType::NoValue);
    bool Test(const char *test1, OptionType type = OptionType::NoValue)
        { return Test(test1, nullptr, type); }

    bool TestHasFailed() const { return test_failed; }

    void LogUnknownError() const;
    void LogUnusedArguments() const;
};

template <typename T>
bool OptionToEnumI(Span<const char *const> options, Span<const char> str, T *out_value)
{
    static_assert(std::is_enum<T>::value);

    for (Size i = 0; i < options.len; i++) {
        const char *opt = options[i];

        if (TestStrI(str, opt)) {
            *out_value = (T)i;
            return true;
        }
    }

    return false;
}

// ------------------------------------------------------------------------
// Console prompter
// ------------------------------------------------------------------------

// Returns NULL on EOF or error, the default value when the answer is empty
const char *Prompt(const char *prompt, const char *default_value, Allocator *alloc);

// ------------------------------------------------------------------------
// Checksums
// ------------------------------------------------------------------------

uint32_t CRC32(uint32_t state, Span<const uint8_t> buf);

}
