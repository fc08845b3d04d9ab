// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace BQ {

struct TestInfo {
    const char *path;
    void (*func)(Size *out_total, Size *out_failures);

    TestInfo(const char *path, void (*func)(Size *out_total, Size *out_failures));
};

#define TEST_FUNCTION_(FuncName, VarName, Path) \
    static void FuncName(Size *out_total, Size *out_failures); \
     \
    static const TestInfo VarName((Path), FuncName); \
     \
    static void FuncName(Size *out_total, Size *out_failures)
#define TEST_FUNCTION(Path) TEST_FUNCTION_(BQ_UNIQUE_NAME(func_), BQ_UNIQUE_NAME(test_), "test/" Path)

#define TEST_EX(Condition, ...) \
    do { \
        (*out_total)++; \
        if (!(Condition)) { \
            Print("\n    %!D..[%1:%2]%!0 ", SplitStrReverseAny(__FILE__, BQ_PATH_SEPARATORS), __LINE__); \
            Print(__VA_ARGS__); \
            (*out_failures)++; \
        } \
    } while (false)

#define TEST(Condition) \
    TEST_EX((Condition), "%1", BQ_STRINGIFY(Condition))
#define TEST_EQ(Value1, Value2) \
    do { \
        auto value1 = (Value1); \
        auto value2 = (Value2); \
        \
        TEST_EX(value1 == value2, "%1: %2 == %3", BQ_STRINGIFY(Value1), value1, value2); \
    } while (false)
#define TEST_GT(Value1, Value2) \
    do { \
        auto value1 = (Value1); \
        auto value2 = (Value2); \
        \
        TEST_EX(value1 > value2, "%1: %2 > %3", BQ_STRINGIFY(Value1), value1, value2); \
    } while (false)
#define TEST_LT(Value1, Value2) \
    do { \
        auto value1 = (Value1); \
        auto value2 = (Value2); \
        \
        TEST_EX(value1 < value2, "%1: %2 < %3", BQ_STRINGIFY(Value1), value1, value2); \
    } while (false)
#define TEST_STR(Str1, Str2) \
    do { \
        Span<const char> str1 = (Str1); \
        Span<const char> str2 = (Str2); \
        \
        if (!str1.ptr) { \
            str1 = "(null)"; \
        } \
        if (!str2.ptr) { \
            str2 = "(null)"; \
        } \
        \
        TEST_EX(str1 == str2, "%1: '%2' == '%3'", BQ_STRINGIFY(Str1), str1, str2); \
    } while (false)

// Silence expected errors for the rest of the scope
#define TEST_MUTE_LOG() \
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {}); \
    BQ_DEFER { PopLogFilter(); }

}
