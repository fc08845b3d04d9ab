// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "test.hh"

#include <fnmatch.h>

namespace BQ {

static HeapArray<const TestInfo *> tests;

TestInfo::TestInfo(const char *path, void (*func)(Size *out_total, Size *out_failures))
    : path(path), func(func)
{
    tests.Append(this);
}

int Main(int argc, char **argv)
{
    // Options
    const char *pattern = nullptr;

    const auto print_usage = [=](FILE *fp) {
        PrintLn(fp, R"(Usage: %!..+%1 [pattern]%!0)", BuildTarget);
    };

    // Parse arguments
    {
        OptionParser opt(argc, argv);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(stdout);
                return 0;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        pattern = opt.ConsumeNonOption();
        opt.LogUnusedArguments();
    }

    // We want to group the output, make sure everything is sorted correctly
    std::sort(tests.begin(), tests.end(), [](const TestInfo *test1, const TestInfo *test2) {
        return CmpStr(test1->path, test2->path) < 0;
    });

    Size matches = 0;
    Size failed_tests = 0;

    for (Size i = 0; i < tests.len; i++) {
        const TestInfo &test = *tests[i];

        if (!pattern || !fnmatch(pattern, test.path, 0)) {
            Print("%!y..%1%!0", FmtPad(test.path, 36));
            fflush(stdout);

            Size total = 0;
            Size failures = 0;
            test.func(&total, &failures);

            if (failures) {
                PrintLn("\n    %!R..Failed%!0 (%1/%2)\n", failures, total);
                failed_tests++;
            } else {
                PrintLn(" %!G..Success%!0 (%1)", total);
            }

            matches++;
        }
    }

    if (pattern && !matches) {
        LogError("Pattern '%1' does not match any test", pattern);
        return 1;
    }

    return failed_tests ? 1 : 0;
}

}

// C++ namespaces are stupid
int main(int argc, char **argv) { return BQ::RunApp(argc, argv); }
