// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"

namespace BQ {

TEST_FUNCTION("base/Format")
{
    char buf[512];

    TEST_STR(Fmt(buf, "%1 %2", 12, "foo"), "12 foo");
    TEST_STR(Fmt(buf, "%2%1", "a", "b"), "ba");
    TEST_STR(Fmt(buf, "%1", -42), "-42");
    TEST_STR(Fmt(buf, "%1", true), "true");
    TEST_STR(Fmt(buf, "%1x%2 px", 2039, 2039), "2039x2039 px");
    TEST_STR(Fmt(buf, "100%%"), "100%");
    TEST_STR(Fmt(buf, "%1", 0.5), "0.5");
    TEST_STR(Fmt(buf, "%1", 2.0), "2");
}

TEST_FUNCTION("base/ParseInt")
{
    int value = 0;

    TEST(ParseInt("2048", &value));
    TEST_EQ(value, 2048);
    TEST(ParseInt("-12", &value));
    TEST_EQ(value, -12);

    TEST_MUTE_LOG();

    TEST(!ParseInt("", &value));
    TEST(!ParseInt("12px", &value));
    TEST(!ParseInt("abc", &value));
    TEST(!ParseInt("99999999999", &value));
    TEST_EQ(value, -12);

    Span<const char> remain;
    TEST(ParseInt("12px", &value, 0, &remain));
    TEST_EQ(value, 12);
    TEST_STR(remain, "px");
}

TEST_FUNCTION("base/ParseDouble")
{
    double value = 0.0;

    TEST(ParseDouble("0.25", &value));
    TEST_EQ(value, 0.25);
    TEST(ParseDouble("-1e1", &value));
    TEST_EQ(value, -10.0);

    TEST_MUTE_LOG();

    TEST(!ParseDouble("", &value));
    TEST(!ParseDouble("half", &value));
    TEST(!ParseDouble("0.5x", &value));
    TEST_EQ(value, -10.0);
}

TEST_FUNCTION("base/SplitStr")
{
    Span<const char> remain = "16:9:x";

    TEST_STR(SplitStr(remain, ':', &remain), "16");
    TEST_STR(SplitStr(remain, ':', &remain), "9");
    TEST_STR(SplitStr(remain, ':', &remain), "x");
    TEST_EQ(remain.len, 0);

    TEST_STR(TrimStr(Span<const char>("  foo \t\n")), "foo");
}

TEST_FUNCTION("base/CRC32")
{
    TEST_EQ(CRC32(0, MakeSpan((const uint8_t *)"123456789", 9)), 0xCBF43926u);
    TEST_EQ(CRC32(0, MakeSpan((const uint8_t *)"IEND", 4)), 0xAE426082u);

    // Incremental
    uint32_t crc = CRC32(0, MakeSpan((const uint8_t *)"1234", 4));
    crc = CRC32(crc, MakeSpan((const uint8_t *)"56789", 5));
    TEST_EQ(crc, 0xCBF43926u);
}

TEST_FUNCTION("base/IniParser")
{
    static const char *const text = R"(
; Comment
Global = 1

[Section]
Key = Value with spaces
Empty =

[Other]
# Comment
Name=foo
)";

    IniParser ini(text, "test.ini");
    IniProperty prop;

    TEST(ini.Next(&prop));
    TEST_EQ(prop.section.len, 0);
    TEST_STR(prop.key, "Global");
    TEST_STR(prop.value, "1");

    TEST(ini.Next(&prop));
    TEST_STR(prop.section, "Section");
    TEST_STR(prop.key, "Key");
    TEST_STR(prop.value, "Value with spaces");

    TEST(ini.Next(&prop));
    TEST_STR(prop.key, "Empty");
    TEST_STR(prop.value, "");

    TEST(ini.Next(&prop));
    TEST_STR(prop.section, "Other");
    TEST_STR(prop.key, "Name");
    TEST_STR(prop.value, "foo");

    TEST(!ini.Next(&prop));
    TEST(ini.IsValid());
    TEST(ini.IsEOF());

    TEST_MUTE_LOG();

    IniParser bad("[Section]\nNoValue\n", "bad.ini");
    TEST(!bad.Next(&prop));
    TEST(!bad.IsValid());
}

TEST_FUNCTION("base/OptionParser")
{
    const char *args[] = { "-s", "512", "https://example.com", "--fill=red", "-i", "--no_logo" };
    OptionParser opt(MakeSpan(args));

    int size = 0;
    const char *fill = nullptr;
    bool interactive = false;
    bool no_logo = false;

    while (opt.Next()) {
        if (opt.Test("-s", "--size", OptionType::Value)) {
            TEST(ParseInt(opt.current_value, &size));
        } else if (opt.Test("--fill", OptionType::Value)) {
            fill = opt.current_value;
        } else if (opt.Test("-i", "--interactive")) {
            interactive = true;
        } else if (opt.Test("--no_logo")) {
            no_logo = true;
        } else {
            TEST_EX(false, "Unexpected option '%1'", opt.current_option);
        }
    }

    TEST_EQ(size, 512);
    TEST_STR(fill, "red");
    TEST(interactive);
    TEST(no_logo);
    TEST_STR(opt.ConsumeNonOption(), "https://example.com");
    TEST(!opt.ConsumeNonOption());
}

}
