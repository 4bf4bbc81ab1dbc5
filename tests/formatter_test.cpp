#include "listing/formatter.hpp"
#include "manifest_builder.hpp"

#include <string>

#include <gtest/gtest.h>

namespace mbdb::listing {

using format::Record;
using test::make_record;

// ── Fixture ──────────────────────────────────────────────────────────────────

class FormatterTest : public ::testing::Test {
protected:
    FormatterTest() : record_(make_record("HomeDomain",
                                          "Library/Preferences/com.example.plist")) {
        record_.owner_uid = 501;
        record_.group_gid = 501;
    }

    Record record_;
    static constexpr const char* kId = "0a6add080123e69c8052f33fa2b8d1a3f541bb52";
};

// ── Short modes ──────────────────────────────────────────────────────────────

TEST_F(FormatterTest, IdAndPath) {
    FormatOptions opts;
    EXPECT_EQ(format_record(record_, opts),
              std::string(kId) + " HomeDomain::Library/Preferences/com.example.plist");
}

TEST_F(FormatterTest, PathOnly) {
    FormatOptions opts;
    opts.mode = OutputMode::PathOnly;
    EXPECT_EQ(format_record(record_, opts),
              "HomeDomain::Library/Preferences/com.example.plist");
}

TEST_F(FormatterTest, PathOnlyIsUtf8) {
    Record r = make_record("HomeDomain", "Caf\xE9");
    FormatOptions opts;
    opts.mode = OutputMode::PathOnly;
    EXPECT_EQ(format_record(r, opts), "HomeDomain::Caf\xC3\xA9");
}

// ── Detailed ─────────────────────────────────────────────────────────────────

TEST_F(FormatterTest, DetailedAlignedUtc) {
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Utc;
    EXPECT_EQ(format_record(record_, opts),
              "-rw-r--r--   501   501    1234 2014-05-13 16:53:20  "
              "2014-05-13 16:55:00  2014-05-13 16:56:40  "
              "0a6add080123e69c8052f33fa2b8d1a3f541bb52 "
              "HomeDomain::Library/Preferences/com.example.plist");
}

TEST_F(FormatterTest, DetailedTabEpoch) {
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Epoch;
    opts.tab_delimited = true;
    EXPECT_EQ(format_record(record_, opts),
              "-rw-r--r--\t501\t501\t1234\t1400000000\t1400000100\t1400000200\t"
              "0a6add080123e69c8052f33fa2b8d1a3f541bb52\t"
              "HomeDomain\tLibrary/Preferences/com.example.plist");
}

TEST_F(FormatterTest, SymlinkShowsTarget) {
    Record r = make_record("RootDomain", "Library/link");
    r.posix_mode  = 0xA1ED;
    r.link_target = "/var/mobile";
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Epoch;
    const auto line = format_record(r, opts);
    EXPECT_EQ(line.substr(0, 10), "lrwxr-xr-x");
    EXPECT_TRUE(line.ends_with("RootDomain::Library/link -> /var/mobile")) << line;
}

TEST_F(FormatterTest, DirectoryAndUnknownTypeChars) {
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Epoch;

    record_.posix_mode = 0x41ED;
    EXPECT_EQ(format_record(record_, opts).substr(0, 10), "drwxr-xr-x");

    record_.posix_mode = 0x2000;
    EXPECT_EQ(format_record(record_, opts).substr(0, 10), "?---------");
}

TEST_F(FormatterTest, PropertiesAppendedInOrder) {
    record_.properties = {{"b", "x"}, {"a", "it's"}};
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Epoch;
    EXPECT_TRUE(format_record(record_, opts).ends_with(
        "com.example.plist b='x' a=\"it's\""));

    opts.tab_delimited = true;
    EXPECT_TRUE(format_record(record_, opts).ends_with(
        "com.example.plist\tb='x'\ta=\"it's\""));
}

TEST_F(FormatterTest, PropertiesOnlyInDetailedMode) {
    record_.properties = {{"b", "x"}};
    FormatOptions opts;
    EXPECT_EQ(format_record(record_, opts).find("b='x'"), std::string::npos);
}

TEST_F(FormatterTest, WideValuesOverflowColumns) {
    record_.owner_uid = 4'294'967'295u;
    record_.size      = 12'345'678'901ull;
    FormatOptions opts;
    opts.mode = OutputMode::Detailed;
    opts.time_format = TimeFormat::Epoch;
    const auto line = format_record(record_, opts);
    EXPECT_NE(line.find(" 4294967295   501 12345678901 "), std::string::npos) << line;
}

// ── Column helpers ───────────────────────────────────────────────────────────

TEST(PermissionString, Bits) {
    EXPECT_EQ(permission_string(0000), "---------");
    EXPECT_EQ(permission_string(0777), "rwxrwxrwx");
    EXPECT_EQ(permission_string(0644), "rw-r--r--");
    EXPECT_EQ(permission_string(0751), "rwxr-x--x");
    // setuid/setgid/sticky bits are not rendered
    EXPECT_EQ(permission_string(07000 | 0700), "rwx------");
}

TEST(FileTypeChar, AllTypes) {
    EXPECT_EQ(file_type_char(format::FileType::Symlink), 'l');
    EXPECT_EQ(file_type_char(format::FileType::Regular), '-');
    EXPECT_EQ(file_type_char(format::FileType::Directory), 'd');
    EXPECT_EQ(file_type_char(format::FileType::Unknown), '?');
}

TEST(FormatTime, EpochIsRightAligned) {
    EXPECT_EQ(format_time(0, TimeFormat::Epoch), "         0");
    EXPECT_EQ(format_time(1'400'000'000, TimeFormat::Epoch), "1400000000");
    EXPECT_EQ(format_time(4'294'967'295u, TimeFormat::Epoch), "4294967295");
}

TEST(FormatTime, Utc) {
    EXPECT_EQ(format_time(0, TimeFormat::Utc), "1970-01-01 00:00:00");
    EXPECT_EQ(format_time(1'400'000'000, TimeFormat::Utc), "2014-05-13 16:53:20");
}

TEST(FormatTime, LocalHasTimestampShape) {
    const auto s = format_time(1'400'000'000, TimeFormat::Local);
    ASSERT_EQ(s.size(), 19u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[13], ':');
}

TEST(QuoteValue, QuoteSelection) {
    EXPECT_EQ(quote_value("plain"), "'plain'");
    EXPECT_EQ(quote_value(""), "''");
    EXPECT_EQ(quote_value("it's"), "\"it's\"");
    EXPECT_EQ(quote_value("say \"hi\""), "'say \"hi\"'");
    EXPECT_EQ(quote_value("a'b\"c"), "'a\\'b\"c'");
}

TEST(QuoteValue, Escapes) {
    EXPECT_EQ(quote_value("\\"), "'\\\\'");
    EXPECT_EQ(quote_value("a\tb\nc\rd"), "'a\\tb\\nc\\rd'");
    EXPECT_EQ(quote_value(std::string("\x00\x1f", 2)), "'\\x00\\x1f'");
    EXPECT_EQ(quote_value("\x7f\xa0\xad"), "'\\x7f\\xa0\\xad'");
}

TEST(QuoteValue, PrintableLatin1AsUtf8) {
    EXPECT_EQ(quote_value("\xe9"), "'\xc3\xa9'");
    EXPECT_EQ(quote_value("\xa1"), "'\xc2\xa1'");
}

} // namespace mbdb::listing
