#include "tsync/transport/listing.hpp"

#include <gtest/gtest.h>

using namespace tsync::transport;
using tsync::from_unix_seconds;
using tsync::to_unix_seconds;

TEST(ListingTest, SplitLinesHandlesCrlf) {
    const auto lines = split_lines("one\r\ntwo\n\nthree");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
}

TEST(ListingTest, ParsesMlsdFile) {
    auto entry = parse_mlsd_line("type=file;size=1234;modify=20240501123000; report.csv");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "report.csv");
    EXPECT_EQ(entry->kind, FileKind::File);
    EXPECT_EQ(entry->size, 1234u);
    ASSERT_TRUE(entry->modified.has_value());
    EXPECT_EQ(to_unix_seconds(*entry->modified), 1714566600);
}

TEST(ListingTest, MlsdKeepsSpacesInNames) {
    auto entry = parse_mlsd_line("Type=dir;Modify=20240101120000; quarterly reports");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "quarterly reports");
    EXPECT_EQ(entry->kind, FileKind::Directory);
    EXPECT_EQ(entry->size, 0u);
}

TEST(ListingTest, MlsdSkipsDotEntriesAndMarksLinks) {
    EXPECT_FALSE(parse_mlsd_line("type=cdir;modify=20240101120000; .").has_value());
    EXPECT_FALSE(parse_mlsd_line("type=pdir;modify=20240101120000; ..").has_value());
    EXPECT_FALSE(parse_mlsd_line("garbage").has_value());

    auto link = parse_mlsd_line("type=OS.unix=symlink;size=10; latest");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->kind, FileKind::Other);
}

TEST(ListingTest, ParsesUnixListingWithTime) {
    const auto now = from_unix_seconds(1714566600);  // 2024-05-01
    auto entry = parse_unix_listing_line("-rw-r--r--    1 deploy   deploy       2048 Jan  1 12:00 build.tar", now);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "build.tar");
    EXPECT_EQ(entry->kind, FileKind::File);
    EXPECT_EQ(entry->size, 2048u);
    ASSERT_TRUE(entry->modified.has_value());
    EXPECT_EQ(to_unix_seconds(*entry->modified), 1704110400);
}

TEST(ListingTest, YearlessDateInTheFutureBelongsToLastYear) {
    const auto now = from_unix_seconds(1704110400);  // 2024-01-01 12:00
    auto entry = parse_unix_listing_line("-rw-r--r-- 1 u g 5 Dec 31 08:15 late.log", now);
    ASSERT_TRUE(entry.has_value());
    ASSERT_TRUE(entry->modified.has_value());
    EXPECT_EQ(to_unix_seconds(*entry->modified), 1704010500);
}

TEST(ListingTest, ParsesUnixListingWithYearAndLinks) {
    const auto now = from_unix_seconds(1714566600);
    auto dir = parse_unix_listing_line("drwxr-xr-x 2 u g 4096 Mar  4  2022 archive", now);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->kind, FileKind::Directory);
    EXPECT_EQ(dir->size, 0u);
    ASSERT_TRUE(dir->modified.has_value());
    EXPECT_EQ(to_unix_seconds(*dir->modified), 1646352000);

    auto link = parse_unix_listing_line("lrwxrwxrwx 1 u g 11 Mar  4  2022 current -> releases/7", now);
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->kind, FileKind::Other);
    EXPECT_EQ(link->name, "current");

    EXPECT_FALSE(parse_unix_listing_line("drwxr-xr-x 2 u g 4096 Mar  4  2022 .", now).has_value());
    EXPECT_FALSE(parse_unix_listing_line("total 12", now).has_value());
}

TEST(ListingTest, FtpTimestamps) {
    auto parsed = parse_ftp_timestamp("20240501123000.250");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(to_unix_seconds(*parsed), 1714566600);
    EXPECT_EQ(format_ftp_timestamp(*parsed), "20240501123000");
    EXPECT_FALSE(parse_ftp_timestamp("2024").has_value());
    EXPECT_EQ(format_rfc1123(from_unix_seconds(1714566600)), "Wed, 01 May 2024 12:30:00 GMT");
}
