// ============================================================
// test_utils.cpp -- Formatting and parsing helpers
// ============================================================

#include "../common/utils.hpp"
#include "../common/socket.hpp"
#include "../common/hash.hpp"
#include <gtest/gtest.h>

TEST(Commify, GroupsThousands) {
    EXPECT_EQ(utils::commify(0), "0");
    EXPECT_EQ(utils::commify(7), "7");
    EXPECT_EQ(utils::commify(10), "10");
    EXPECT_EQ(utils::commify(999), "999");
    EXPECT_EQ(utils::commify(1000), "1,000");
    EXPECT_EQ(utils::commify(12345), "12,345");
    EXPECT_EQ(utils::commify(16384), "16,384");
    EXPECT_EQ(utils::commify(100000), "100,000");
    EXPECT_EQ(utils::commify(1234567), "1,234,567");
    EXPECT_EQ(utils::commify(12345678), "12,345,678");
    EXPECT_EQ(utils::commify(18446744073709551615ull), "18,446,744,073,709,551,615");
}

TEST(HumanBytes, PicksLargestUnit) {
    EXPECT_EQ(utils::human_bytes(0), "0B");
    EXPECT_EQ(utils::human_bytes(512), "512B");
    EXPECT_EQ(utils::human_bytes(1023.7), "1023B");
    EXPECT_EQ(utils::human_bytes(1024), "1K");
    EXPECT_EQ(utils::human_bytes(1536), "1.5K");
    EXPECT_EQ(utils::human_bytes(1100), "1.1K");
    EXPECT_EQ(utils::human_bytes(1048576), "1M");
    EXPECT_EQ(utils::human_bytes(1572864), "1.5M");
    EXPECT_EQ(utils::human_bytes(3.0 * 1073741824.0), "3G");
}

TEST(HumanBytes, NegativeOrNanIsZero) {
    EXPECT_EQ(utils::human_bytes(-5), "0B");
    EXPECT_EQ(utils::human_bytes(0.0 / 0.0), "0B");
}

TEST(HumanTime, OmitsZeroComponentsButSeconds) {
    EXPECT_EQ(utils::human_time(0), "0s");
    EXPECT_EQ(utils::human_time(59.9), "59s");
    EXPECT_EQ(utils::human_time(60), "1m 0s");
    EXPECT_EQ(utils::human_time(3661), "1h 1m 1s");
    EXPECT_EQ(utils::human_time(86400), "1d 0s");
    EXPECT_EQ(utils::human_time(90061), "1d 1h 1m 1s");
    EXPECT_EQ(utils::human_time(7200 + 5), "2h 5s");
}

TEST(HumanTime, CollapsesPastNinetyNineDays) {
    EXPECT_EQ(utils::human_time(99.0 * 86400 + 3), "99d 3s");
    EXPECT_EQ(utils::human_time(100.0 * 86400), "100d+");
    EXPECT_EQ(utils::human_time(1e12), "11574074d+");
}

TEST(HumanTime, NegativeIsZero) {
    EXPECT_EQ(utils::human_time(-3), "0s");
}

TEST(ToHex, LowercaseNoPadding) {
    EXPECT_EQ(utils::to_hex(0), "0");
    EXPECT_EQ(utils::to_hex(10), "a");
    EXPECT_EQ(utils::to_hex(16384), "4000");
    EXPECT_EQ(utils::to_hex(1696), "6a0");
}

TEST(ParseDecimal, DigitsOnly) {
    u64 v = 0;
    EXPECT_TRUE(utils::parse_decimal("16384", v));
    EXPECT_EQ(v, 16384u);
    EXPECT_FALSE(utils::parse_decimal("", v));
    EXPECT_FALSE(utils::parse_decimal("-1", v));
    EXPECT_FALSE(utils::parse_decimal("12a", v));
    EXPECT_FALSE(utils::parse_decimal(" 12", v));
    EXPECT_FALSE(utils::parse_decimal("99999999999999999999999", v));
}

TEST(Basename, LastComponent) {
    EXPECT_EQ(utils::basename("/path/to/file.zip"), "file.zip");
    EXPECT_EQ(utils::basename("file.zip"), "file.zip");
    EXPECT_EQ(utils::basename("dir/sub/"), "sub");
    EXPECT_EQ(utils::basename("/"), "/");
}

TEST(StripV4Mapped, OnlyMappedAddresses) {
    EXPECT_EQ(strip_v4_mapped("::ffff:192.168.1.7"), "192.168.1.7");
    EXPECT_EQ(strip_v4_mapped("::ffff:abcd"), "::ffff:abcd");
    EXPECT_EQ(strip_v4_mapped("2001:db8::1"), "2001:db8::1");
    EXPECT_EQ(strip_v4_mapped("10.0.0.1"), "10.0.0.1");
}

TEST(Hash, StreamingMatchesOneShot) {
    std::string data = "The quick brown fox jumps over the lazy dog";
    hash::StreamHasher64 h;
    h.update(data.data(), 10);
    h.update(data.data() + 10, data.size() - 10);
    EXPECT_EQ(h.digest(), hash::xxh3_64(data.data(), data.size()));
    EXPECT_EQ(hash::to_hex(0x1234), "0000000000001234");
}
