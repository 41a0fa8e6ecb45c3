#include "netrec/network_key.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace netrec;

TEST(NetworkKeyTest, AcceptsQuotedSsid) {
    NetworkKey key("\"home\"", "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ("\"home\"", key.ssid());
    EXPECT_EQ("aa:bb:cc:dd:ee:ff", key.bssid());
    EXPECT_EQ("\"home\",aa:bb:cc:dd:ee:ff", key.toString());
}

TEST(NetworkKeyTest, AcceptsHexSsid) {
    NetworkKey key("0x686f6d65", "00:11:22:33:44:55");
    EXPECT_EQ("0x686f6d65", key.ssid());
}

TEST(NetworkKeyTest, RejectsUnquotedSsid) {
    EXPECT_THROW(NetworkKey("home", "00:11:22:33:44:55"), std::invalid_argument);
    EXPECT_THROW(NetworkKey("\"home", "00:11:22:33:44:55"), std::invalid_argument);
    EXPECT_THROW(NetworkKey("0x", "00:11:22:33:44:55"), std::invalid_argument);
    EXPECT_THROW(NetworkKey("0xzz", "00:11:22:33:44:55"), std::invalid_argument);
}

TEST(NetworkKeyTest, RejectsMalformedBssid) {
    EXPECT_THROW(NetworkKey("\"home\"", ""), std::invalid_argument);
    EXPECT_THROW(NetworkKey("\"home\"", "00:11:22:33:44"), std::invalid_argument);
    EXPECT_THROW(NetworkKey("\"home\"", "00-11-22-33-44-55"), std::invalid_argument);
    EXPECT_THROW(NetworkKey("\"home\"", "0g:11:22:33:44:55"), std::invalid_argument);
}

TEST(NetworkKeyTest, Wildcard) {
    NetworkKey key("\"home\"", "00:11:22:33:44:55");
    EXPECT_FALSE(key.isWildcard());

    NetworkKey wildcard = key.toWildcard();
    EXPECT_TRUE(wildcard.isWildcard());
    EXPECT_EQ(NetworkKey::wildcard("\"home\""), wildcard);
    EXPECT_EQ(std::string(kAnyBssid), wildcard.bssid());
}

TEST(NetworkKeyTest, EqualityIgnoresBssidCase) {
    EXPECT_EQ(NetworkKey("\"a\"", "AA:BB:CC:DD:EE:FF"), NetworkKey("\"a\"", "aa:bb:cc:dd:ee:ff"));
    EXPECT_NE(NetworkKey("\"a\"", "aa:bb:cc:dd:ee:ff"), NetworkKey("\"b\"", "aa:bb:cc:dd:ee:ff"));
}

TEST(NetworkKeyTest, Ordering) {
    NetworkKey a("\"a\"", "00:00:00:00:00:01");
    NetworkKey b("\"a\"", "00:00:00:00:00:02");
    NetworkKey c("\"b\"", "00:00:00:00:00:00");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b < c);
    EXPECT_FALSE(b < a);
}

TEST(NetworkKeyTest, QuoteAndUnquote) {
    EXPECT_EQ("\"x\"", quoteSsid("x"));
    EXPECT_EQ("\"x\"", quoteSsid("\"x\""));
    EXPECT_EQ("x", unquoteSsid("\"x\""));
    EXPECT_EQ("x", unquoteSsid("x"));
}

TEST(NetworkKeyTest, ValidBssid) {
    EXPECT_TRUE(isValidBssid("00:11:22:33:44:55"));
    EXPECT_TRUE(isValidBssid("AA:bb:CC:dd:EE:ff"));
    EXPECT_FALSE(isValidBssid("00:11:22:33:44:555"));
    EXPECT_FALSE(isValidBssid("invalid"));
}
