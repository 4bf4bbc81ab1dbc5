#include "format/content_id.hpp"

#include <string>

#include <gtest/gtest.h>

namespace mbdb::format {

// Reference values: sha1sum of the UTF-8 "domain-path" string.

TEST(ContentId, ReferenceIdentifier) {
    EXPECT_EQ(compute_content_id("AppDomain-example", "Library/file.db"),
              "0ae4b62b876ac3b0e3628fcf6128f367ec701640");
}

TEST(ContentId, IsFortyLowercaseHexChars) {
    const auto id = compute_content_id("HomeDomain", "Library/Preferences/com.example.plist");
    EXPECT_EQ(id, "0a6add080123e69c8052f33fa2b8d1a3f541bb52");
    ASSERT_EQ(id.size(), kContentIdLength);
    for (char c : id) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(ContentId, EmptyComponents) {
    EXPECT_EQ(compute_content_id("", ""),
              "3bc15c8aae3e4124dd409035f32ea2fd6835efc9");   // sha1("-")
    EXPECT_EQ(compute_content_id("MediaDomain", ""),
              "5e55e495dba2d2fa7e4a7904dca664d31071583b");
}

TEST(ContentId, Latin1InputHashedAsUtf8) {
    EXPECT_EQ(compute_content_id("HomeDomain", "Library/Caf\xE9.db"),
              "a38c9ead611ed32c91b8109cd7ee929ebb64ba1b");
}

TEST(ContentId, SeparatorIsPartOfInput) {
    // "a-b" + "c" and "a" + "b-c" hash the same string "a-b-c".
    EXPECT_EQ(compute_content_id("a-b", "c"), compute_content_id("a", "b-c"));
    EXPECT_NE(compute_content_id("ab", "c"), compute_content_id("a", "bc"));
}

} // namespace mbdb::format
