#include <gtest/gtest.h>
#include <snipvault/store/content_kind.h>

using namespace snipvault;
using namespace snipvault::store;

TEST(ContentKindTest, DetectsUrls) {
    EXPECT_EQ(detectContentKind("https://example.com/a?b=c"), ContentKind::Url);
    EXPECT_EQ(detectContentKind("  FTP://files.example.com "), ContentKind::Url);
    EXPECT_EQ(detectContentKind("www.example.com"), ContentKind::Url);
}

TEST(ContentKindTest, DetectsPaths) {
    EXPECT_EQ(detectContentKind("C:\\Users\\me"), ContentKind::Path);
    EXPECT_EQ(detectContentKind("/etc/hosts"), ContentKind::Path);
    EXPECT_EQ(detectContentKind("~/notes"), ContentKind::Path);
    EXPECT_EQ(detectContentKind("report.PDF"), ContentKind::Path);
}

TEST(ContentKindTest, DetectsCode) {
    EXPECT_EQ(detectContentKind("git status"), ContentKind::Code);
    EXPECT_EQ(detectContentKind("SELECT * FROM t"), ContentKind::Code);
    EXPECT_EQ(detectContentKind("x = compute(1)"), ContentKind::Code);
    EXPECT_EQ(detectContentKind("std::vector<int> v;"), ContentKind::Code);
}

TEST(ContentKindTest, FallsBackToText) {
    EXPECT_EQ(detectContentKind("remember the milk"), ContentKind::Text);
    EXPECT_EQ(detectContentKind("   "), ContentKind::Text);
}

TEST(ContentKindTest, KindStrings) {
    EXPECT_STREQ(contentKindToString(ContentKind::Path), "path");
    EXPECT_EQ(contentKindFromString("URL"), ContentKind::Url);
    EXPECT_EQ(contentKindFromString("command"), ContentKind::Code);
    EXPECT_FALSE(contentKindFromString("binary").has_value());
}

TEST(ContentKindTest, ValidatesContentAgainstKind) {
    EXPECT_TRUE(validateContent(ContentKind::Url, "https://example.com"));
    EXPECT_FALSE(validateContent(ContentKind::Url, "example.com"));
    EXPECT_FALSE(validateContent(ContentKind::Url, "https://"));
    EXPECT_FALSE(validateContent(ContentKind::Text, " \n"));
    EXPECT_FALSE(validateContent(ContentKind::Path, std::string_view("a\0b", 3)));
    EXPECT_TRUE(validateContent(ContentKind::Code, "ls -la"));
}
