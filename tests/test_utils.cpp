#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <managers/dir_lister.hpp>
#include <managers/remote_ops.hpp>

TEST(Utils, ShellEscapePlain) {
    EXPECT_EQ(shell_escape("abc"), "'abc'");
}

TEST(Utils, ShellEscapeSingleQuote) {
    EXPECT_EQ(shell_escape("it's"), "'it'\\''s'");
}

TEST(Utils, ShellEscapeMetacharacters) {
    EXPECT_EQ(shell_escape("$(rm -rf /); `x`"), "'$(rm -rf /); `x`'");
}

TEST(Utils, PosixJoin) {
    EXPECT_EQ(posix_join("/a", "b"), "/a/b");
    EXPECT_EQ(posix_join("/a/", "b"), "/a/b");
    EXPECT_EQ(posix_join("/", "b"), "/b");
    EXPECT_EQ(posix_join("/a", "/abs"), "/abs");
    EXPECT_EQ(posix_join("", "b"), "b");
}

TEST(Utils, PosixDirname) {
    EXPECT_EQ(posix_dirname("/a/b/c.txt"), "/a/b");
    EXPECT_EQ(posix_dirname("/a"), "/");
    EXPECT_EQ(posix_dirname("/a/b/"), "/a");
    EXPECT_EQ(posix_dirname("file"), ".");
}

TEST(Utils, PosixBasename) {
    EXPECT_EQ(posix_basename("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(posix_basename("/a/b/"), "b");
    EXPECT_EQ(posix_basename("/"), "/");
}

TEST(Utils, Base64KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_decode("Zm9vYmFy"), "foobar");
}

TEST(Utils, Base64DecodeSkipsWhitespaceAndStopsAtPadding) {
    EXPECT_EQ(base64_decode("Zm9v\nYmE=garbage"), "fooba");
}

TEST(Utils, Base64BinaryBytes) {
    std::string bytes("\x00\xff\x10\x80", 4);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
}

TEST(Utils, RandomTokenLength) {
    EXPECT_EQ(random_token(4).size(), 8u);
    EXPECT_NE(random_token(), random_token());
}

TEST(NumberLines, NoRangeReturnsContentUnchanged) {
    EXPECT_EQ(number_lines("a\nb\n", std::nullopt, std::nullopt), "a\nb\n");
}

TEST(NumberLines, OffsetAndLimit) {
    std::string text = "one\ntwo\nthree\nfour";
    EXPECT_EQ(number_lines(text, 2, 2), "2\ttwo\n3\tthree");
}

TEST(NumberLines, OffsetOnlyRunsToEnd) {
    EXPECT_EQ(number_lines("a\nb\nc", 3, std::nullopt), "3\tc");
}

TEST(NumberLines, LimitPastEndIsClamped) {
    EXPECT_EQ(number_lines("a\nb", 1, 10), "1\ta\n2\tb");
}

TEST(NumberLines, OffsetPastEndIsEmpty) {
    EXPECT_EQ(number_lines("a\nb", 9, 1), "");
}

TEST(GrepOutput, ParsesFileLineText) {
    auto matches = parse_grep_output("/src/a.cpp:12:int main() {\n/src/b.hpp:3:// x:y\n");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].file, "/src/a.cpp");
    EXPECT_EQ(matches[0].line, 12);
    EXPECT_EQ(matches[0].text, "int main() {");
    EXPECT_EQ(matches[1].file, "/src/b.hpp");
    EXPECT_EQ(matches[1].text, "// x:y");
}

TEST(GrepOutput, SkipsUnparseableLines) {
    auto matches = parse_grep_output("Binary file x matches\n\n/a:1:hit");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].file, "/a");
}

TEST(ListLimit, Clamp) {
    EXPECT_EQ(clamp_list_limit(1), 1);
    EXPECT_EQ(clamp_list_limit(500), 500);
    EXPECT_EQ(clamp_list_limit(1001), 1000);
    EXPECT_EQ(clamp_list_limit(0), 1);
}
