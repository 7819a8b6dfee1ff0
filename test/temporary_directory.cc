#include <oirun/file_manip.hh>
#include <oirun/temporary_directory.hh>

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <stdexcept>

using std::string;
using ::testing::MatchesRegex;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(temporary_directory, TemporaryDirectory) {
    TemporaryDirectory tmp_dir;
    EXPECT_EQ(tmp_dir.path(), "");
    EXPECT_EQ(tmp_dir.exists(), false);

    tmp_dir = TemporaryDirectory("/tmp/oirun-test.XXXXXX");
    EXPECT_THAT(tmp_dir.path(), MatchesRegex("/tmp/oirun-test\\..{6}/"));
    EXPECT_EQ(tmp_dir.exists(), true);
    EXPECT_EQ(is_directory(tmp_dir.path()), true);

    string path_to_test;
    {
        TemporaryDirectory other(tmp_dir.path() + "nested/dirs/other.XXXXXX");
        static_assert(not std::is_convertible_v<const char*, TemporaryDirectory>);
        EXPECT_EQ(is_directory(other.path()), true);
        put_file_contents(other.path() + "file", "contents");

        string path = tmp_dir.path();
        string other_path = other.path();
        tmp_dir = std::move(other);
        EXPECT_EQ(tmp_dir.exists(), true);
        EXPECT_EQ(other.exists(), false); // NOLINT(bugprone-use-after-move)
        EXPECT_EQ(is_directory(path), false);
        EXPECT_EQ(is_directory(other_path), true);
        EXPECT_EQ(tmp_dir.path(), other_path);

        other = std::move(tmp_dir);
        path_to_test = std::move(other_path);
        EXPECT_EQ(other.exists(), true);
        EXPECT_EQ(tmp_dir.exists(), false); // NOLINT(bugprone-use-after-move)
    }

    EXPECT_EQ(is_directory(path_to_test), false);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(temporary_directory, remove) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    string path = tmp_dir.path();
    put_file_contents(path + "a", "x");
    tmp_dir.remove();
    EXPECT_EQ(tmp_dir.exists(), false);
    EXPECT_EQ(path_exists(path), false);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(temporary_directory, invalid_template) {
    EXPECT_THROW(TemporaryDirectory("/tmp/oirun-test.XXX"), std::runtime_error);
}
