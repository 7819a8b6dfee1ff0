#include <oirun/language.hh>

#include <gtest/gtest.h>

using oirun::Language;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(language, language_from_id) {
    EXPECT_EQ(oirun::language_from_id("c"), Language::C);
    for (auto id : {"cpp", "cxx", "cc", "c++"}) {
        EXPECT_EQ(oirun::language_from_id(id), Language::CPP) << id;
    }
    EXPECT_EQ(oirun::language_from_id("python"), Language::PYTHON);
    EXPECT_EQ(oirun::language_from_id("py"), Language::PYTHON);
    EXPECT_EQ(oirun::language_from_id("C"), std::nullopt);
    EXPECT_EQ(oirun::language_from_id("java"), std::nullopt);
    EXPECT_EQ(oirun::language_from_id(""), std::nullopt);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(language, language_from_path) {
    EXPECT_EQ(oirun::language_from_path("/a/b/sol.c"), Language::C);
    EXPECT_EQ(oirun::language_from_path("sol.cpp"), Language::CPP);
    EXPECT_EQ(oirun::language_from_path("sol.cc"), Language::CPP);
    EXPECT_EQ(oirun::language_from_path("sol.cxx"), Language::CPP);
    EXPECT_EQ(oirun::language_from_path("brute.py"), Language::PYTHON);
    EXPECT_EQ(oirun::language_from_path("notes.txt"), std::nullopt);
    EXPECT_EQ(oirun::language_from_path("dir.cpp/binary"), std::nullopt);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(language, extensions) {
    EXPECT_TRUE(oirun::extension_matches(Language::CPP, "cc"));
    EXPECT_FALSE(oirun::extension_matches(Language::C, "cpp"));
    EXPECT_FALSE(oirun::extension_matches(Language::PYTHON, "pyc"));
    static_assert(oirun::default_extension(Language::PYTHON) == "py");
    static_assert(oirun::to_str(Language::CPP) == "cpp");
    static_assert(oirun::is_compiled(Language::C));
    static_assert(not oirun::is_compiled(Language::PYTHON));
}
