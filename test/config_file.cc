#include <oirun/config_file.hh>
#include <oirun/file_manip.hh>
#include <oirun/temporary_directory.hh>

#include <gtest/gtest.h>

using std::string;
using std::vector;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, load_config_from_string) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "d", "e", "f", "unset");
    cf.load_config_from_string(R"(
# comment
a: plain value   # trailing comment
b = 'it''s quoted'
c = "tab\there \x41"
d: [x, 'y z', "w"
    # comment inside an array
    v,]
e:
f = 42
ignored: 1
)");

    EXPECT_EQ(cf["a"].as_string(), "plain value");
    EXPECT_EQ(cf["b"].as_string(), "it's quoted");
    EXPECT_EQ(cf["c"].as_string(), "tab\there A");
    EXPECT_TRUE(cf["d"].is_array());
    EXPECT_EQ(cf["d"].as_array(), (vector<string>{"x", "y z", "w", "v"}));
    EXPECT_TRUE(cf["e"].is_set());
    EXPECT_EQ(cf["e"].as_string(), "");
    EXPECT_EQ(cf["f"].as<int>(), 42);
    EXPECT_FALSE(cf["unset"].is_set());
    EXPECT_FALSE(cf["ignored"].is_set());
    EXPECT_FALSE(cf["no such"].is_set());
    EXPECT_EQ(cf.get_vars().count("ignored"), 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x.y-z_1: on\n", true);
    EXPECT_TRUE(cf["x.y-z_1"].as_bool());
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, reload_resets_variables) {
    ConfigFile cf;
    cf.add_vars("a");
    cf.load_config_from_string("a: 1");
    EXPECT_TRUE(cf["a"].is_set());
    cf.load_config_from_string("# nothing");
    EXPECT_FALSE(cf["a"].is_set());
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, as_bool) {
    ConfigFile cf;
    cf.add_vars("t1", "t2", "t3", "f1", "f2");
    cf.load_config_from_string("t1: YES\nt2: 1\nt3: True\nf1: no\nf2: 2\n");
    EXPECT_TRUE(cf["t1"].as_bool());
    EXPECT_TRUE(cf["t2"].as_bool());
    EXPECT_TRUE(cf["t3"].as_bool());
    EXPECT_FALSE(cf["f1"].as_bool());
    EXPECT_FALSE(cf["f2"].as_bool());
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, parse_errors) {
    auto parse = [](const char* text) {
        ConfigFile cf;
        cf.load_config_from_string(text);
    };
    EXPECT_THROW(parse("a 'b'"), ConfigFile::ParseError);
    EXPECT_THROW(parse("= 1"), ConfigFile::ParseError);
    EXPECT_THROW(parse("a: 'unterminated"), ConfigFile::ParseError);
    EXPECT_THROW(parse("a: \"bad \\q escape\""), ConfigFile::ParseError);
    EXPECT_THROW(parse("a: [1, 2"), ConfigFile::ParseError);
    EXPECT_THROW(parse("a: 'x' y"), ConfigFile::ParseError);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, parse_error_position) {
    ConfigFile cf;
    try {
        cf.load_config_from_string("a: 1\nb ? 2\n");
        FAIL() << "expected an exception";
    } catch (const ConfigFile::ParseError& pe) {
        EXPECT_EQ(string(pe.what()).substr(0, 9), "line 2:3:");
        EXPECT_EQ(pe.diagnostics(), "b ? 2\n  ^");
    }
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(ConfigFile, load_config_from_file) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    put_file_contents(tmp_dir.path() + "oirun.conf", "backend: container\n");
    ConfigFile cf;
    cf.add_vars("backend");
    cf.load_config_from_file(tmp_dir.path() + "oirun.conf");
    EXPECT_EQ(cf["backend"].as_string(), "container");
    EXPECT_THROW(cf.load_config_from_file(tmp_dir.path() + "missing.conf"), std::runtime_error);
}
