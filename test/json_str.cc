#include <oirun/json_str.hh>

#include <gtest/gtest.h>

using std::optional;
using std::string;
using std::vector;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(json_str, empty) {
    EXPECT_EQ(json_str::Object{}.into_str(), "{}");
    EXPECT_EQ(json_str::Array{}.into_str(), "[]");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(json_str, values) {
    json_str::Object obj;
    obj.prop("str", "a\"b\\c\n\t\x01");
    obj.prop("int", -42);
    obj.prop("bool", true);
    obj.prop("null", nullptr);
    obj.prop("missing", optional<int>{});
    obj.prop("present", optional<string>{"x"});
    obj.prop("list", vector<string>{"a", "b"});
    EXPECT_EQ(
        std::move(obj).into_str(),
        R"({"str":"a\"b\\c\n\t\u0001","int":-42,"bool":true,"null":null,"missing":null,)"
        R"("present":"x","list":["a","b"]})"
    );
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(json_str, nesting) {
    json_str::Array arr;
    arr.val_obj([](auto& obj) {
        obj.prop("a", 1);
        obj.prop_arr("b", [](auto& inner) {
            inner.val(2);
            inner.val_arr([](auto& /*unused*/) {});
        });
        obj.prop_obj("c", [](auto& /*unused*/) {});
    });
    arr.val("z");
    EXPECT_EQ(std::move(arr).into_str(), R"([{"a":1,"b":[2,[]],"c":{}},"z"])");
}
