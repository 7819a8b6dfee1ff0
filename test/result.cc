#include <gtest/gtest.h>
#include <oirun/result.hh>
#include <string>

using std::string;

static_assert(Result<void, char>{Ok{}}.is_ok());
static_assert(not Result<void, char>{Err{'a'}}.is_ok());
static_assert(Result<void, char>{Err{'a'}}.is_err());
static_assert(not Result<void, char>{Ok{}}.is_err());

struct Noncopyable {
    Noncopyable() = default;
    Noncopyable(const Noncopyable&) = delete;
    Noncopyable(Noncopyable&&) = default;
    Noncopyable& operator=(const Noncopyable&) = delete;
    Noncopyable& operator=(Noncopyable&&) = default;
    ~Noncopyable() = default;

    // NOLINTNEXTLINE(readability-convert-member-functions-to-static)
    [[nodiscard]] constexpr bool to_bool() const noexcept { return true; }
};

static_assert(Result<Noncopyable, char>{Ok{Noncopyable{}}}.unwrap().to_bool());
static_assert(Result<char, Noncopyable>{Err{Noncopyable{}}}.unwrap_err().to_bool());
static_assert((Result<void, int>{Ok{}}.unwrap(), true));
static_assert((Result<int, void>{Err{}}.unwrap_err(), true));

static_assert(Result<int, char>{Ok{42}}.ok() == 42);
static_assert(Result<int, char>{Err{'x'}}.err() == 'x');

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(Result, strings) {
    auto fetch = [](bool fail) -> Result<string, string> {
        if (fail) {
            return Err{string{"404 Not Found"}};
        }
        return Ok{string{"18.1.8"}};
    };

    auto res = fetch(false);
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.ok(), "18.1.8");
    EXPECT_EQ(std::move(res).unwrap(), "18.1.8");

    res = fetch(true);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.err(), "404 Not Found");
    EXPECT_EQ(std::move(res).unwrap_err(), "404 Not Found");
}
