#include <array>
#include <cstdio>
#include <oirun/errmsg.hh>
#include <oirun/macros/throw.hh>
#include <oirun/string_transform.hh>
#include <oirun/time.hh>

using std::string;

namespace {

string format_time_t(
    struct tm* (*time_t_to_tm)(const time_t*, struct tm*),
    const char* time_t_to_tm_func_name,
    time_t time,
    const char* format
) {
    struct tm t = {};
    if (not time_t_to_tm(&time, &t)) {
        THROW(time_t_to_tm_func_name, "()", errmsg());
    }
    string res(32, '\0');
    size_t len = strftime(res.data(), res.size(), format, &t);
    res.resize(len);
    return res;
}

} // namespace

string local_datetime() {
    time_t curr_time = 0;
    if (time(&curr_time) == static_cast<time_t>(-1)) {
        THROW("time()", errmsg());
    }
    return format_time_t(localtime_r, "localtime_r", curr_time, "%Y-%m-%d %H:%M:%S");
}

string utc_iso8601(std::chrono::system_clock::time_point time) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    auto ms = duration_cast<milliseconds>(time.time_since_epoch()).count();
    auto secs = ms / 1000;
    auto ms_part = ms % 1000;
    if (ms_part < 0) {
        ms_part += 1000;
        --secs;
    }

    auto res = format_time_t(gmtime_r, "gmtime_r", static_cast<time_t>(secs), "%Y-%m-%dT%H:%M:%S");
    std::array<char, 8> frac{};
    (void)snprintf(frac.data(), frac.size(), ".%03d", static_cast<int>(ms_part));
    return concat_tostr(res, frac.data(), 'Z');
}

std::optional<std::chrono::system_clock::time_point> parse_utc_iso8601(std::string_view str) {
    // YYYY-mm-ddTHH:MM:SS
    if (str.size() < 19 or str[4] != '-' or str[7] != '-' or str[10] != 'T' or str[13] != ':' or
        str[16] != ':')
    {
        return std::nullopt;
    }

    auto year = str2num<int>(str.substr(0, 4));
    auto month = str2num<int>(str.substr(5, 2));
    auto day = str2num<int>(str.substr(8, 2));
    auto hour = str2num<int>(str.substr(11, 2));
    auto minute = str2num<int>(str.substr(14, 2));
    auto second = str2num<int>(str.substr(17, 2));
    if (not year or not month or not day or not hour or not minute or not second) {
        return std::nullopt;
    }
    if (*month < 1 or *month > 12 or *day < 1 or *day > 31 or *hour > 23 or *minute > 59 or
        *second > 60)
    {
        return std::nullopt;
    }

    int millis = 0;
    auto rest = str.substr(19);
    if (has_prefix(rest, ".")) {
        size_t len = 1;
        while (len < rest.size() and is_digit(rest[len])) {
            ++len;
        }
        if (len == 1) {
            return std::nullopt;
        }
        auto digits = rest.substr(1, std::min<size_t>(len - 1, 3));
        millis = str2num<int>(digits).value_or(0);
        for (size_t i = digits.size(); i < 3; ++i) {
            millis *= 10;
        }
        rest.remove_prefix(len);
    }
    if (rest == "Z") {
        rest.remove_prefix(1);
    }
    if (not rest.empty()) {
        return std::nullopt;
    }

    struct tm t = {};
    t.tm_year = *year - 1900;
    t.tm_mon = *month - 1;
    t.tm_mday = *day;
    t.tm_hour = *hour;
    t.tm_min = *minute;
    t.tm_sec = *second;
    time_t secs = timegm(&t);
    if (secs == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::time_point{std::chrono::seconds{secs}} +
        std::chrono::milliseconds{millis};
}
