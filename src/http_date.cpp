#include "rest_check/http_date.hpp"

#include <array>

namespace rest_check {

    namespace {

        using namespace std::chrono;

        constexpr std::array<std::string_view, 7> kShortDays = {
            "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
        constexpr std::array<std::string_view, 7> kLongDays = {
            "Monday", "Tuesday",  "Wednesday", "Thursday",
            "Friday", "Saturday", "Sunday"};
        constexpr std::array<std::string_view, 12> kMonths = {
            "Jan", "Feb", "Mar", "Apr", "May", "Jun",
            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

        /// Left-to-right scanner over a header value.
        struct Cursor {
            std::string_view rest;

            bool literal(std::string_view lit) {
                if (rest.substr(0, lit.size()) != lit) return false;
                rest.remove_prefix(lit.size());
                return true;
            }

            std::optional<int> digits(size_t n) {
                if (rest.size() < n) return std::nullopt;
                int v = 0;
                for (size_t i = 0; i < n; ++i) {
                    const char c = rest[i];
                    if (c < '0' || c > '9') return std::nullopt;
                    v = v * 10 + (c - '0');
                }
                rest.remove_prefix(n);
                return v;
            }

            template <size_t N>
            std::optional<int> one_of(
                const std::array<std::string_view, N>& names) {
                for (size_t i = 0; i < N; ++i) {
                    if (literal(names[i])) return static_cast<int>(i);
                }
                return std::nullopt;
            }

            bool done() const noexcept { return rest.empty(); }
        };

        struct Fields {
            int weekday{0};  // 0 = Monday, as in kShortDays
            int year{0};
            int month{0};  // 1-12
            int day{0};
            int hour{0};
            int minute{0};
            int second{0};
        };

        /// HH:MM:SS
        bool parse_time(Cursor& c, Fields& f) {
            auto h = c.digits(2);
            if (!h || !c.literal(":")) return false;
            auto m = c.digits(2);
            if (!m || !c.literal(":")) return false;
            auto s = c.digits(2);
            if (!s) return false;
            if (*h > 23 || *m > 59 || *s > 59) return false;
            f.hour = *h;
            f.minute = *m;
            f.second = *s;
            return true;
        }

        bool parse_month(Cursor& c, Fields& f) {
            auto m = c.one_of(kMonths);
            if (!m) return false;
            f.month = *m + 1;
            return true;
        }

        std::optional<Fields> parse_imf_fixdate(std::string_view value) {
            Cursor c{value};
            Fields f;
            auto wd = c.one_of(kShortDays);
            if (!wd || !c.literal(", ")) return std::nullopt;
            f.weekday = *wd;
            auto d = c.digits(2);
            if (!d || !c.literal(" ") || !parse_month(c, f) ||
                !c.literal(" ")) {
                return std::nullopt;
            }
            auto y = c.digits(4);
            if (!y || !c.literal(" ") || !parse_time(c, f) ||
                !c.literal(" GMT") || !c.done()) {
                return std::nullopt;
            }
            f.day = *d;
            f.year = *y;
            return f;
        }

        std::optional<Fields> parse_rfc850(std::string_view value,
                                           int current_year) {
            Cursor c{value};
            Fields f;
            auto wd = c.one_of(kLongDays);
            if (!wd || !c.literal(", ")) return std::nullopt;
            f.weekday = *wd;
            auto d = c.digits(2);
            if (!d || !c.literal("-") || !parse_month(c, f) ||
                !c.literal("-")) {
                return std::nullopt;
            }
            auto yy = c.digits(2);
            if (!yy || !c.literal(" ") || !parse_time(c, f) ||
                !c.literal(" GMT") || !c.done()) {
                return std::nullopt;
            }
            int year = (current_year / 100) * 100 + *yy;
            if (year > current_year + 50) {
                year -= 100;
            } else if (year < current_year - 49) {
                year += 100;
            }
            f.day = *d;
            f.year = year;
            return f;
        }

        std::optional<Fields> parse_asctime(std::string_view value) {
            Cursor c{value};
            Fields f;
            auto wd = c.one_of(kShortDays);
            if (!wd || !c.literal(" ") || !parse_month(c, f) ||
                !c.literal(" ")) {
                return std::nullopt;
            }
            f.weekday = *wd;
            std::optional<int> d;
            if (c.literal(" ")) {
                d = c.digits(1);
            } else {
                d = c.digits(2);
            }
            if (!d || !c.literal(" ") || !parse_time(c, f) || !c.literal(" ")) {
                return std::nullopt;
            }
            auto y = c.digits(4);
            if (!y || !c.done()) return std::nullopt;
            f.day = *d;
            f.year = *y;
            return f;
        }

        std::optional<system_clock::time_point> to_time_point(const Fields& f) {
            const year_month_day ymd{year{f.year},
                                     month{static_cast<unsigned>(f.month)},
                                     day{static_cast<unsigned>(f.day)}};
            if (!ymd.ok()) return std::nullopt;
            // The day name must agree with the date.
            const weekday wd{sys_days{ymd}};
            if (wd.iso_encoding() != static_cast<unsigned>(f.weekday) + 1) {
                return std::nullopt;
            }
            return sys_days{ymd} + hours{f.hour} + minutes{f.minute} +
                   seconds{f.second};
        }

    }  // namespace

    std::optional<system_clock::time_point> parse_http_date(
        std::string_view value, system_clock::time_point now) {
        if (auto f = parse_imf_fixdate(value)) return to_time_point(*f);

        const year_month_day today{std::chrono::floor<days>(now)};
        if (auto f = parse_rfc850(value, static_cast<int>(today.year()))) {
            return to_time_point(*f);
        }

        if (auto f = parse_asctime(value)) return to_time_point(*f);
        return std::nullopt;
    }

    std::optional<system_clock::time_point> parsed_date_header(
        const Response& response) {
        auto value = response.header("Date");
        if (!value) return std::nullopt;
        return parse_http_date(*value);
    }

}  // namespace rest_check
