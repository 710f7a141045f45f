#include "utils.h"
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace cronhub {
namespace utils {

std::string now_string() {
    using namespace std::chrono;

    auto now = system_clock::now();

    // 拆成秒 + 毫秒
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);

    std::tm buf {};
    localtime_r(&t, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string formatTimestampMs(const std::chrono::system_clock::time_point &ts)
{
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    std::time_t tt = std::chrono::system_clock::to_time_t(seconds);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    std::tm buf {};
    localtime_r(&tt, &buf);

    std::stringstream ss;
    ss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

namespace {

struct DurationUnit {
    const char* name;
    std::int64_t nanos;
};

const std::array<DurationUnit, 9> kUnits = {{
    {"ns", 1LL},
    {"us", 1000LL},
    {"\xC2\xB5s", 1000LL}, // U+00B5 micro sign
    {"\xCE\xBCs", 1000LL}, // U+03BC greek mu
    {"ms", 1000LL * 1000},
    {"s",  1000LL * 1000 * 1000},
    {"m",  60LL * 1000 * 1000 * 1000},
    {"h",  3600LL * 1000 * 1000 * 1000},
    {nullptr, 0},
}};

std::invalid_argument badDuration(const std::string& what, const std::string& orig) {
    return std::invalid_argument(what + " \"" + orig + "\"");
}

// 整数部分 + 去掉尾零的小数部分，例如 (1500, 3) -> "1.5"
std::string fixedTrim(std::int64_t value, int digits) {
    std::int64_t scale = 1;
    for (int i = 0; i < digits; ++i) scale *= 10;

    std::string out = std::to_string(value / scale);
    std::int64_t frac = value % scale;
    if (frac == 0) return out;

    std::string f = std::to_string(frac);
    f.insert(0, static_cast<std::size_t>(digits) - f.size(), '0');
    while (!f.empty() && f.back() == '0') f.pop_back();
    return out + "." + f;
}

} // namespace

std::chrono::nanoseconds parseDuration(const std::string &text)
{
    const std::string& orig = text;
    std::size_t i = 0;
    bool neg = false;

    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        neg = text[i] == '-';
        ++i;
    }
    if (text.substr(i) == "0") {
        return std::chrono::nanoseconds(0);
    }
    if (i == text.size()) {
        throw badDuration("invalid duration", orig);
    }

    const std::int64_t maxNanos = std::numeric_limits<std::int64_t>::max();
    std::int64_t total = 0;

    while (i < text.size()) {
        const char c = text[i];
        if (!(c == '.' || std::isdigit(static_cast<unsigned char>(c)))) {
            throw badDuration("invalid duration", orig);
        }

        // 整数部分
        std::int64_t whole = 0;
        bool pre = false;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (whole > (maxNanos - (text[i] - '0')) / 10) {
                throw badDuration("invalid duration", orig);
            }
            whole = whole * 10 + (text[i] - '0');
            pre = true;
            ++i;
        }

        // 小数部分
        std::int64_t frac = 0;
        std::int64_t scale = 1;
        bool post = false;
        if (i < text.size() && text[i] == '.') {
            ++i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                if (scale < 1000000000000000000LL) {
                    frac = frac * 10 + (text[i] - '0');
                    scale *= 10;
                }
                post = true;
                ++i;
            }
        }
        if (!pre && !post) {
            throw badDuration("invalid duration", orig);
        }

        // 单位
        const std::size_t unitStart = i;
        while (i < text.size() && text[i] != '.'
               && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (unitStart == i) {
            throw badDuration("missing unit in duration", orig);
        }
        const std::string unit = text.substr(unitStart, i - unitStart);

        std::int64_t unitNanos = 0;
        for (const auto& u : kUnits) {
            if (u.name && unit == u.name) {
                unitNanos = u.nanos;
                break;
            }
        }
        if (unitNanos == 0) {
            throw badDuration("unknown unit \"" + unit + "\" in duration", orig);
        }

        if (whole > maxNanos / unitNanos) {
            throw badDuration("invalid duration", orig);
        }
        std::int64_t v = whole * unitNanos;
        if (frac > 0) {
            v += static_cast<std::int64_t>(static_cast<long double>(frac)
                                           * static_cast<long double>(unitNanos)
                                           / static_cast<long double>(scale));
            if (v < 0) {
                throw badDuration("invalid duration", orig);
            }
        }
        if (v > maxNanos - total) {
            throw badDuration("invalid duration", orig);
        }
        total += v;
    }

    return std::chrono::nanoseconds(neg ? -total : total);
}

std::string formatDuration(std::chrono::nanoseconds d)
{
    std::int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    if (ns < 0) {
        sign = "-";
        ns = -ns;
    }

    if (ns < 1000LL) {
        return sign + std::to_string(ns) + "ns";
    }
    if (ns < 1000LL * 1000) {
        return sign + fixedTrim(ns, 3) + "\xC2\xB5s";
    }
    if (ns < 1000LL * 1000 * 1000) {
        return sign + fixedTrim(ns, 6) + "ms";
    }

    const std::int64_t hourNs = 3600LL * 1000 * 1000 * 1000;
    const std::int64_t minNs  = 60LL * 1000 * 1000 * 1000;

    std::string out = sign;
    const std::int64_t h = ns / hourNs;
    ns %= hourNs;
    const std::int64_t m = ns / minNs;
    ns %= minNs;

    if (h > 0) out += std::to_string(h) + "h";
    if (h > 0 || m > 0) out += std::to_string(m) + "m";
    out += fixedTrim(ns, 9) + "s";
    return out;
}

std::pair<int, std::string> run_command(const std::string &cmd)
{
    std::array<char, 256> buffer{};
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return { -1, "popen() failed" };
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        return { -1, result };
    }
    if (WIFEXITED(status)) {
        return { WEXITSTATUS(status), result };
    }
    // 被信号杀掉：按 shell 惯例 128 + signo
    if (WIFSIGNALED(status)) {
        return { 128 + WTERMSIG(status), result };
    }
    return { status, result };
}

} // namespace utils
} // namespace cronhub
