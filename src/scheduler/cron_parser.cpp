#include "cron_parser.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include "core/utils.h"
#include "cron_spec.h"
#include "interval_schedule.h"

namespace cronhub::scheduler {

namespace {

// 每个字段的取值范围，以及可用的名字（jan, mon ...）
struct Bounds {
    unsigned min;
    unsigned max;
    const std::map<std::string, unsigned>* names;
};

const std::map<std::string, unsigned> kMonthNames = {
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12},
};

const std::map<std::string, unsigned> kDowNames = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3},
    {"thu", 4}, {"fri", 5}, {"sat", 6},
};

const Bounds kSeconds{0, 59, nullptr};
const Bounds kMinutes{0, 59, nullptr};
const Bounds kHours{0, 23, nullptr};
const Bounds kDom{1, 31, nullptr};
const Bounds kMonths{1, 12, &kMonthNames};
const Bounds kDow{0, 6, &kDowNames};

// 字段位置与默认值，顺序：秒 分 时 日 月 周
const std::array<unsigned, 6> kPlaces = {
    ParseOption::Second, ParseOption::Minute, ParseOption::Hour,
    ParseOption::Dom, ParseOption::Month, ParseOption::Dow,
};

const std::array<const char*, 6> kDefaults = {"0", "0", "0", "*", "*", "*"};

std::vector<std::string> splitFields(const std::string& s) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        if (i >= s.size()) {
            break;
        }
        const std::size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        out.push_back(s.substr(start, i - start));
    }
    return out;
}

// 与 splitFields 不同：保留空串，"1--2" 按 '-' 切成三段
std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string joinFields(const std::vector<std::string>& fields) {
    std::string out = "[";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ' ';
        out += fields[i];
    }
    return out + "]";
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

unsigned mustParseInt(const std::string& expr) {
    const char* first = expr.data();
    const char* last = expr.data() + expr.size();
    if (first != last && *first == '+') {
        ++first;
    }

    long long num = 0;
    const auto [ptr, ec] = std::from_chars(first, last, num);
    if (first == last || ec != std::errc() || ptr != last) {
        const char* reason = ec == std::errc::result_out_of_range
                                 ? "value out of range" : "invalid syntax";
        throw std::invalid_argument("failed to parse int from " + expr + ": " + reason);
    }
    if (num < 0) {
        throw std::invalid_argument("negative number (" + std::to_string(num)
                                    + ") not allowed: " + expr);
    }
    if (num > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
        throw std::invalid_argument("failed to parse int from " + expr + ": value out of range");
    }
    return static_cast<unsigned>(num);
}

unsigned parseIntOrName(const std::string& expr, const Bounds& r) {
    if (r.names) {
        std::string lower = expr;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const auto it = r.names->find(lower);
        if (it != r.names->end()) {
            return it->second;
        }
    }
    return mustParseInt(expr);
}

// [min, max] 内按 step 取值的位集合
std::uint64_t getBits(unsigned min, unsigned max, unsigned step) {
    if (step == 1) {
        return ~(~0ULL << (max + 1)) & (~0ULL << min);
    }
    // step 可以大到 UINT_MAX，用 64 位累加避免回绕
    std::uint64_t bits = 0;
    for (std::uint64_t i = min; i <= max; i += step) {
        bits |= 1ULL << i;
    }
    return bits;
}

std::uint64_t all(const Bounds& r) {
    return getBits(r.min, r.max, 1) | kStarBit;
}

// number | number "-" number [ "/" number ]，* 与 ? 代表整个范围
std::uint64_t getRange(const std::string& expr, const Bounds& r) {
    const auto rangeAndStep = splitOn(expr, '/');
    const auto lowAndHigh = splitOn(rangeAndStep[0], '-');
    const bool singleDigit = lowAndHigh.size() == 1;

    unsigned start = 0;
    unsigned end = 0;
    unsigned step = 1;
    std::uint64_t extra = 0;

    if (lowAndHigh[0] == "*" || lowAndHigh[0] == "?") {
        start = r.min;
        end = r.max;
        extra = kStarBit;
    } else {
        start = parseIntOrName(lowAndHigh[0], r);
        switch (lowAndHigh.size()) {
        case 1:
            end = start;
            break;
        case 2:
            end = parseIntOrName(lowAndHigh[1], r);
            break;
        default:
            throw std::invalid_argument("too many hyphens: " + expr);
        }
    }

    switch (rangeAndStep.size()) {
    case 1:
        step = 1;
        break;
    case 2:
        step = mustParseInt(rangeAndStep[1]);
        // "N/step" 等价于 "N-max/step"
        if (singleDigit) {
            end = r.max;
        }
        if (step > 1) {
            extra = 0;
        }
        break;
    default:
        throw std::invalid_argument("too many slashes: " + expr);
    }

    if (start < r.min) {
        throw std::invalid_argument("beginning of range (" + std::to_string(start)
                                    + ") below minimum (" + std::to_string(r.min) + "): " + expr);
    }
    if (end > r.max) {
        throw std::invalid_argument("end of range (" + std::to_string(end)
                                    + ") above maximum (" + std::to_string(r.max) + "): " + expr);
    }
    if (start > end) {
        throw std::invalid_argument("beginning of range (" + std::to_string(start)
                                    + ") beyond end of range (" + std::to_string(end) + "): " + expr);
    }
    if (step == 0) {
        throw std::invalid_argument("step of range should be a positive number: " + expr);
    }

    return getBits(start, end, step) | extra;
}

// 逗号分隔的多个 range 取并集；空的片段忽略
std::uint64_t getField(const std::string& field, const Bounds& r) {
    std::uint64_t bits = 0;
    for (const auto& expr : splitOn(field, ',')) {
        if (expr.empty()) {
            continue;
        }
        bits |= getRange(expr, r);
    }
    return bits;
}

SchedulePtr parseDescriptor(const std::string& descriptor,
                            const std::optional<core::TimeZone>& loc) {
    const std::uint64_t sec0  = 1ULL << kSeconds.min;
    const std::uint64_t min0  = 1ULL << kMinutes.min;
    const std::uint64_t hour0 = 1ULL << kHours.min;

    if (descriptor == "@yearly" || descriptor == "@annually") {
        return std::make_shared<CronSpec>(sec0, min0, hour0, 1ULL << kDom.min,
                                          1ULL << kMonths.min, all(kDow), loc);
    }
    if (descriptor == "@monthly") {
        return std::make_shared<CronSpec>(sec0, min0, hour0, 1ULL << kDom.min,
                                          all(kMonths), all(kDow), loc);
    }
    if (descriptor == "@weekly") {
        return std::make_shared<CronSpec>(sec0, min0, hour0, all(kDom),
                                          all(kMonths), 1ULL << kDow.min, loc);
    }
    if (descriptor == "@daily" || descriptor == "@midnight") {
        return std::make_shared<CronSpec>(sec0, min0, hour0, all(kDom),
                                          all(kMonths), all(kDow), loc);
    }
    if (descriptor == "@hourly") {
        return std::make_shared<CronSpec>(sec0, min0, all(kHours), all(kDom),
                                          all(kMonths), all(kDow), loc);
    }

    static const std::string kEvery = "@every ";
    if (startsWith(descriptor, kEvery.c_str())) {
        Duration d{};
        try {
            d = utils::parseDuration(descriptor.substr(kEvery.size()));
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument("failed to parse duration " + descriptor + ": " + ex.what());
        }
        return std::make_shared<IntervalSchedule>(every(d));
    }

    throw std::invalid_argument("unrecognized descriptor: " + descriptor);
}

} // namespace

CronParser::CronParser(unsigned options)
    : _options(options)
{
    if ((options & ParseOption::SecondOptional) && (options & ParseOption::DowOptional)) {
        throw std::logic_error("multiple optionals may not be configured");
    }
}

std::shared_ptr<const CronParser> CronParser::standard() {
    static const std::shared_ptr<const CronParser> parser = std::make_shared<CronParser>(
        ParseOption::Minute | ParseOption::Hour | ParseOption::Dom
        | ParseOption::Month | ParseOption::Dow | ParseOption::Descriptor);
    return parser;
}

std::shared_ptr<const CronParser> CronParser::withSeconds() {
    static const std::shared_ptr<const CronParser> parser = std::make_shared<CronParser>(
        ParseOption::Second | ParseOption::Minute | ParseOption::Hour | ParseOption::Dom
        | ParseOption::Month | ParseOption::Dow | ParseOption::Descriptor);
    return parser;
}

SchedulePtr CronParser::parse(const std::string& spec) const {
    if (spec.empty()) {
        throw std::invalid_argument("empty spec string");
    }

    // 时区前缀：TZ=America/New_York 0 6 * * ?
    std::string rest = spec;
    std::optional<core::TimeZone> loc;
    if (startsWith(rest, "TZ=") || startsWith(rest, "CRON_TZ=")) {
        const std::size_t eq = rest.find('=');
        const std::size_t sp = rest.find(' ', eq);
        if (sp == std::string::npos) {
            throw std::invalid_argument("missing schedule after time zone: " + spec);
        }
        const std::string name = rest.substr(eq + 1, sp - eq - 1);
        try {
            core::TimeZone zone = core::TimeZone::load(name);
            if (!zone.isLocal()) {
                loc = zone;
            }
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument("provided bad location " + name + ": " + ex.what());
        }
        rest = trim(rest.substr(sp));
    }

    if (startsWith(rest, "@")) {
        if (!(_options & ParseOption::Descriptor)) {
            throw std::invalid_argument("parser does not accept descriptors: " + rest);
        }
        return parseDescriptor(rest, loc);
    }

    const auto fields = normalizeFields(splitFields(rest));

    // 任一字段出错立即抛出，不会产生半成品
    const std::uint64_t second = getField(fields[0], kSeconds);
    const std::uint64_t minute = getField(fields[1], kMinutes);
    const std::uint64_t hour   = getField(fields[2], kHours);
    const std::uint64_t dom    = getField(fields[3], kDom);
    const std::uint64_t month  = getField(fields[4], kMonths);
    const std::uint64_t dow    = getField(fields[5], kDow);

    return std::make_shared<CronSpec>(second, minute, hour, dom, month, dow, loc);
}

std::vector<std::string> CronParser::normalizeFields(const std::vector<std::string>& fields) const {
    unsigned options = _options;
    int optionals = 0;
    if (options & ParseOption::SecondOptional) {
        options |= ParseOption::Second;
        ++optionals;
    }
    if (options & ParseOption::DowOptional) {
        options |= ParseOption::Dow;
        ++optionals;
    }

    int max = 0;
    for (unsigned place : kPlaces) {
        if (options & place) {
            ++max;
        }
    }
    const int min = max - optionals;

    const int count = static_cast<int>(fields.size());
    if (count < min || count > max) {
        if (min == max) {
            throw std::invalid_argument("expected exactly " + std::to_string(min)
                                        + " fields, found " + std::to_string(count)
                                        + ": " + joinFields(fields));
        }
        throw std::invalid_argument("expected " + std::to_string(min) + " to "
                                    + std::to_string(max) + " fields, found "
                                    + std::to_string(count) + ": " + joinFields(fields));
    }

    // 补上省略的可选字段
    std::vector<std::string> given = fields;
    if (min < max && count == min) {
        if (options & ParseOption::DowOptional) {
            given.push_back(kDefaults[5]);
        } else {
            given.insert(given.begin(), kDefaults[0]);
        }
    }

    // 没配置的字段用默认值
    std::vector<std::string> expanded(kDefaults.begin(), kDefaults.end());
    std::size_t n = 0;
    for (std::size_t i = 0; i < kPlaces.size(); ++i) {
        if (options & kPlaces[i]) {
            expanded[i] = given[n++];
        }
    }
    return expanded;
}

SchedulePtr parseStandard(const std::string& spec) {
    return CronParser::standard()->parse(spec);
}

} // namespace cronhub::scheduler
