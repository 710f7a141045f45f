#pragma once
#include <memory>
#include <string>
#include <vector>
#include "schedule.h"

namespace cronhub::scheduler {

// 解析器配置：哪些字段要出现、哪个字段可省略、是否接受 @描述符。
// 字段顺序永远是 秒 分 时 日 月 周；没配置的字段用默认值 0 0 0 * * *
struct ParseOption {
    enum : unsigned {
        Second         = 1u << 0, // 秒字段，默认值为 0
        SecondOptional = 1u << 1, // 可选的秒字段，默认值为 0
        Minute         = 1u << 2, // 分钟字段，默认值为 0
        Hour           = 1u << 3, // 小时字段，默认值为 0
        Dom            = 1u << 4, // 日字段，默认值为 *
        Month          = 1u << 5, // 月字段，默认值为 *
        Dow            = 1u << 6, // 周字段，默认值为 *
        DowOptional    = 1u << 7, // 可选的周字段，默认值为 *
        Descriptor     = 1u << 8, // 允许 @monthly, @weekly, @every 1h 等
    };
};

/// Turns a schedule spec string into a Schedule.
class IScheduleParser {
public:
    virtual ~IScheduleParser() = default;

    /// @throws std::invalid_argument with a descriptive message
    virtual SchedulePtr parse(const std::string& spec) const = 0;
};

using ParserPtr = std::shared_ptr<const IScheduleParser>;

/// Configurable crontab parser.
///
///   CronParser p(ParseOption::Minute | ParseOption::Hour | ParseOption::Dom
///                | ParseOption::Month | ParseOption::Dow);
///   auto s = p.parse("0 0 15 */3 *");
///
///   CronParser p2(ParseOption::Dom | ParseOption::Month | ParseOption::DowOptional);
///   auto s2 = p2.parse("15 */3");
///
/// A spec may start with TZ=<zone> or CRON_TZ=<zone>.
class CronParser : public IScheduleParser {
public:
    /// @throws std::logic_error when both SecondOptional and DowOptional are
    ///         set: which field is missing could not be told apart.
    explicit CronParser(unsigned options);

    SchedulePtr parse(const std::string& spec) const override;

    unsigned options() const { return _options; }

    /// minute hour dom month dow, plus descriptors
    static std::shared_ptr<const CronParser> standard();

    /// second minute hour dom month dow, plus descriptors
    static std::shared_ptr<const CronParser> withSeconds();

private:
    // 补齐省略 / 可选字段，返回 6 个字段；同时校验字段个数
    std::vector<std::string> normalizeFields(const std::vector<std::string>& fields) const;

    unsigned _options;
};

/// CronParser::standard()->parse(spec): "* * * * ?", "@midnight", "@every 1h30m"
SchedulePtr parseStandard(const std::string& spec);

} // namespace cronhub::scheduler
