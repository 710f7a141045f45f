#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

#include "app/cron_app.h"
#include "core/config.h"
#include "core/utils.h"
#include "log/log_buffer.h"
#include "log/log_formatter.h"
#include "log/log_rotation.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "log/logger.h"

using namespace cronhub;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static bool contains(const std::string& s, const std::string& sub) {
    return s.find(sub) != std::string::npos;
}

static std::pair<std::shared_ptr<core::LogBuffer>, LoggerPtr> captureLogger() {
    auto buffer = std::make_shared<core::LogBuffer>(500);
    auto logger = std::make_shared<Logger>(
        std::vector<std::shared_ptr<core::ILogSink>>{ buffer }, LogLevel::Info);
    return {buffer, logger};
}

static const char* kConfigJson = R"({
    "scheduler": {
        "timezone": "UTC",
        "seconds": true,
        "chain": ["recover", "skip"],
        "verbose": false
    },
    "log": { "path": "", "maxFiles": 3 },
    "jobs": [
        { "name": "ok", "spec": "*/5 * * * * *", "command": "true" },
        { "name": "no-command", "spec": "* * * * * *" },
        { "name": "bad-spec", "spec": "99 * * * * *", "command": "true" },
        5,
        { "name": 3, "spec": "* * * * * *", "command": "true" }
    ]
})";

static void test_config_load() {
    auto [buffer, logger] = captureLogger();
    Config cfg(logger);

    assert(cfg.loadFromString(kConfigJson));
    assert(cfg.source() == "<inline>");
    assert(cfg.get<std::string>("scheduler.timezone", "") == "UTC");
    assert(cfg.get("scheduler.timezone", "Local") == "UTC");
    assert(cfg.get<bool>("scheduler.seconds", false));
    assert(cfg.get<int>("log.maxFiles", 5) == 3);

    // 缺失或类型不符时返回默认值
    assert(cfg.get<int>("log.rotateBytes", 77) == 77);
    assert(cfg.get<int>("scheduler.timezone", 9) == 9);

    // 顶层 key 保留原始值
    assert(cfg.contains("scheduler"));
    assert(cfg.raw("jobs").is_array());
    assert(cfg.raw("jobs").size() == 5);
    assert(cfg.raw("nope").is_null());

    cfg.set("scheduler.verbose", true);
    assert(cfg.get<bool>("scheduler.verbose", false));

    // 解析失败：返回 false 并打 error 日志，已有配置不变
    assert(!cfg.loadFromString("{not json", "broken.json"));
    assert(!cfg.loadFromString("[1, 2]", "array.json"));
    auto errors = buffer->find("Failed to parse config: broken.json");
    assert(errors.size() == 1);
    assert(errors[0].level == LogLevel::Error);
    assert(cfg.get("scheduler.timezone", "") == "UTC");

    assert(!cfg.load("/nonexistent/cronhub/config.json"));

    std::cout << "[OK] config load\n";
}

static void test_config_file_and_env() {
    const fs::path dir = fs::temp_directory_path() / ("cronhub-cfg-" + std::to_string(::getpid()));
    fs::create_directories(dir);
    const fs::path file = dir / "config.json";
    {
        std::ofstream ofs(file);
        ofs << R"({"scheduler": {"timezone": "Local"}, "log": {"path": "./a.log"}})";
    }

    Config cfg(Logger::discard());
    assert(cfg.load(file.string()));
    assert(cfg.source() == file.string());
    assert(cfg.get("scheduler.timezone", "") == "Local");

    ::setenv("CRONHUB_TZ", "America/New_York", 1);
    ::setenv("CRONHUB_LOG", "/tmp/cronhub-env.log", 1);
    ::setenv("CRONHUB_VERBOSE", "true", 1);
    cfg.load_from_env();
    ::unsetenv("CRONHUB_TZ");
    ::unsetenv("CRONHUB_LOG");
    ::unsetenv("CRONHUB_VERBOSE");

    assert(cfg.get("scheduler.timezone", "") == "America/New_York");
    assert(cfg.get("log.path", "") == "/tmp/cronhub-env.log");
    assert(cfg.get<bool>("scheduler.verbose", false));

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cout << "[OK] config file + env overrides\n";
}

static void test_build_options() {
    Config cfg(Logger::discard());
    assert(cfg.loadFromString(kConfigJson));
    auto logger = Logger::discard();

    auto opts = CronApp::buildOptions(cfg, logger);
    assert(opts.location && opts.location->isUtc());
    assert(opts.logger == logger);
    assert(opts.chain && opts.chain->size() == 2);
    // 带秒字段
    assert(opts.parser->parse("30 * * * * *") != nullptr);
    assert(opts.parser->parse("@daily") != nullptr);

    // 关闭描述符
    cfg.set("scheduler.descriptors", false);
    cfg.set("scheduler.chain", nullptr);
    opts = CronApp::buildOptions(cfg, logger);
    assert(!opts.chain.has_value());
    bool threw = false;
    try {
        opts.parser->parse("@daily");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 非法时区 / chain 名
    auto expectInvalid = [&](const std::string& key, nlohmann::json value) {
        Config bad(Logger::discard());
        bad.set(key, std::move(value));
        try {
            CronApp::buildOptions(bad, logger);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(expectInvalid("scheduler.timezone", "Nowhere/Bogus"));
    assert(expectInvalid("scheduler.chain", nlohmann::json::array({"recover", "retry"})));
    assert(expectInvalid("scheduler.chain", "recover"));
    assert(expectInvalid("scheduler.chain", nlohmann::json::array({1})));

    // 全部缺省
    Config empty(Logger::discard());
    opts = CronApp::buildOptions(empty, logger);
    assert(opts.location && opts.location->isLocal());
    assert(opts.parser->parse("0 6 * * *") != nullptr);

    std::cout << "[OK] buildOptions\n";
}

static void test_register_jobs() {
    Config cfg(Logger::discard());
    assert(cfg.loadFromString(kConfigJson));
    auto [buffer, logger] = captureLogger();

    scheduler::CronScheduler sched(CronApp::buildOptions(cfg, logger));
    const std::size_t count = CronApp::registerJobs(cfg, sched, logger);
    assert(count == 1);

    auto list = sched.entries();
    assert(list.size() == 1);
    assert(buffer->find("invalid job definition").size() == 4);
    assert(buffer->find("job registered").size() == 1);
    assert(buffer->find("job registered")[0].field("job") == "ok");
    assert(buffer->find("job registered", {{"job", "ok"}}).size() == 1);

    // 没有 jobs
    Config none(Logger::discard());
    assert(CronApp::registerJobs(none, sched, logger) == 0);

    std::cout << "[OK] registerJobs\n";
}

static void test_command_job() {
    auto [buffer, logger] = captureLogger();

    CronApp::makeCommandJob("fails", "exit 3", logger)();
    auto failed = buffer->find("job failed");
    assert(failed.size() == 1);
    assert(failed[0].field("job") == "fails");
    assert(failed[0].field("exit") == "3");
    assert(failed[0].error == "command exited with 3");

    CronApp::makeCommandJob("hello", "printf hi", logger)();
    auto finished = buffer->find("job finished");
    assert(finished.size() == 1);
    assert(finished[0].field("exit") == "0");
    assert(finished[0].field("output_bytes") == "2");

    std::cout << "[OK] shell command job\n";
}

static void test_durations() {
    using utils::parseDuration;
    using utils::formatDuration;

    assert(parseDuration("1h30m") == 90min);
    assert(parseDuration("1.5h") == 90min);
    assert(parseDuration("300ms") == 300ms);
    assert(parseDuration("2us") == 2us);
    assert(parseDuration("0") == 0ns);
    assert(parseDuration("+5s") == 5s);
    assert(parseDuration("-2m3.4s") == -(2min + 3400ms));

    auto errorOf = [](const std::string& text) -> std::string {
        try {
            parseDuration(text);
        } catch (const std::invalid_argument& ex) {
            return ex.what();
        }
        return "";
    };
    assert(errorOf("") == "invalid duration \"\"");
    assert(errorOf("1") == "missing unit in duration \"1\"");
    assert(errorOf("h") == "invalid duration \"h\"");
    assert(errorOf(".s") == "invalid duration \".s\"");
    assert(errorOf("1x") == "unknown unit \"x\" in duration \"1x\"");

    assert(formatDuration(0ns) == "0s");
    assert(formatDuration(90min) == "1h30m0s");
    assert(formatDuration(61s) == "1m1s");
    assert(formatDuration(1500ms) == "1.5s");
    assert(formatDuration(250ms) == "250ms");
    assert(formatDuration(1h + 2min + 3500ms) == "1h2m3.5s");
    assert(formatDuration(1500ns) == "1.5\xC2\xB5s");
    assert(formatDuration(-3s) == "-3s");

    std::cout << "[OK] duration parse / format\n";
}

static void test_formatter() {
    core::LogRecord r;
    r.level = LogLevel::Info;
    r.component = "cron";
    r.message = "run \"x\"\nnext";
    r.fields = {{"entry", "3"}, {"next", "2012-07-09T15:00:00Z"}};

    const std::string line = core::LogFormatter::instance().formatLine(r);
    assert(line.rfind("ts=[", 0) == 0);
    assert(contains(line, " level=[INFO] component=cron msg=\"run \\\"x\\\"\\nnext\" entry=3 next=2012-07-09T15:00:00Z"));
    assert(!contains(line, "seq="));
    assert(!contains(line, "error="));

    r.level = LogLevel::Error;
    r.error = "boom";
    r.seq = 7;
    const std::string errLine = core::LogFormatter::instance().formatLine(r);
    assert(contains(errLine, "level=[ERROR] component=cron seq=7 msg="));
    assert(contains(errLine, " error=\"boom\""));

    // 含空白 / 引号的字段值加引号，空值也加
    r.fields = {{"job", "nightly cleanup"}, {"output", ""}, {"path", "C:\\tmp"}};
    const std::string quoted = core::LogFormatter::instance().formatLine(r);
    assert(contains(quoted, " job=\"nightly cleanup\""));
    assert(contains(quoted, " output=\"\""));
    assert(contains(quoted, " path=C:\\tmp"));
    assert(quoted.find('\n') == std::string::npos);

    assert(std::string(core::LogFormatter::levelName(LogLevel::Warn)) == "WARN");
    std::cout << "[OK] log formatter\n";
}

static void test_console_sink() {
    std::ostringstream out;
    std::ostringstream err;
    core::ConsoleLogSink sink(out, err);

    core::LogRecord info;
    info.message = "start";
    sink.consume(info);

    core::LogRecord warn;
    warn.level = LogLevel::Warn;
    warn.message = "config fallback";
    sink.consume(warn);

    core::LogRecord bad;
    bad.level = LogLevel::Error;
    bad.message = "panic";
    bad.error = "boom";
    sink.consume(bad);

    assert(contains(out.str(), "msg=\"start\""));
    assert(contains(out.str(), "msg=\"config fallback\""));
    assert(!contains(out.str(), "panic"));
    assert(contains(err.str(), "level=[ERROR]"));
    assert(contains(err.str(), "error=\"boom\""));

    std::cout << "[OK] console sink\n";
}

static void test_log_buffer() {
    core::LogBuffer buf(3);
    for (int i = 1; i <= 5; ++i) {
        core::LogRecord r;
        r.message = "m" + std::to_string(i);
        const auto stored = buf.append(r);
        assert(stored.seq == static_cast<std::uint64_t>(i));
    }
    assert(buf.size() == 3);

    auto tail = buf.tail(2);
    assert(tail.size() == 2 && tail[0].seq == 4 && tail[1].seq == 5);

    auto page = buf.get(1, 10);
    assert(page.records.size() == 3);
    assert(page.records.front().seq == 3);
    assert(page.nextFrom == 6);

    page = buf.get(6, 10);
    assert(page.records.empty() && page.nextFrom == 6);

    page = buf.get(3, 1);
    assert(page.records.size() == 1 && page.nextFrom == 4);

    assert(buf.find("m5").size() == 1);

    buf.clear();
    assert(buf.size() == 0);

    core::LogRecord old;
    old.message = "old";
    old.ts = std::chrono::system_clock::now() - 10s;
    buf.append(old);
    core::LogRecord fresh;
    fresh.message = "fresh";
    buf.append(fresh);
    buf.pruneOlderThan(5s);
    assert(buf.size() == 1);
    assert(buf.tail(1)[0].message == "fresh");

    std::cout << "[OK] log buffer\n";
}

static void test_logger_levels() {
    auto buffer = std::make_shared<core::LogBuffer>(100);
    Logger errorsOnly({buffer}, LogLevel::Error, "cron");
    errorsOnly.info("ignored");
    errorsOnly.warn("ignored too");
    errorsOnly.error("bad", "kept", {{"k", "v"}});
    assert(buffer->size() == 1);
    assert(buffer->tail(1)[0].component == "cron");
    assert(buffer->tail(1)[0].field("k") == "v");

    auto child = errorsOnly.withComponent("app", errorsOnly.minLevel());
    assert(child->minLevel() == LogLevel::Error);
    child->error("bad", "from child");
    assert(buffer->size() == 2);
    assert(buffer->tail(1)[0].component == "app");

    // 共享 sinks，级别各自独立
    auto chatty = errorsOnly.withComponent("cron", LogLevel::Info);
    chatty->info("start");
    assert(buffer->tail(1)[0].message == "start");
    assert(buffer->tail(1)[0].component == "cron");
    errorsOnly.info("still ignored");
    assert(buffer->size() == 3);

    // discard 什么都不输出，也不抛
    Logger::discard()->error("x", "y");
    assert(Logger::makeDefault()->minLevel() == LogLevel::Error);
    assert(Logger::makeVerbose()->enabled(LogLevel::Info));
    assert(Logger::level_to_string(LogLevel::Debug) == "DEBUG");

    std::cout << "[OK] logger levels / sinks\n";
}

static void writeFile(const fs::path& p, const std::string& content) {
    std::ofstream ofs(p, std::ios::trunc);
    ofs << content;
}

static std::string readFile(const fs::path& p) {
    std::ifstream ifs(p);
    std::string s;
    std::getline(ifs, s);
    return s;
}

static void test_rotation_numbering() {
    const fs::path dir = fs::temp_directory_path() / ("cronhub-rot-" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    const std::string base = (dir / "app.log").string();

    core::LogRotation rot(core::RotationPolicy{100, 2});
    assert(!rot.shouldRotate(0, 500));   // 空文件不轮转，超长单行直接写
    assert(!rot.shouldRotate(60, 40));
    assert(rot.shouldRotate(60, 41));
    assert(!core::LogRotation(core::RotationPolicy{0, 2}).shouldRotate(1000, 1000));

    // base 不存在时什么都不做
    rot.rotate(base);
    assert(!fs::exists(core::LogRotation::rotatedName(base, 1)));

    writeFile(base, "first");
    rot.rotate(base);
    assert(!fs::exists(base));
    assert(readFile(core::LogRotation::rotatedName(base, 1)) == "first");

    writeFile(base, "second");
    rot.rotate(base);
    writeFile(base, "third");
    rot.rotate(base);
    // 最多保留 2 个：.1 最新，.2 次新，first 被挤掉
    assert(readFile(core::LogRotation::rotatedName(base, 1)) == "third");
    assert(readFile(core::LogRotation::rotatedName(base, 2)) == "second");
    assert(!fs::exists(core::LogRotation::rotatedName(base, 3)));

    // maxFiles = 0：不留历史
    writeFile(base, "gone");
    core::LogRotation(core::RotationPolicy{100, 0}).rotate(base);
    assert(!fs::exists(base));

    fs::remove_all(dir, ec);
    std::cout << "[OK] rotation numbering\n";
}

static void test_file_sink_rotation() {
    const fs::path dir = fs::temp_directory_path() / ("cronhub-log-" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);

    core::FileLogSink::Options opt;
    opt.path = (dir / "cronhub.log").string();
    opt.rotateBytes = 300;
    opt.maxFiles = 2;
    opt.flushEachLine = true;

    {
        core::FileLogSink sink(opt);
        for (int i = 0; i < 30; ++i) {
            core::LogRecord r;
            r.message = "line " + std::to_string(i);
            r.fields = {{"payload", std::string(40, 'x')}};
            sink.consume(r);
        }
    }

    // 目录自动创建，当前文件存在且不超过阈值太多
    assert(fs::exists(opt.path));
    assert(fs::file_size(opt.path) <= 300);

    int rotated = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("cronhub.log.", 0) == 0) ++rotated;
    }
    assert(rotated >= 1);
    assert(rotated <= 2);
    assert(fs::exists(core::LogRotation::rotatedName(opt.path, 1)));
    assert(!fs::exists(core::LogRotation::rotatedName(opt.path, 3)));

    // buildSinks：路径非空时加文件 sink，bufferRecords > 0 时加内存 sink
    Config cfg(Logger::discard());
    cfg.set("log.path", (dir / "app.log").string());
    cfg.set("log.bufferRecords", 10);
    assert(CronApp::buildSinks(cfg).size() == 3);
    cfg.set("log.path", "");
    assert(CronApp::buildSinks(cfg).size() == 2);

    fs::remove_all(dir, ec);
    std::cout << "[OK] file sink rotation\n";
}

int main() {
    test_config_load();
    test_config_file_and_env();
    test_build_options();
    test_register_jobs();
    test_command_job();
    test_durations();
    test_formatter();
    test_log_buffer();
    test_logger_levels();
    test_console_sink();
    test_rotation_numbering();
    test_file_sink_rotation();
    std::cout << "All config / log tests passed.\n";
    return 0;
}
