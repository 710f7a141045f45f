#include "cron_app.h"
#include <csignal>
#include <stdexcept>
#include <pthread.h>
#include "core/utils.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"

namespace cronhub {

namespace {

scheduler::JobWrapper wrapperByName(const std::string& name, const LoggerPtr& logger) {
    if (name == "recover") return scheduler::recover(logger);
    if (name == "delay")   return scheduler::delayIfStillRunning(logger);
    if (name == "skip")    return scheduler::skipIfStillRunning(logger);
    throw std::invalid_argument("unknown chain wrapper: " + name);
}

} // namespace

CronApp::CronApp() {
}

CronApp::~CronApp() {
}

int CronApp::run(const std::string& configPath) {
    // 信号必须在任何线程启动前屏蔽，之后由主线程 sigwait
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    // 1. 加载配置
    init_config(configPath);

    // 2. 初始化日志系统
    init_logger();
    m_logger->info("===== cronhubd starting =====");

    // 3. 创建调度器
    const bool verbose = m_config.get<bool>("scheduler.verbose", false);
    auto cronLogger = m_logger->withComponent("cron", verbose ? LogLevel::Info : LogLevel::Error);
    try {
        m_scheduler = std::make_unique<scheduler::CronScheduler>(buildOptions(m_config, cronLogger));
    } catch (const std::invalid_argument& ex) {
        m_logger->error(ex.what(), "invalid scheduler configuration");
        return 1;
    }

    // 4. 注册 job
    const std::size_t count = registerJobs(m_config, *m_scheduler, m_logger);
    m_logger->info("jobs registered", {{"count", std::to_string(count)},
                                       {"timezone", m_scheduler->location().name()}});

    // 5. 启动调度线程
    m_scheduler->start();
    m_logger->info("CronScheduler started");

    // 6. 阻塞直到收到退出信号
    const int sig = wait_for_signal();
    m_logger->info("signal received, stopping", {{"signal", std::to_string(sig)}});

    // 7. 停止调度并等待正在执行的 job
    m_scheduler->stop().wait();
    m_logger->info("===== cronhubd stopped =====");
    return 0;
}

void CronApp::init_config(const std::string& configPath) {
    // 还没有正式 logger，先用只打警告以上的控制台 logger
    auto bootstrap = std::make_shared<Logger>(
        std::vector<std::shared_ptr<core::ILogSink>>{ std::make_shared<core::ConsoleLogSink>() },
        LogLevel::Warn, "config");
    m_config = Config(bootstrap);

    bool loaded = false;
    if (!configPath.empty()) {
        loaded = m_config.load(configPath);
    }
    if (!loaded) {
        // 1) 当前工作目录
        loaded = m_config.load("config.json");
    }
    if (!loaded) {
        // 2) 源码默认配置
        loaded = m_config.load("config/default_config.json");
    }
    if (!loaded) {
        bootstrap->warn("No config file found in fallback paths, using built-in defaults");
    }

    // 环境变量覆盖
    m_config.load_from_env();
}

void CronApp::init_logger() {
    m_sinks = buildSinks(m_config);
    m_logger = std::make_shared<Logger>(m_sinks, LogLevel::Info, "cronhubd");

    const std::string logPath = m_config.get("log.path", "");
    m_logger->info(std::string("Logger initialized")
                   + (logPath.empty() ? " (console-only)" : (" (file=" + logPath + ")")));
}

std::vector<std::shared_ptr<core::ILogSink>> CronApp::buildSinks(const Config& cfg) {
    std::vector<std::shared_ptr<core::ILogSink>> sinks;
    sinks.push_back(std::make_shared<core::ConsoleLogSink>());

    // 空串表示只打到控制台
    const std::string logPath = cfg.get("log.path", "");
    if (!logPath.empty()) {
        // 目录由 FileLogSink 按需创建；打不开文件时它只是不写
        core::FileLogSink::Options opt;
        opt.path = logPath;
        opt.rotateBytes = static_cast<std::size_t>(cfg.get<long long>("log.rotateBytes", 10 * 1024 * 1024));
        opt.maxFiles = cfg.get<int>("log.maxFiles", 5);
        opt.flushEachLine = cfg.get<bool>("log.flushEachLine", false);
        sinks.push_back(std::make_shared<core::FileLogSink>(opt));
    }

    const int bufferRecords = cfg.get<int>("log.bufferRecords", 0);
    if (bufferRecords > 0) {
        sinks.push_back(std::make_shared<core::LogBuffer>(static_cast<std::size_t>(bufferRecords)));
    }
    return sinks;
}

scheduler::CronScheduler::Options CronApp::buildOptions(const Config& cfg, LoggerPtr logger) {
    using scheduler::ParseOption;

    scheduler::CronScheduler::Options opts;
    opts.logger = logger;

    // 时区：IANA 名、"Local" 或 "UTC"
    opts.location = core::TimeZone::load(cfg.get("scheduler.timezone", "Local"));

    unsigned parseOpts = ParseOption::Minute | ParseOption::Hour | ParseOption::Dom
                       | ParseOption::Month | ParseOption::Dow;
    if (cfg.get<bool>("scheduler.seconds", false)) {
        parseOpts |= ParseOption::Second;
    }
    if (cfg.get<bool>("scheduler.descriptors", true)) {
        parseOpts |= ParseOption::Descriptor;
    }
    opts.parser = std::make_shared<scheduler::CronParser>(parseOpts);

    // 不配置 chain 时由 CronScheduler 使用默认的 {recover}
    const nlohmann::json chain = cfg.raw("scheduler.chain");
    if (!chain.is_null()) {
        if (!chain.is_array()) {
            throw std::invalid_argument("scheduler.chain must be an array of wrapper names");
        }
        std::vector<scheduler::JobWrapper> wrappers;
        for (const auto& item : chain) {
            if (!item.is_string()) {
                throw std::invalid_argument("scheduler.chain entries must be strings");
            }
            wrappers.push_back(wrapperByName(item.get<std::string>(), logger));
        }
        opts.chain = scheduler::Chain(std::move(wrappers));
    }
    return opts;
}

std::size_t CronApp::registerJobs(const Config& cfg,
                                  scheduler::CronScheduler& sched,
                                  LoggerPtr logger) {
    const nlohmann::json jobs = cfg.raw("jobs");
    if (jobs.is_null()) {
        return 0;
    }
    if (!jobs.is_array()) {
        logger->error("jobs is not an array", "invalid job definitions");
        return 0;
    }

    std::size_t count = 0;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const auto& j = jobs[i];
        const std::string index = std::to_string(i);
        if (!j.is_object()) {
            logger->error("not an object", "invalid job definition", {{"index", index}});
            continue;
        }

        // 字段类型不对时 json::value 抛 type_error
        try {
            const std::string name = j.value("name", "job-" + index);
            const std::string spec = j.value("spec", "");
            const std::string command = j.value("command", "");
            if (spec.empty() || command.empty()) {
                logger->error("missing spec or command", "invalid job definition",
                              {{"index", index}, {"job", name}});
                continue;
            }

            const auto id = sched.addJob(spec, makeCommandJob(name, command, logger));
            logger->info("job registered", {{"job", name}, {"entry", std::to_string(id)}, {"spec", spec}});
            ++count;
        } catch (const std::invalid_argument& ex) {
            logger->error(ex.what(), "invalid job definition", {{"index", index}});
        } catch (const nlohmann::json::exception& ex) {
            logger->error(ex.what(), "invalid job definition", {{"index", index}});
        }
    }
    return count;
}

scheduler::Job CronApp::makeCommandJob(const std::string& name,
                                       const std::string& command,
                                       LoggerPtr logger) {
    return [name, command, logger]() {
        const auto [code, output] = utils::run_command(command);
        LogFields fields{{"job", name},
                         {"exit", std::to_string(code)},
                         {"output_bytes", std::to_string(output.size())}};
        if (code != 0) {
            logger->error("command exited with " + std::to_string(code), "job failed", fields);
        } else {
            logger->info("job finished", fields);
        }
    };
}

int CronApp::wait_for_signal() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);

    int sig = 0;
    while (sigwait(&set, &sig) != 0) {
    }
    return sig;
}

} // namespace cronhub
