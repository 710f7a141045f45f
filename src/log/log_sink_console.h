#pragma once
#include <iostream>
#include <mutex>
#include "log_sink.h"

namespace cronhub::core {

// Error 写到 err 流，其余写到 out 流
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void consume(const LogRecord& rec) override;

private:
    std::ostream& _out;
    std::ostream& _err;
    std::mutex _mu; // 多个 job 线程同时写，避免行交错
};

} // namespace cronhub::core
