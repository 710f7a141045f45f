#include <exception>
#include <iostream>
#include "app/cron_app.h"

int main(int argc, char* argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : "";
    try {
        cronhub::CronApp app;
        return app.run(configPath);
    } catch (const std::exception& ex) {
        std::cerr << "cronhubd: " << ex.what() << std::endl;
        return 1;
    }
}
