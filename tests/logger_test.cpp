#include "eventtap/core/util/Logger.h"
#include <cassert>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace eventtap::core::util;
namespace fs = std::filesystem;

int main(){
    auto& logger = Logger::instance();

    assert(parse_level("debug") == Logger::Level::debug);
    assert(parse_level("critical") == Logger::Level::critical);
    assert(parse_level("bogus") == Logger::Level::info);

    logger.set_level(Logger::Level::warn);
    assert(logger.level() == Logger::Level::warn);
    assert(!logger.enabled(Logger::Level::info));
    assert(logger.enabled(Logger::Level::error));

    // lines below the level never reach the file
    auto path = fs::temp_directory_path() / ("eventtap_logger_test_" + std::to_string(::getpid()) + ".log");
    assert(logger.set_file(path.string()));
    log_info("dropped line");
    log_warn("kept line");

    // level changes while session threads are logging
    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&stop, t]{
            int i = 0;
            while (!stop.load()) {
                log_debug("session " + std::to_string(t) + " chatter " + std::to_string(i++));
                if (i > 2000) break;
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        logger.set_level(i % 2 ? Logger::Level::critical : Logger::Level::error);
    }
    stop = true;
    for (auto& w : writers) w.join();
    assert(logger.level() == Logger::Level::critical);

    assert(logger.set_file(""));
    std::ifstream in(path);
    std::stringstream all;
    all << in.rdbuf();
    auto text = all.str();
    assert(text.find("[WARN]") != std::string::npos);
    assert(text.find("kept line") != std::string::npos);
    assert(text.find("dropped line") == std::string::npos);
    assert(text.find("chatter") == std::string::npos);
    fs::remove(path);

    logger.set_level(Logger::Level::info);
    return 0;
}
