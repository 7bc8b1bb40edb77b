#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include "test_util.hpp"
#include "utils.hpp"

using namespace layerfs;
using layerfs::test::TempDir;

static std::string slurp(const std::string &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class LoggerTest : public testing::Test {
public:
    void TearDown() override {
        Logger::getInstance().init(false, "");
    }
};

TEST_F(LoggerTest, DebugOnlyWhenVerbose) {
    TempDir tmp;
    std::string path = tmp.path() + "/logs/layerfs.log";

    Logger::getInstance().init(false, path);
    ASSERT_FALSE(Logger::getInstance().verbose());
    LOG_DEBUG("hidden line");
    LOG_INFO("shown line");

    Logger::getInstance().init(true, path);
    ASSERT_TRUE(Logger::getInstance().verbose());
    LOG_DEBUG("debug line");

    std::string text = slurp(path);
    ASSERT_EQ(text.find("hidden line"), std::string::npos);
    ASSERT_NE(text.find("[INFO] shown line"), std::string::npos);
    ASSERT_NE(text.find("[DEBUG] debug line"), std::string::npos);
}

TEST_F(LoggerTest, LogWhileVerbosityChanges) {
    TempDir tmp;
    std::string path = tmp.path() + "/race.log";
    Logger::getInstance().init(true, path);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([t] {
            for (int i = 0; i < 200; ++i) {
                LOG_DEBUG("writer " + std::to_string(t));
                LOG_INFO("writer " + std::to_string(t));
            }
        });
    }
    std::thread toggler([&] {
        for (int i = 0; i < 50; ++i) {
            Logger::getInstance().init(i % 2 == 0, path);
        }
    });

    for (auto &thread : writers) {
        thread.join();
    }
    toggler.join();

    // Every INFO line made it to the file in one piece
    std::istringstream lines(slurp(path));
    std::string line;
    size_t info = 0;
    while (std::getline(lines, line)) {
        if (line.find("[INFO] writer ") != std::string::npos) {
            ++info;
        }
    }
    ASSERT_EQ(info, 4u * 200u);
}
