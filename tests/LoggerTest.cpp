// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for the file side of the Logger.

#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class LoggerTest {
private:
    fs::path m_log_dir;

    std::vector<fs::path> logFiles() const {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    size_t countLines(const std::string& marker) const {
        size_t count = 0;
        for (const auto& path : logFiles()) {
            std::ifstream file(path);
            std::string line;
            while (std::getline(file, line)) {
                if (line.find(marker) != std::string::npos) {
                    count++;
                }
            }
        }
        return count;
    }

public:
    LoggerTest() : m_log_dir(fs::temp_directory_path() / "maestro_logger_test") {
        fs::remove_all(m_log_dir);
    }

    ~LoggerTest() {
        Maestro::Logger::getInstance().setFileLogging(false);
        std::error_code ec;
        fs::remove_all(m_log_dir, ec);
    }

    void testRotationKeepsEntries() {
        std::cout << "Testing rapid log rotation..." << std::endl;

        auto& logger = Maestro::Logger::getInstance();
        logger.setConsoleLogging(false);
        logger.setFileLogging(true);
        logger.setFileLogLevel(Maestro::LogLevel::DEBUG);

        // Every entry exceeds the size limit, so each write rotates
        logger.initialize(m_log_dir.string(), 64, 100);

        const std::string padding(80, 'x');
        for (int i = 0; i < 10; ++i) {
            logger.info("LoggerTest", "rotation-entry-" + std::to_string(i), padding);
        }
        logger.flush();

        assert(logFiles().size() >= 10);
        assert(countLines("rotation-entry-") == 10);

        std::cout << "✓ Rapid rotation test passed" << std::endl;
    }

    void testRotationPrunesOldFiles() {
        std::cout << "Testing rotation file limit..." << std::endl;

        auto& logger = Maestro::Logger::getInstance();
        fs::remove_all(m_log_dir);
        logger.initialize(m_log_dir.string(), 64, 3);

        const std::string padding(80, 'y');
        for (int i = 0; i < 8; ++i) {
            logger.info("LoggerTest", "pruned-entry-" + std::to_string(i), padding);
        }
        logger.flush();

        // The limit applies when a rotation opens a new file
        assert(logFiles().size() <= 4);

        std::cout << "✓ Rotation file limit test passed" << std::endl;
    }

    void testParseLevel() {
        std::cout << "Testing level parsing..." << std::endl;

        assert(Maestro::Logger::parseLevel("debug") == Maestro::LogLevel::DEBUG);
        assert(Maestro::Logger::parseLevel("WARNING") == Maestro::LogLevel::WARNING);
        assert(Maestro::Logger::parseLevel("critical") == Maestro::LogLevel::CRITICAL);
        assert(Maestro::Logger::parseLevel("chatty") == Maestro::LogLevel::INFO);

        std::cout << "✓ Level parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger Tests..." << std::endl;
        std::cout << "=======================" << std::endl;

        testRotationKeepsEntries();
        std::cout << std::endl;

        testRotationPrunesOldFiles();
        std::cout << std::endl;

        testParseLevel();
        std::cout << std::endl;

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoggerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
