#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include "logger.hpp"
#include "test_support.hpp"

namespace {

std::string readAll(const std::string &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

void test_level_filtering() {
    BextTest::TempDir dir;
    const std::string file = dir.file("levels.log");
    {
        Bext::Logger logger(Bext::LogLevel::WARN, 1, Bext::LogOutput::FILE, file);
        logger.debug("hidden debug");
        logger.info("hidden info");
        logger.warn("shown warn");
        logger.error("shown error");
        logger.log(Bext::LogLevel::OFF, "never");
        logger.flush();

        std::string out = readAll(file);
        assert(out.find("hidden") == std::string::npos);
        assert(out.find("never") == std::string::npos);
        assert(out.find("[WARN] [Bext] shown warn") != std::string::npos);
        assert(out.find("[ERROR] [Bext] shown error") != std::string::npos);

        logger.set_log_level(Bext::LogLevel::DEBUG);
        assert(logger.get_log_level() == Bext::LogLevel::DEBUG);
        logger.debug("now visible");
        logger.flush();
        assert(readAll(file).find("[DEBUG] [Bext] now visible") != std::string::npos);
    }
}

void test_line_format() {
    BextTest::TempDir dir;
    const std::string file = dir.file("format.log");
    Bext::Logger logger(Bext::LogLevel::INFO, 2, Bext::LogOutput::FILE, file);
    logger.info("formatted");
    logger.flush();

    std::string line = readAll(file);
    /* [YYYY-mm-dd HH:MM:SS.mmm] */
    assert(line.size() > 26);
    assert(line[0] == '[');
    assert(line[5] == '-' && line[8] == '-');
    assert(line[11] == ' ');
    assert(line[20] == '.');
    assert(line[24] == ']');
    assert(line.find("[INFO] [Bext] formatted\n") != std::string::npos);
}

void test_switch_output() {
    BextTest::TempDir dir;
    const std::string first = dir.file("first.log");
    const std::string second = dir.file("second.log");

    Bext::Logger logger(Bext::LogLevel::INFO, 1, Bext::LogOutput::FILE, first);
    logger.info("to first");
    logger.flush();

    logger.set_output(Bext::LogOutput::FILE, second);
    logger.info("to second");
    logger.flush();

    assert(readAll(first).find("to first") != std::string::npos);
    assert(readAll(first).find("to second") == std::string::npos);
    assert(readAll(second).find("to second") != std::string::npos);
}

void test_level_names() {
    assert(Bext::logLevelToString(Bext::LogLevel::DEBUG) == "DEBUG");
    assert(Bext::logLevelToString(Bext::LogLevel::FATAL) == "FATAL");
    assert(Bext::logLevelToString(Bext::LogLevel::OFF) == "OFF");
}

int main() {
    test_level_filtering();
    test_line_format();
    test_switch_output();
    test_level_names();

    std::cout << "all logger tests passed" << std::endl;
    return 0;
}
