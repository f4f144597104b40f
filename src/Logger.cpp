#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <stdexcept>

// singleton get instance
Logger & Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mtx);
    minLevel = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx);
    consoleOutput = enabled;
}

void Logger::closeFiles() {
    if (logFileDebug.is_open()) logFileDebug.close();
    if (logFileInfo.is_open()) logFileInfo.close();
    if (logFileWarning.is_open()) logFileWarning.close();
    if (logFileError.is_open()) logFileError.close();
}

void Logger::setLogPath(const std::string & path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (isInitialized) {
        closeFiles();
        isInitialized = false;
    }

    try {
        // Create parent directory if it doesn't exist
        std::filesystem::path log_path(path);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        logFileDebug.open(path + "DEBUG.log", std::ios::app);
        logFileInfo.open(path + "INFO.log", std::ios::app);
        logFileWarning.open(path + "WARNING.log", std::ios::app);
        logFileError.open(path + "ERROR.log", std::ios::app);
        if (!logFileDebug.is_open() || !logFileInfo.is_open() ||
            !logFileWarning.is_open() || !logFileError.is_open()) {
            closeFiles();
            throw std::runtime_error("Failed to open log files under: " + path);
        }
        isInitialized = true;
    }
    catch (const std::exception& e) {
        std::cerr << "Logger initialization error: " << e.what() << std::endl;
        // Continue without file logging, but with console output
        isInitialized = false;
    }
}

// destructor
Logger::~Logger() {
    closeFiles();
}

const char * Logger::levelName(Level level) {
    switch (level) {
        case DEBUG: return "DEBUG";
        case INFO: return "INFO";
        case WARNING: return "WARNING";
        case ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(Level level, const std::string & message) {
    std::lock_guard<std::mutex> lock(mtx);
    if (level < minLevel) {
        return;
    }
    std::string line = getCurrentTime() + " [" + levelName(level) + "] " + message;
    if (consoleOutput) {
        std::cout << line << std::endl;
    }
    if (!isInitialized) {
        return;
    }

    std::ofstream * files[] = {&logFileDebug, &logFileInfo, &logFileWarning, &logFileError};
    for (int i = DEBUG; i <= level; i++) {
        *files[i] << line << std::endl;
    }
}

void Logger::debug(const std::string & message) {
    log(DEBUG, message);
}

void Logger::info(const std::string & message) {
    log(INFO, message);
}

void Logger::warning(const std::string & message) {
    log(WARNING, message);
}

void Logger::error(const std::string & message) {
    log(ERROR, message);
}

std::string Logger::getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&in_time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
