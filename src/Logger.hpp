#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <fstream>
#include <mutex>

class Logger {
public:
    enum Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    static Logger & getInstance();

    // log debug level message
    void debug(const std::string & message);

    // log info level message
    void info(const std::string & message);

    // log warning level message
    void warning(const std::string & message);

    // log error level message
    void error(const std::string & message);

    // messages below this level are dropped
    void setLevel(Level level);

    // turn stdout echo on or off, files are not affected
    void setConsoleOutput(bool enabled);

    // prefix for the per-level files, e.g. "/var/log/httpcache/" -> /var/log/httpcache/INFO.log
    void setLogPath(const std::string & path);

    // get current time
    std::string getCurrentTime();

    ~Logger();

private:
    std::ofstream logFileDebug;
    std::ofstream logFileInfo;
    std::ofstream logFileWarning;
    std::ofstream logFileError;
    std::mutex mtx;
    bool isInitialized;
    bool consoleOutput;
    Level minLevel;

    Logger() : isInitialized(false), consoleOutput(true), minLevel(DEBUG) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void closeFiles();

    static const char * levelName(Level level);

    // writes to the file of the given level and every more verbose one
    void log(Level level, const std::string & message);
};

#endif
