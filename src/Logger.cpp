#include "Logger.hpp"

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel_.load()) return;
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] "
       << message;
    
    std::string logMsg = ss.str();
    
    if (consoleOutput_) {
        std::cerr << logMsg << std::endl;
    }
    
    if (logFile_.is_open()) {
        logFile_ << logMsg << std::endl;
        logFile_.flush();
    }
}

void Logger::setLogLevel(LogLevel level) {
    minLevel_ = level;
}

bool Logger::setLogLevel(const std::string& levelName) {
    if (levelName == "DEBUG") {
        setLogLevel(LogLevel::DEBUG);
    } else if (levelName == "INFO") {
        setLogLevel(LogLevel::INFO);
    } else if (levelName == "WARNING") {
        setLogLevel(LogLevel::WARNING);
    } else if (levelName == "ERROR") {
        setLogLevel(LogLevel::ERROR);
    } else {
        return false;
    }
    return true;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    if (!filename.empty()) {
        logFile_.open(filename, std::ios::app);
    }
}

void Logger::setConsoleOutput(bool enabled) {
    consoleOutput_ = enabled;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::stringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}
