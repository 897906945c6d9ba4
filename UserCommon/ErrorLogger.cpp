// ===================== ErrorLogger.cpp =====================
#include "ErrorLogger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <stdexcept>
using namespace CitadelCommon;
ErrorLogger& ErrorLogger::instance() {
    static ErrorLogger logger;
    return logger;
}

ErrorLogger::ErrorLogger() {}
ErrorLogger::~ErrorLogger() {
    if (out_.is_open()) out_.close();
}

void ErrorLogger::init() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (out_.is_open()) return;
    timestamp_ = currentTimestamp();
    std::string fileName = "citadel_errors_" + timestamp_ + ".txt";
    out_.open(fileName);
    if (!out_.is_open()) {
        std::cerr << "Failed to open error log: " << fileName << std::endl;
    } else {
        out_ << "=== CITADEL ERRORS ===\n";
        out_ << "Generated: " << timestamp_ << "\n\n";
    }
}

void ErrorLogger::log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (out_.is_open()) out_ << msg << std::endl;
}

void ErrorLogger::logSection(const std::string& title) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (out_.is_open()) out_ << "\n=== " << title << " ===\n";
}

void ErrorLogger::logAgentFault(const std::string& agentName,
                                const std::string& team,
                                std::size_t turn,
                                const std::string& reason) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (!out_.is_open()) return;
    out_ << "AGENT FAULT: " << agentName << " (" << team << ") on turn "
         << turn << ": " << reason << "\n";
}

void ErrorLogger::logMatchError(const std::string& mapName,
                                const std::string& agent1,
                                const std::string& agent2,
                                const std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (!out_.is_open()) return;
    out_ << "MATCH ERROR: " << agent1 << " vs " << agent2
         << " on " << mapName << ": " << errorMsg << "\n";
}

std::string ErrorLogger::currentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}
