// ===================== ErrorLogger.h =====================
#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <cstddef>
namespace CitadelCommon {
class ErrorLogger {
public:
    static ErrorLogger& instance();

    // Opens citadel_errors_<timestamp>.txt in the working directory.
    void init();
    void log(const std::string& msg);
    void logSection(const std::string& title);
    void logAgentFault(const std::string& agentName,
                       const std::string& team,
                       std::size_t turn,
                       const std::string& reason);
    void logMatchError(const std::string& mapName,
                       const std::string& agent1,
                       const std::string& agent2,
                       const std::string& errorMsg);

private:
    ErrorLogger();
    ~ErrorLogger();
    ErrorLogger(const ErrorLogger&) = delete;
    ErrorLogger& operator=(const ErrorLogger&) = delete;

    std::ofstream out_;
    std::mutex logMutex_;
    std::string timestamp_;

    std::string currentTimestamp() const;
};
}
