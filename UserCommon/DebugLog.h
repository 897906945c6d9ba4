// ===================== DebugLog.h =====================
#pragma once

#include <iostream>
#include <mutex>
#include <thread>

// ——————————————————————————————————————————————————————
// Thread-safe console logging
// ——————————————————————————————————————————————————————
namespace CitadelCommon {
inline std::mutex& debugMutex() {
    static std::mutex m;
    return m;
}
}

#define DEBUG_PRINT(component, function, message, debug_flag) \
    do { \
        if (debug_flag) { \
            std::lock_guard<std::mutex> lock(CitadelCommon::debugMutex()); \
            std::cout << "[T" << std::this_thread::get_id() << "] [DEBUG] [" \
                      << component << "] [" << function << "] " << message << std::endl; \
        } \
    } while(0)

#define INFO_PRINT(component, function, message) \
    do { \
        std::lock_guard<std::mutex> lock(CitadelCommon::debugMutex()); \
        std::cout << "[T" << std::this_thread::get_id() << "] [INFO] [" \
                  << component << "] [" << function << "] " << message << std::endl; \
    } while(0)

#define WARN_PRINT(component, function, message) \
    do { \
        std::lock_guard<std::mutex> lock(CitadelCommon::debugMutex()); \
        std::cerr << "[T" << std::this_thread::get_id() << "] [WARN] [" \
                  << component << "] [" << function << "] " << message << std::endl; \
    } while(0)

#define ERROR_PRINT(component, function, message) \
    do { \
        std::lock_guard<std::mutex> lock(CitadelCommon::debugMutex()); \
        std::cerr << "[T" << std::this_thread::get_id() << "] [ERROR] [" \
                  << component << "] [" << function << "] " << message << std::endl; \
    } while(0)
