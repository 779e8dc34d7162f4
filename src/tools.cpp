#include "tools.hpp"

#include "recordloader.hpp"

#include <city.h>

#include <ctime>
#include <iostream>
#include <system_error>


//------------------------------------------------------------------------------
// Logger

// Initialize static members
std::unique_ptr<Logger> Logger::Instance;
std::once_flag Logger::InitInstanceFlag;

Logger& Logger::getInstance() {
    std::call_once(InitInstanceFlag, []() {
        Instance.reset(new Logger);
    });
    return *Instance;
}

Logger::Logger() {
    LoggerThread = std::thread(&Logger::RunLogger, this);
}

Logger::~Logger() {
    Terminate();
    if (LoggerThread.joinable()) {
        LoggerThread.join();
    }

    // Process any remaining logs
    LogsToProcess.swap(LogQueue);
    ProcessLogQueue(Callback);
}

void Logger::SetLogLevel(LogLevel level) {
    CurrentLogLevel = level;
}

void Logger::SetCallback(std::function<void(LogLevel, const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(LogQueueMutex);
    Callback = callback;
}

void Logger::Log(LogLevel level, std::ostringstream&& message) {
    std::lock_guard<std::mutex> lock(LogQueueMutex);
    LogQueue.push_back({level, message.str()});
    ++QueuedCount;
    LogQueueCV.notify_one();
}

void Logger::Flush() {
    std::unique_lock<std::mutex> lock(LogQueueMutex);
    const uint64_t target = QueuedCount;
    FlushCV.wait(lock, [this, target] { return Terminated || ProcessedCount >= target; });
}

void Logger::Terminate() {
    Terminated = true;
    LogQueueCV.notify_one();
    FlushCV.notify_all();
}

void Logger::RunLogger() {
    std::function<void(LogLevel, const std::string&)> callback;

    while (!Terminated) {
        {
            std::unique_lock<std::mutex> lock(LogQueueMutex);
            LogQueueCV.wait(lock, [this] { return !LogQueue.empty() || Terminated; });
            LogsToProcess.swap(LogQueue);
            callback = Callback;
        }

        const uint64_t count = LogsToProcess.size();
        ProcessLogQueue(callback);

        {
            std::lock_guard<std::mutex> lock(LogQueueMutex);
            ProcessedCount += count;
        }
        FlushCV.notify_all();

        if (Terminated) {
            break;
        }
    }
}

void Logger::ProcessLogQueue(const std::function<void(LogLevel, const std::string&)>& callback) {
    if (LogsToProcess.empty()) {
        return;
    }

    for (const auto& entry : LogsToProcess) {
        if (entry.Level >= CurrentLogLevel) {
            if (callback) {
                callback(entry.Level, entry.Message);
            } else {
                switch (entry.Level) {
                    case LogLevel::DEBUG:
                        std::cout << "[DEBUG] " << entry.Message << std::endl;
                        break;
                    case LogLevel::INFO:
                        std::cout << "[INFO] " << entry.Message << std::endl;
                        break;
                    case LogLevel::WARN:
                        std::cerr << "[WARN] " << entry.Message << std::endl;
                        break;
                    case LogLevel::ERROR:
                        std::cerr << "[ERROR] " << entry.Message << std::endl;
                        break;
                }
            }
        }
    }

    LogsToProcess.clear();
}


//------------------------------------------------------------------------------
// Tools

void JoinThread(std::shared_ptr<std::thread> th)
{
    if (!th || !th->joinable()) {
        return;
    }

    try {
        th->join();
    } catch (const std::system_error& e) {
        LOG_ERROR() << "JoinThread: join failed: " << e.what();
    }
}

int64_t GetNsec()
{
    struct timespec tp;
    clock_gettime(CLOCK_REALTIME, &tp);
    return static_cast<int64_t>(tp.tv_sec) * 1000000000LL + tp.tv_nsec;
}

uint64_t DeriveSeed(uint64_t seed, const std::string& path, uint32_t worker_index)
{
    char key[8 + 4];
    write_uint64_le(key, seed);
    write_uint32_le(key + 8, worker_index);

    const uint64_t path_hash = CityHash64(path.data(), path.size());
    return CityHash64WithSeed(key, sizeof(key), path_hash);
}

std::string FormatSplitPath(const std::string& pattern, const std::string& split)
{
    static const std::string placeholder = RECORDLOADER_SPLIT_PLACEHOLDER;

    std::string result;
    size_t start = 0;
    for (;;) {
        size_t found = pattern.find(placeholder, start);
        if (found == std::string::npos) {
            result.append(pattern, start, std::string::npos);
            break;
        }
        result.append(pattern, start, found - start);
        result += split;
        start = found + placeholder.size();
    }
    return result;
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() &&
        str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}
