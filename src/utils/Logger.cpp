#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace ConverterPro {

Logger::Logger(Level minLevel, bool console)
    : m_minLevel(minLevel), m_console(console)
{
}

Logger::~Logger()
{
    closeFile();
}

bool Logger::openFile(const fs::path& path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
    m_filePath.clear();

    std::error_code ec;
    if (path.has_parent_path() && !fs::exists(path.parent_path(), ec)) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "ERROR: could not create log directory '" << path.parent_path().string()
                      << "': " << ec.message() << std::endl;
            return false;
        }
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
        std::cerr << "ERROR: could not open log file '" << path.string() << "'." << std::endl;
        return false;
    }
    m_filePath = path;
    return true;
}

void Logger::closeFile()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
    m_filePath.clear();
}

fs::path Logger::filePath() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filePath;
}

void Logger::setListener(Listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void Logger::setLevel(Level level)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

Logger::Level Logger::level() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warning(const std::string& message) { log(Level::Warning, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

void Logger::log(Level level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_minLevel) {
        return;
    }

    const std::string line = timestamp() + " - " + levelName(level) + " - " + message;

    if (m_console) {
        if (level >= Level::Warning) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }
    if (m_file.is_open()) {
        m_file << line << '\n';
        m_file.flush();
    }
    if (m_listener) {
        m_listener(level, line);
    }
}

const char* Logger::levelName(Level level)
{
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

std::string Logger::timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace ConverterPro
