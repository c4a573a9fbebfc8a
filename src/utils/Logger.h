#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace ConverterPro {

/**
 * @brief Plain-text application log.
 *
 * Every line is written as "YYYY-mm-dd HH:MM:SS - LEVEL - message" to the
 * console (info/debug to stdout, warnings/errors to stderr) and, once
 * openFile() succeeded, appended to the log file as well.
 *
 * One instance is created by the entry point and handed by reference to the
 * components that log; writes are serialized, so the worker thread and the
 * GUI thread can share it.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    // Receives every formatted line; must not log itself
    using Listener = std::function<void(Level, const std::string&)>;

    explicit Logger(Level minLevel = Level::Info, bool console = true);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Starts appending to the given file (parent directory is created).
     * @return false if the file could not be opened; console logging continues.
     */
    bool openFile(const std::filesystem::path& path);
    void closeFile();
    std::filesystem::path filePath() const;

    /**
     * @brief Extra sink (e.g. the log window). Called on the logging thread.
     */
    void setListener(Listener listener);

    void setLevel(Level level);
    Level level() const;

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void log(Level level, const std::string& message);

    static const char* levelName(Level level);

private:
    static std::string timestamp();

    mutable std::mutex m_mutex;
    Level m_minLevel;
    bool m_console;
    std::ofstream m_file;
    std::filesystem::path m_filePath;
    Listener m_listener;
};

} // namespace ConverterPro
