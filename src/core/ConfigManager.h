#pragma once

#include "Common.h"

#include <string>
#include <nlohmann/json.hpp>

namespace ConverterPro
{
    class Logger;

    /**
     * @brief JSON settings file merged over built-in defaults.
     *
     * Missing file or unparsable content leaves the defaults in place; both
     * cases are logged, neither is fatal.
     */
    class ConfigManager
    {
    public:
        ConfigManager(Logger& logger, fs::path path);

        static nlohmann::json defaults();

        /**
         * @brief Reads the file and merges it over the defaults.
         * @return false if the file existed but could not be read or parsed.
         */
        bool load();

        /**
         * @brief Writes the current values (indent 2), creating parent folders.
         */
        bool save() const;

        void resetToDefaults();

        template <typename T>
        T get(const std::string& key, const T& fallback) const
        {
            const auto it = m_values.find(key);
            if (it == m_values.end() || it->is_null()) {
                return fallback;
            }
            try {
                return it->template get<T>();
            } catch (const nlohmann::json::exception&) {
                return fallback;
            }
        }

        template <typename T>
        void set(const std::string& key, const T& value)
        {
            m_values[key] = value;
        }

        bool contains(const std::string& key) const { return m_values.contains(key); }

        const nlohmann::json& values() const { return m_values; }
        const fs::path& path() const { return m_path; }

    private:
        Logger& m_logger;
        fs::path m_path;
        nlohmann::json m_values;
    };

} // namespace ConverterPro
