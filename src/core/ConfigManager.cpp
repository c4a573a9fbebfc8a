#include "ConfigManager.h"
#include "utils/Definitions.h"
#include "utils/Logger.h"

#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace ConverterPro
{
    ConfigManager::ConfigManager(Logger& logger, fs::path path)
        : m_logger(logger), m_path(std::move(path)), m_values(defaults())
    {
    }

    json ConfigManager::defaults()
    {
        return json{
            {"appearance_mode", "dark"},
            {"default_output_format", "png"},
            {"default_quality", Definitions::DEFAULT_QUALITY},
            {"default_resize_width", Definitions::DEFAULT_RESIZE_WIDTH},
            {"default_resize_height", Definitions::DEFAULT_RESIZE_HEIGHT},
            {"remember_output_folder", true},
            {"last_output_folder", ""},
            {"auto_clear_after_conversion", false},
            {"show_detailed_progress", true}
        };
    }

    bool ConfigManager::load()
    {
        m_values = defaults();

        std::error_code ec;
        if (!fs::exists(m_path, ec)) {
            m_logger.info("No config file at " + m_path.string() + ", using defaults");
            return true;
        }

        std::ifstream f(m_path);
        if (!f) {
            m_logger.error("Error loading config: cannot open " + m_path.string());
            return false;
        }

        try {
            const json loaded = json::parse(f);
            if (!loaded.is_object()) {
                m_logger.error("Error loading config: " + m_path.string() + " is not a JSON object");
                return false;
            }
            m_values.update(loaded);
        } catch (const json::parse_error& e) {
            m_logger.error(std::string("Error loading config: ") + e.what());
            return false;
        }
        return true;
    }

    bool ConfigManager::save() const
    {
        std::error_code ec;
        if (m_path.has_parent_path() && !fs::exists(m_path.parent_path(), ec)) {
            fs::create_directories(m_path.parent_path(), ec);
            if (ec) {
                m_logger.error("Error saving config: " + ec.message());
                return false;
            }
        }

        std::ofstream f(m_path, std::ios::trunc);
        if (!f) {
            m_logger.error("Error saving config: cannot write " + m_path.string());
            return false;
        }
        f << m_values.dump(2);
        f.close();
        if (f.fail()) {
            m_logger.error("Error saving config: write failed for " + m_path.string());
            return false;
        }
        return true;
    }

    void ConfigManager::resetToDefaults()
    {
        m_values = defaults();
    }

} // namespace ConverterPro
