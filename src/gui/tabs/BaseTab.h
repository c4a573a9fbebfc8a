#pragma once

#include <QWidget>
#include <QStringList>

namespace ConverterPro {
class ConfigManager;
}

/**
 * @brief Abstract base class for the panels of the main window.
 *
 * A panel reads its defaults from the configuration when it is created and
 * writes back what it wants remembered when the application exits.
 */
class BaseTab : public QWidget
{
    Q_OBJECT

public:
    explicit BaseTab(QWidget *parent = nullptr);
    virtual ~BaseTab() {}

    virtual void loadSettings(const ConverterPro::ConfigManager& config) = 0;
    virtual void saveSettings(ConverterPro::ConfigManager& config) const = 0;

    /**
     * @brief True while background work is running (the window asks before closing).
     */
    virtual bool isBusy() const { return false; }

    virtual void browseFiles() = 0;
    virtual void browseDirectory() = 0;
    virtual void browseOutput() = 0;

    /**
     * @brief Dialog name filter for every supported input extension.
     */
    static QString imageFileFilter();
};
