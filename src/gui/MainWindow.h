#pragma once

#include <QWidget>

namespace ConverterPro {
class ConfigManager;
class Logger;
}

class ConvertTab;
class LogWindow;
class QCloseEvent;
class QKeyEvent;
class QLabel;
class QPushButton;

class MainWindow : public QWidget
{
    Q_OBJECT

public:
    MainWindow(ConverterPro::Logger& logger,
               ConverterPro::ConfigManager& config,
               const QString& theme = QString(),
               QWidget* parent = nullptr);
    ~MainWindow();

    QString currentTheme() const { return m_currentTheme; }
    ConvertTab* convertTab() const { return m_convertTab; }

public slots:
    void set_application_theme(const QString& theme_name);
    void toggle_theme();
    void open_log_window();

protected:
    void keyPressEvent(QKeyEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private:
    void init_ui();

    ConverterPro::Logger& m_logger;
    ConverterPro::ConfigManager& m_config;
    QString m_currentTheme;

    ConvertTab* m_convertTab;
    LogWindow* m_logWindow;
    QLabel* m_titleLabel;
    QPushButton* m_logButton;
    QPushButton* m_themeButton;
};
