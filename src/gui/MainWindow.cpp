#include "MainWindow.h"

#include "core/ConfigManager.h"
#include "styles/Style.h"
#include "tabs/ConvertTab.h"
#include "utils/Definitions.h"
#include "utils/Logger.h"
#include "windows/LogWindow.h"

#include <QApplication>
#include <QCloseEvent>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QMessageBox>
#include <QPointer>
#include <QPushButton>
#include <QVBoxLayout>

namespace def = ConverterPro::Definitions;
using ConverterPro::Logger;

MainWindow::MainWindow(Logger& logger,
                       ConverterPro::ConfigManager& config,
                       const QString& theme,
                       QWidget* parent)
    : QWidget(parent),
      m_logger(logger),
      m_config(config),
      m_currentTheme("dark"),
      m_convertTab(nullptr),
      m_logWindow(nullptr)
{
    setWindowTitle(QString::fromStdString(def::APP_NAME));
    setMinimumSize(1000, 700);

    m_logWindow = new LogWindow(this);
    QPointer<LogWindow> logWindow(m_logWindow);
    // The worker thread logs too; hop to the GUI thread
    m_logger.setListener([logWindow](Logger::Level level, const std::string& line) {
        if (!logWindow) {
            return;
        }
        const QString text = QString::fromStdString(line);
        const bool isError = level >= Logger::Level::Warning;
        QMetaObject::invokeMethod(logWindow.data(), [logWindow, text, isError]() {
            if (logWindow) {
                logWindow->appendLogLine(text, isError);
            }
        }, Qt::QueuedConnection);
    });

    init_ui();
    m_convertTab->loadSettings(m_config);

    const QString configured = QString::fromStdString(m_config.get<std::string>("appearance_mode", "dark"));
    set_application_theme(theme.isEmpty() ? configured : theme);
}

MainWindow::~MainWindow()
{
    m_logger.setListener(nullptr);
}

void MainWindow::init_ui()
{
    QVBoxLayout* vbox = new QVBoxLayout(this);
    vbox->setContentsMargins(0, 0, 0, 0);

    // --- Header ---
    QWidget* header_widget = new QWidget;
    header_widget->setObjectName("header_widget");
    QHBoxLayout* header_layout = new QHBoxLayout(header_widget);
    header_layout->setContentsMargins(12, 8, 12, 8);

    m_titleLabel = new QLabel(QString::fromStdString(def::APP_NAME));
    m_titleLabel->setObjectName("title_label");
    m_titleLabel->setStyleSheet("font-size: 18pt; font-weight: bold;");
    header_layout->addWidget(m_titleLabel);

    QLabel* subtitle = new QLabel("Convert, resize and optimize images in batches");
    subtitle->setObjectName("muted_label");
    header_layout->addWidget(subtitle);
    header_layout->addStretch(1);

    m_logButton = new QPushButton("Show Log");
    connect(m_logButton, &QPushButton::clicked, this, &MainWindow::open_log_window);
    header_layout->addWidget(m_logButton);

    m_themeButton = new QPushButton;
    m_themeButton->setToolTip("Switch between dark and light appearance");
    connect(m_themeButton, &QPushButton::clicked, this, &MainWindow::toggle_theme);
    header_layout->addWidget(m_themeButton);

    vbox->addWidget(header_widget);

    // --- Convert panel ---
    m_convertTab = new ConvertTab(m_logger, this);
    QVBoxLayout* body = new QVBoxLayout;
    body->setContentsMargins(10, 5, 10, 10);
    body->addWidget(m_convertTab);
    vbox->addLayout(body, 1);

    QLabel* footer = new QLabel(QString("v%1").arg(QString::fromStdString(def::APP_VERSION)));
    footer->setObjectName("muted_label");
    footer->setAlignment(Qt::AlignRight);
    footer->setContentsMargins(0, 0, 12, 6);
    vbox->addWidget(footer);
}

void MainWindow::set_application_theme(const QString& theme_name)
{
    m_currentTheme = (theme_name == "light") ? "light" : "dark";
    qApp->setStyleSheet(Style::themeStyleSheet(m_currentTheme));
    m_themeButton->setText(m_currentTheme == "dark" ? "Light Mode" : "Dark Mode");
}

void MainWindow::toggle_theme()
{
    set_application_theme(m_currentTheme == "dark" ? "light" : "dark");
    m_logger.info("Appearance set to " + m_currentTheme.toStdString());
}

void MainWindow::open_log_window()
{
    m_logWindow->show();
    m_logWindow->raise();
    m_logWindow->activateWindow();
}

void MainWindow::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape) {
        close();
    } else {
        QWidget::keyPressEvent(event);
    }
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_convertTab->isBusy()) {
        const auto answer = QMessageBox::question(
            this, "Conversion Running",
            "A conversion is still running. Stop after the current file and quit?");
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        m_convertTab->cancelConversion();
    }

    m_convertTab->saveSettings(m_config);
    m_config.set("appearance_mode", m_currentTheme.toStdString());
    if (!m_config.save()) {
        m_logger.warning("Settings were not saved");
    }
    QWidget::closeEvent(event);
}
