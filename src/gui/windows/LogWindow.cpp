#include "LogWindow.h"

#include <QHBoxLayout>
#include <QPushButton>
#include <QTextEdit>
#include <QVBoxLayout>

LogWindow::LogWindow(QWidget *parent)
    : QWidget(parent, Qt::Window)
{
    setWindowTitle("Conversion Log");
    setGeometry(100, 100, 760, 480);

    QVBoxLayout *main_layout = new QVBoxLayout(this);

    m_logOutput = new QTextEdit;
    m_logOutput->setReadOnly(true);
    m_logOutput->setStyleSheet("background:#1e1e1e; color:#b9bbbe; border:none; font-family: monospace;");
    main_layout->addWidget(m_logOutput);

    QHBoxLayout *buttons = new QHBoxLayout;
    buttons->addStretch(1);
    QPushButton *clear_button = new QPushButton("Clear");
    connect(clear_button, &QPushButton::clicked, this, &LogWindow::clearLog);
    buttons->addWidget(clear_button);
    main_layout->addLayout(buttons);
}

void LogWindow::appendLog(const QString &text)
{
    m_logOutput->append(text.toHtmlEscaped());
}

void LogWindow::appendLogLine(const QString &text, bool isError)
{
    if (isError) {
        m_logOutput->append(QString("<span style=\"color:#e57373;\">%1</span>").arg(text.toHtmlEscaped()));
    } else {
        appendLog(text);
    }
}

void LogWindow::clearLog()
{
    m_logOutput->clear();
}

void LogWindow::closeEvent(QCloseEvent *event)
{
    // Keep the history; just hide
    hide();
    event->ignore();
}
