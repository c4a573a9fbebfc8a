#pragma once

#include <QWidget>
#include <QCloseEvent>

class QTextEdit;

/**
 * @brief Separate window mirroring the application log.
 * Hides on close instead of deleting.
 */
class LogWindow : public QWidget
{
    Q_OBJECT

public:
    explicit LogWindow(QWidget* parent = nullptr);

public slots:
    void appendLog(const QString& text);
    void appendLogLine(const QString& text, bool isError);
    void clearLog();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    QTextEdit* m_logOutput;
};
