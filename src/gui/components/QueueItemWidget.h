#pragma once

#include <QWidget>
#include <QString>

// One row of the convert panel's file list: name, size and a remove button
class QueueItemWidget : public QWidget
{
    Q_OBJECT

public:
    explicit QueueItemWidget(const QString& path, const QString& sizeText, QWidget* parent = nullptr);

    QString path() const { return m_path; }

signals:
    void removeRequested(const QString& path);

private:
    QString m_path;
};
