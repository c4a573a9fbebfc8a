#include "QueueItemWidget.h"
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>

QueueItemWidget::QueueItemWidget(const QString& path, const QString& sizeText, QWidget* parent)
    : QWidget(parent), m_path(path)
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(6, 2, 6, 2);

    QLabel* fileLabel = new QLabel(QFileInfo(path).fileName());
    fileLabel->setToolTip(path);
    layout->addWidget(fileLabel, 1);

    QLabel* sizeLabel = new QLabel(sizeText);
    sizeLabel->setObjectName("muted_label");
    layout->addWidget(sizeLabel);

    QPushButton* removeButton = new QPushButton("X");
    removeButton->setFixedSize(28, 24);
    removeButton->setToolTip("Remove from list");
    removeButton->setStyleSheet("QPushButton { padding: 0; background-color: #8b2c2c; }"
                                "QPushButton:hover { background-color: #b03a3a; }");
    connect(removeButton, &QPushButton::clicked, this, [this]() {
        emit removeRequested(m_path);
    });
    layout->addWidget(removeButton);
}
