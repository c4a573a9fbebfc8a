#include "tabs/BaseTab.h"
#include "utils/Definitions.h"

BaseTab::BaseTab(QWidget *parent)
    : QWidget(parent)
{
}

QString BaseTab::imageFileFilter()
{
    QStringList patterns;
    for (const auto& ext : ConverterPro::Definitions::SUPPORTED_INPUT_EXTENSIONS) {
        patterns << QString("*%1").arg(QString::fromStdString(ext));
    }
    return QString("Images (%1);;All Files (*)").arg(patterns.join(' '));
}
