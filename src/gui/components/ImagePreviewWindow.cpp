#include "ImagePreviewWindow.h"
#include "core/ImageBuffer.h"

#include <QApplication>
#include <QFileInfo>
#include <QLabel>
#include <QPixmap>
#include <QScreen>
#include <QScrollArea>
#include <QVBoxLayout>
#include <opencv2/imgproc.hpp>

using ConverterPro::ConversionError;
using ConverterPro::ImageBuffer;

QImage ImagePreviewWindow::loadImage(const QString& imagePath)
{
    ImageBuffer image;
    try {
        image = ImageBuffer::decode(imagePath.toStdString());
        image.toEightBit();
        image.applyOrientation();
        if (image.channels() == 2) {
            image.expandGrayAlpha();
        }
    } catch (const ConversionError& e) {
        qWarning("Preview failed for %s: %s", qPrintable(imagePath), e.what());
        return QImage();
    } catch (const cv::Exception& e) {
        qWarning("Preview failed for %s: %s", qPrintable(imagePath), e.what());
        return QImage();
    }

    const cv::Mat& src = image.pixels();
    cv::Mat rgb;
    QImage::Format format;
    switch (src.channels()) {
        case 1:
            rgb = src;
            format = QImage::Format_Grayscale8;
            break;
        case 4:
            cv::cvtColor(src, rgb, cv::COLOR_BGRA2RGBA);
            format = QImage::Format_RGBA8888;
            break;
        default:
            cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);
            format = QImage::Format_RGB888;
            break;
    }
    // copy() detaches from the cv::Mat buffer
    return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), format).copy();
}

ImagePreviewWindow::ImagePreviewWindow(const QString& imagePath, const QImage& image, const QString& infoText,
                                       QWidget* parent)
    : QDialog(parent), m_imagePath(imagePath), m_scrollArea(nullptr), m_maxWidth(0), m_maxHeight(0)
{
    setWindowTitle(QString("Image Preview: %1").arg(QFileInfo(imagePath).fileName()));
    setMinimumSize(400, 300);
    setWindowFlags(
        Qt::Window |
        Qt::WindowSystemMenuHint |
        Qt::WindowCloseButtonHint |
        Qt::WindowMinimizeButtonHint |
        Qt::WindowMaximizeButtonHint
    );
    setAttribute(Qt::WA_DeleteOnClose);

    QScreen* screen = QApplication::primaryScreen();
    const QRect screenGeo = screen->availableGeometry();
    m_maxWidth = static_cast<int>(screenGeo.width() * 0.9);
    m_maxHeight = static_cast<int>(screenGeo.height() * 0.85);

    QPixmap pixmap = QPixmap::fromImage(image);
    if (pixmap.width() > m_maxWidth || pixmap.height() > m_maxHeight) {
        pixmap = pixmap.scaled(m_maxWidth, m_maxHeight, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
    resize(QSize(qMin(pixmap.width() + 50, m_maxWidth + 50), qMin(pixmap.height() + 90, m_maxHeight + 90)));

    QLabel* imageLabel = new QLabel;
    imageLabel->setPixmap(pixmap);
    imageLabel->setAlignment(Qt::AlignCenter);
    imageLabel->setMinimumSize(pixmap.size());

    m_scrollArea = new QScrollArea;
    m_scrollArea->setWidgetResizable(true);
    m_scrollArea->setWidget(imageLabel);

    QLabel* infoLabel = new QLabel(infoText);
    infoLabel->setObjectName("muted_label");
    infoLabel->setAlignment(Qt::AlignCenter);

    QVBoxLayout* vbox = new QVBoxLayout(this);
    vbox->addWidget(m_scrollArea);
    vbox->addWidget(infoLabel);
}
