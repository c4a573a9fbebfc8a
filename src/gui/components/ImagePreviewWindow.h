#pragma once

#include <QDialog>
#include <QImage>
#include <QString>

class QScrollArea;

class ImagePreviewWindow : public QDialog
{
    Q_OBJECT

public:
    /**
     * @brief Shows an already decoded image; see loadImage().
     */
    ImagePreviewWindow(const QString& imagePath, const QImage& image, const QString& infoText,
                       QWidget* parent = nullptr);

    /**
     * @brief Decodes a file with the converter's codecs (so every supported
     * input format previews), EXIF orientation applied.
     * @return A null QImage if the file cannot be decoded.
     */
    static QImage loadImage(const QString& imagePath);

private:
    QString m_imagePath;
    QScrollArea* m_scrollArea;
    int m_maxWidth;
    int m_maxHeight;
};
