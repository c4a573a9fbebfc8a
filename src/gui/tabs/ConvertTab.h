#ifndef CONVERT_TAB_H
#define CONVERT_TAB_H

#include <QStringList>

#include "BaseTab.h"
#include "core/BatchConverter.h"
#include "core/ImageConverter.h"
#include "core/MessageQueue.h"

namespace ConverterPro {
class Logger;
}

class ConversionWorker;
class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTimer;

class ConvertTab : public BaseTab
{
    Q_OBJECT

public:
    ConvertTab(ConverterPro::Logger& logger, QWidget *parent = nullptr);
    ~ConvertTab();

    void loadSettings(const ConverterPro::ConfigManager& config) override;
    void saveSettings(ConverterPro::ConfigManager& config) const override;
    bool isBusy() const override;

    /**
     * @brief Adds image files to the list; duplicates and non-images are skipped.
     * @return Number of files actually added.
     */
    int addFiles(const QStringList &paths);

    QStringList files() const { return m_files; }

    /**
     * @brief Settings a batch started now would use.
     */
    ConverterPro::ConversionSettings collectSettings() const;

public slots:
    void browseFiles() override;
    void browseDirectory() override;
    void browseOutput() override;
    void startConversion();
    void cancelConversion();

private slots:
    void clearFiles();
    void removeFile(const QString &path);
    void resetOutputFolder();
    void updatePreview();
    void openPreview(QListWidgetItem *item);
    void pollQueue();

private:
    void setupUi();
    QWidget* createFilePanel();
    QWidget* createSettingsPanel();
    QWidget* createProgressPanel();
    void updateFileCount();
    void setRunning(bool running);
    void finishBatch(const ConverterPro::ProgressMessage &message);
    QString infoLine(const QString &path) const;

    ConverterPro::Logger& m_logger;
    ConverterPro::ImageConverter m_converter;
    ConverterPro::MessageQueue<ConverterPro::ProgressMessage> m_queue;
    ConversionWorker *m_worker;
    QTimer *m_pollTimer;
    QStringList m_files;
    bool m_autoClear;
    bool m_rememberOutputFolder;
    bool m_detailedProgress;

    // File list
    QListWidget *m_fileList;
    QLabel *m_fileCountLabel;
    QLabel *m_previewLabel;
    QLabel *m_previewInfo;

    // Settings
    QComboBox *m_formatCombo;
    QLineEdit *m_outputFolder;
    QCheckBox *m_resizeCheck;
    QSpinBox *m_widthSpin;
    QSpinBox *m_heightSpin;
    QCheckBox *m_qualityCheck;
    QSpinBox *m_qualitySpin;

    // Progress & buttons
    QProgressBar *m_progressBar;
    QLabel *m_statusLabel;
    QPushButton *m_startButton;
    QPushButton *m_cancelButton;
};

#endif // CONVERT_TAB_H
