#include "ConvertTab.h"
#include "components/ImagePreviewWindow.h"
#include "components/QueueItemWidget.h"
#include "core/ConfigManager.h"
#include "core/FileSystemUtil.h"
#include "core/FormatTable.h"
#include "helpers/ConversionWorker.h"
#include "styles/Style.h"
#include "utils/Definitions.h"
#include "utils/Logger.h"

#include <QCheckBox>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPixmap>
#include <QProgressBar>
#include <QPushButton>
#include <QSpinBox>
#include <QTimer>
#include <QVBoxLayout>
#include <algorithm>

using namespace ConverterPro;
namespace def = ConverterPro::Definitions;

namespace {

fs::path toPath(const QString &path)
{
    return fs::path(path.toStdString());
}

QString toQString(const fs::path &path)
{
    return QString::fromStdString(path.string());
}

QString fileSizeText(const QString &path)
{
    const auto size = FileSystemUtil::fileSize(toPath(path));
    return size ? QString::fromStdString(FileSystemUtil::formatFileSize(*size)) : QString("?");
}

} // namespace

ConvertTab::ConvertTab(Logger& logger, QWidget *parent)
    : BaseTab(parent),
      m_logger(logger),
      m_converter(logger),
      m_worker(nullptr),
      m_pollTimer(new QTimer(this)),
      m_autoClear(false),
      m_rememberOutputFolder(true),
      m_detailedProgress(true)
{
    setupUi();
    m_pollTimer->setInterval(def::QUEUE_POLL_INTERVAL_MS);
    connect(m_pollTimer, &QTimer::timeout, this, &ConvertTab::pollQueue);
}

ConvertTab::~ConvertTab()
{
    if (m_worker) {
        m_worker->requestCancel();
        m_worker->wait();
    }
}

void ConvertTab::setupUi()
{
    QHBoxLayout *mainLayout = new QHBoxLayout(this);

    QVBoxLayout *leftColumn = new QVBoxLayout;
    leftColumn->addWidget(createFilePanel(), 1);
    leftColumn->addWidget(createProgressPanel());
    mainLayout->addLayout(leftColumn, 3);

    mainLayout->addWidget(createSettingsPanel(), 2);
}

QWidget* ConvertTab::createFilePanel()
{
    QGroupBox *group = new QGroupBox("Files to Convert");
    QVBoxLayout *layout = new QVBoxLayout(group);

    QHBoxLayout *buttons = new QHBoxLayout;
    QPushButton *btnAddFiles = new QPushButton("Add Files...");
    connect(btnAddFiles, &QPushButton::clicked, this, &ConvertTab::browseFiles);
    Style::applyShadowEffect(btnAddFiles);

    QPushButton *btnAddFolder = new QPushButton("Add Folder...");
    connect(btnAddFolder, &QPushButton::clicked, this, &ConvertTab::browseDirectory);
    Style::applyShadowEffect(btnAddFolder);

    QPushButton *btnClear = new QPushButton("Clear All");
    btnClear->setObjectName("clear_button");
    connect(btnClear, &QPushButton::clicked, this, &ConvertTab::clearFiles);
    Style::applyShadowEffect(btnClear);

    m_fileCountLabel = new QLabel("No files");
    m_fileCountLabel->setObjectName("muted_label");

    buttons->addWidget(btnAddFiles);
    buttons->addWidget(btnAddFolder);
    buttons->addWidget(btnClear);
    buttons->addStretch(1);
    buttons->addWidget(m_fileCountLabel);
    layout->addLayout(buttons);

    m_fileList = new QListWidget;
    m_fileList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_fileList->setToolTip("Double-click a file to open a full-size preview");
    connect(m_fileList, &QListWidget::itemSelectionChanged, this, &ConvertTab::updatePreview);
    connect(m_fileList, &QListWidget::itemDoubleClicked, this, &ConvertTab::openPreview);
    layout->addWidget(m_fileList, 1);

    QHBoxLayout *preview = new QHBoxLayout;
    m_previewLabel = new QLabel;
    m_previewLabel->setFixedSize(160, 120);
    m_previewLabel->setAlignment(Qt::AlignCenter);
    m_previewLabel->setStyleSheet("border: 1px solid #4f545c; border-radius: 4px;");
    m_previewInfo = new QLabel("Select a file to see its details");
    m_previewInfo->setObjectName("muted_label");
    m_previewInfo->setWordWrap(true);
    preview->addWidget(m_previewLabel);
    preview->addWidget(m_previewInfo, 1);
    layout->addLayout(preview);

    return group;
}

QWidget* ConvertTab::createSettingsPanel()
{
    QGroupBox *group = new QGroupBox("Conversion Settings");
    QFormLayout *form = new QFormLayout(group);

    m_formatCombo = new QComboBox;
    for (const auto& name : FormatTable::instance().names()) {
        const QString key = QString::fromStdString(name);
        m_formatCombo->addItem(key.toUpper(), key);
    }
    form->addRow("Output format:", m_formatCombo);

    QHBoxLayout *outputRow = new QHBoxLayout;
    m_outputFolder = new QLineEdit;
    m_outputFolder->setReadOnly(true);
    m_outputFolder->setPlaceholderText("Same as input");
    QPushButton *btnOutput = new QPushButton("Browse...");
    connect(btnOutput, &QPushButton::clicked, this, &ConvertTab::browseOutput);
    QPushButton *btnReset = new QPushButton("Reset");
    btnReset->setToolTip("Write next to the source files");
    connect(btnReset, &QPushButton::clicked, this, &ConvertTab::resetOutputFolder);
    outputRow->addWidget(m_outputFolder, 1);
    outputRow->addWidget(btnOutput);
    outputRow->addWidget(btnReset);
    form->addRow("Output folder:", outputRow);

    // Resize
    m_resizeCheck = new QCheckBox("Resize images (keep aspect ratio)");
    form->addRow(m_resizeCheck);

    m_widthSpin = new QSpinBox;
    m_widthSpin->setRange(def::MIN_DIMENSION, def::MAX_DIMENSION);
    m_widthSpin->setValue(def::DEFAULT_RESIZE_WIDTH);
    m_widthSpin->setSuffix(" px");
    m_heightSpin = new QSpinBox;
    m_heightSpin->setRange(def::MIN_DIMENSION, def::MAX_DIMENSION);
    m_heightSpin->setValue(def::DEFAULT_RESIZE_HEIGHT);
    m_heightSpin->setSuffix(" px");
    QHBoxLayout *sizeRow = new QHBoxLayout;
    sizeRow->addWidget(m_widthSpin);
    sizeRow->addWidget(new QLabel("x"));
    sizeRow->addWidget(m_heightSpin);
    form->addRow("Max size:", sizeRow);

    m_widthSpin->setEnabled(false);
    m_heightSpin->setEnabled(false);
    connect(m_resizeCheck, &QCheckBox::toggled, m_widthSpin, &QWidget::setEnabled);
    connect(m_resizeCheck, &QCheckBox::toggled, m_heightSpin, &QWidget::setEnabled);

    // Quality
    m_qualityCheck = new QCheckBox("Custom quality (JPEG, WEBP)");
    form->addRow(m_qualityCheck);
    m_qualitySpin = new QSpinBox;
    m_qualitySpin->setRange(def::MIN_QUALITY, def::MAX_QUALITY);
    m_qualitySpin->setValue(def::DEFAULT_QUALITY);
    m_qualitySpin->setEnabled(false);
    connect(m_qualityCheck, &QCheckBox::toggled, m_qualitySpin, &QWidget::setEnabled);
    form->addRow("Quality:", m_qualitySpin);

    return group;
}

QWidget* ConvertTab::createProgressPanel()
{
    QWidget *container = new QWidget;
    QVBoxLayout *layout = new QVBoxLayout(container);
    layout->setContentsMargins(0, 0, 0, 0);

    m_progressBar = new QProgressBar;
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    layout->addWidget(m_progressBar);

    m_statusLabel = new QLabel("Ready to convert images");
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setObjectName("muted_label");
    layout->addWidget(m_statusLabel);

    QHBoxLayout *buttons = new QHBoxLayout;
    m_startButton = new QPushButton("Start Conversion");
    m_startButton->setStyleSheet(Style::STYLE_START);
    Style::applyShadowEffect(m_startButton);
    connect(m_startButton, &QPushButton::clicked, this, &ConvertTab::startConversion);

    m_cancelButton = new QPushButton("Cancel");
    m_cancelButton->setStyleSheet(Style::STYLE_CANCEL);
    Style::applyShadowEffect(m_cancelButton);
    connect(m_cancelButton, &QPushButton::clicked, this, &ConvertTab::cancelConversion);
    m_cancelButton->hide();

    buttons->addWidget(m_startButton);
    buttons->addWidget(m_cancelButton);
    layout->addLayout(buttons);

    return container;
}

void ConvertTab::loadSettings(const ConfigManager& config)
{
    const QString format = QString::fromStdString(config.get<std::string>("default_output_format", "png"));
    const int index = m_formatCombo->findData(format.toLower());
    m_formatCombo->setCurrentIndex(index >= 0 ? index : 0);

    m_qualitySpin->setValue(std::clamp(config.get<int>("default_quality", def::DEFAULT_QUALITY),
                                       def::MIN_QUALITY, def::MAX_QUALITY));
    m_widthSpin->setValue(std::clamp(config.get<int>("default_resize_width", def::DEFAULT_RESIZE_WIDTH),
                                     def::MIN_DIMENSION, def::MAX_DIMENSION));
    m_heightSpin->setValue(std::clamp(config.get<int>("default_resize_height", def::DEFAULT_RESIZE_HEIGHT),
                                      def::MIN_DIMENSION, def::MAX_DIMENSION));

    m_rememberOutputFolder = config.get<bool>("remember_output_folder", true);
    m_autoClear = config.get<bool>("auto_clear_after_conversion", false);
    m_detailedProgress = config.get<bool>("show_detailed_progress", true);

    if (m_rememberOutputFolder) {
        const QString folder = QString::fromStdString(config.get<std::string>("last_output_folder", ""));
        if (!folder.isEmpty() && QFileInfo(folder).isDir()) {
            m_outputFolder->setText(folder);
        }
    }
}

void ConvertTab::saveSettings(ConfigManager& config) const
{
    config.set("default_output_format", m_formatCombo->currentData().toString().toStdString());
    if (m_rememberOutputFolder) {
        config.set("last_output_folder", m_outputFolder->text().trimmed().toStdString());
    }
}

bool ConvertTab::isBusy() const
{
    return m_worker != nullptr;
}

void ConvertTab::browseFiles()
{
    const QStringList paths = QFileDialog::getOpenFileNames(
        this, "Select images to convert", QString(), imageFileFilter());
    if (!paths.isEmpty()) {
        addFiles(paths);
    }
}

void ConvertTab::browseDirectory()
{
    const QString directory = QFileDialog::getExistingDirectory(this, "Select a folder of images");
    if (directory.isEmpty()) {
        return;
    }
    QStringList paths;
    for (const auto& file : FileSystemUtil::getImageFiles(toPath(directory))) {
        paths << toQString(file);
    }
    if (paths.isEmpty()) {
        QMessageBox::warning(this, "No Files", "The selected folder contains no supported images.");
        return;
    }
    addFiles(paths);
}

void ConvertTab::browseOutput()
{
    const QString directory = QFileDialog::getExistingDirectory(this, "Select output folder", m_outputFolder->text());
    if (!directory.isEmpty()) {
        m_outputFolder->setText(directory);
    }
}

void ConvertTab::resetOutputFolder()
{
    m_outputFolder->clear();
}

int ConvertTab::addFiles(const QStringList &paths)
{
    int added = 0;
    int duplicates = 0;
    int invalid = 0;

    for (const QString &path : paths) {
        const QString absolute = QFileInfo(path).absoluteFilePath();
        if (!QFileInfo(absolute).isFile() || !FileSystemUtil::isImageFile(toPath(absolute))) {
            ++invalid;
            continue;
        }
        if (m_files.contains(absolute)) {
            ++duplicates;
            continue;
        }

        m_files << absolute;
        ++added;

        QListWidgetItem *item = new QListWidgetItem(m_fileList);
        item->setData(Qt::UserRole, absolute);
        QueueItemWidget *row = new QueueItemWidget(absolute, fileSizeText(absolute));
        item->setSizeHint(row->sizeHint());
        m_fileList->setItemWidget(item, row);
        // Queued: the row is deleted by the slot
        connect(row, &QueueItemWidget::removeRequested, this, &ConvertTab::removeFile, Qt::QueuedConnection);
    }

    updateFileCount();

    if (added > 0) {
        m_statusLabel->setText(QString("%1 files added, %2 total files ready").arg(added).arg(m_files.size()));
        m_logger.info("Added " + std::to_string(added) + " file(s) to the list");
    } else if (duplicates > 0) {
        QMessageBox::information(this, "Duplicate Files", QString("%1 files were already in the list.").arg(duplicates));
    } else if (invalid > 0) {
        QMessageBox::warning(this, "Invalid Files", QString("%1 files are not supported image formats.").arg(invalid));
    }
    return added;
}

void ConvertTab::removeFile(const QString &path)
{
    if (m_worker) {
        return;
    }
    for (int i = 0; i < m_fileList->count(); ++i) {
        if (m_fileList->item(i)->data(Qt::UserRole).toString() == path) {
            delete m_fileList->takeItem(i);
            break;
        }
    }
    m_files.removeAll(path);
    updateFileCount();
}

void ConvertTab::clearFiles()
{
    if (m_files.isEmpty() || m_worker) {
        return;
    }
    const auto answer = QMessageBox::question(
        this, "Clear Files",
        QString("Are you sure you want to remove all %1 files from the list?").arg(m_files.size()));
    if (answer != QMessageBox::Yes) {
        return;
    }
    m_files.clear();
    m_fileList->clear();
    updateFileCount();
    m_progressBar->setValue(0);
    m_statusLabel->setText("Ready to convert images");
}

void ConvertTab::updateFileCount()
{
    const int count = m_files.size();
    if (count == 0) {
        m_fileCountLabel->setText("No files");
    } else if (count == 1) {
        m_fileCountLabel->setText("1 file");
    } else {
        m_fileCountLabel->setText(QString("%1 files").arg(count));
    }
}

QString ConvertTab::infoLine(const QString &path) const
{
    const auto info = m_converter.imageInfo(toPath(path));
    if (!info) {
        return QString("%1\nUnable to read image details").arg(QFileInfo(path).fileName());
    }
    QStringList parts;
    parts << QString::fromStdString(info->format).toUpper()
          << QString("%1 x %2").arg(info->width).arg(info->height)
          << QString::fromStdString(info->mode)
          << QString::fromStdString(FileSystemUtil::formatFileSize(info->fileSize));
    if (info->hasTransparency) {
        parts << "transparency";
    }
    if (info->hasExif) {
        parts << "EXIF";
    }
    return QString("%1\n%2").arg(QString::fromStdString(info->name), parts.join(" | "));
}

void ConvertTab::updatePreview()
{
    const QList<QListWidgetItem*> selected = m_fileList->selectedItems();
    if (selected.isEmpty()) {
        m_previewLabel->clear();
        m_previewInfo->setText("Select a file to see its details");
        return;
    }
    const QString path = selected.first()->data(Qt::UserRole).toString();
    const QImage image = ImagePreviewWindow::loadImage(path);
    if (image.isNull()) {
        m_previewLabel->setText("No preview");
    } else {
        m_previewLabel->setPixmap(QPixmap::fromImage(image).scaled(
            m_previewLabel->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
    }
    m_previewInfo->setText(infoLine(path));
}

void ConvertTab::openPreview(QListWidgetItem *item)
{
    if (!item) {
        return;
    }
    const QString path = item->data(Qt::UserRole).toString();
    const QImage image = ImagePreviewWindow::loadImage(path);
    if (image.isNull()) {
        QMessageBox::critical(this, "Error", QString("Could not load image file: %1").arg(path));
        return;
    }
    ImagePreviewWindow *window = new ImagePreviewWindow(path, image, infoLine(path), this);
    window->show();
}

ConversionSettings ConvertTab::collectSettings() const
{
    ConversionSettings settings;
    settings.outputFormat = m_formatCombo->currentData().toString().toStdString();
    const QString folder = m_outputFolder->text().trimmed();
    if (!folder.isEmpty()) {
        settings.outputFolder = toPath(folder);
    }
    settings.resize = m_resizeCheck->isChecked();
    if (settings.resize) {
        settings.resizeTarget = std::make_pair(m_widthSpin->value(), m_heightSpin->value());
    }
    if (m_qualityCheck->isChecked()) {
        settings.quality = m_qualitySpin->value();
    }
    return settings;
}

void ConvertTab::startConversion()
{
    if (m_worker) {
        return;
    }
    if (m_files.isEmpty()) {
        QMessageBox::warning(this, "No Files", "Please select files to convert first.");
        return;
    }

    const ConversionSettings settings = collectSettings();

    if (settings.outputFolder) {
        if (!FileSystemUtil::validateOutputFolder(*settings.outputFolder)) {
            QMessageBox::critical(this, "Output Folder",
                                  QString("Cannot write to %1").arg(toQString(*settings.outputFolder)));
            return;
        }
        std::uintmax_t needed = 0;
        for (const QString &file : m_files) {
            needed += FileSystemUtil::fileSize(toPath(file)).value_or(0);
        }
        const auto available = FileSystemUtil::availableSpace(*settings.outputFolder);
        if (available && *available < needed) {
            const auto answer = QMessageBox::question(
                this, "Low Disk Space",
                QString("Only %1 free in the output folder; the selected files total %2. Continue?")
                    .arg(QString::fromStdString(FileSystemUtil::formatFileSize(*available)),
                         QString::fromStdString(FileSystemUtil::formatFileSize(needed))));
            if (answer != QMessageBox::Yes) {
                return;
            }
        }
    }

    std::vector<fs::path> files;
    files.reserve(static_cast<size_t>(m_files.size()));
    for (const QString &file : m_files) {
        files.push_back(toPath(file));
    }

    // Leftovers of an earlier batch must not be read as this one's
    m_queue.drain();

    m_worker = new ConversionWorker(m_logger, m_converter, m_queue, std::move(files), settings, this);
    setRunning(true);
    m_statusLabel->setText("Starting conversion...");
    m_progressBar->setValue(0);
    m_worker->start();
    m_pollTimer->start();
}

void ConvertTab::cancelConversion()
{
    if (!m_worker) {
        return;
    }
    m_worker->requestCancel();
    m_cancelButton->setEnabled(false);
    m_statusLabel->setText("Cancelling after the current file...");
}

void ConvertTab::pollQueue()
{
    for (const ProgressMessage &message : m_queue.drain()) {
        if (message.type == ProgressMessage::Type::Progress) {
            m_progressBar->setValue(static_cast<int>(message.fraction * 100.0));
            if (m_detailedProgress) {
                m_statusLabel->setText(QString("(%1/%2) %3")
                                           .arg(message.fileIndex + 1)
                                           .arg(message.totalFiles)
                                           .arg(QString::fromStdString(message.text)));
            } else {
                m_statusLabel->setText(QString::fromStdString(message.text));
            }
        } else {
            finishBatch(message);
        }
    }
}

void ConvertTab::finishBatch(const ProgressMessage &message)
{
    m_pollTimer->stop();
    if (m_worker) {
        m_worker->wait();
        m_worker->deleteLater();
        m_worker = nullptr;
    }
    setRunning(false);

    const QString text = QString::fromStdString(message.text);
    const BatchSummary &summary = message.summary;
    m_statusLabel->setText(text);

    switch (message.type) {
        case ProgressMessage::Type::Complete: {
            m_progressBar->setValue(100);
            if (!summary.failures.empty()) {
                QStringList failed;
                for (const FailedFile &f : summary.failures) {
                    failed << QString("%1 (%2): %3")
                                  .arg(toQString(f.path.filename()),
                                       QString::fromLatin1(errorKindName(f.kind)),
                                       QString::fromStdString(f.message));
                }
                QMessageBox::warning(
                    this, "Conversion Complete with Errors",
                    QString("Successfully converted: %1\nFailed: %2\n\nFailed files:\n%3")
                        .arg(summary.succeeded)
                        .arg(summary.failures.size())
                        .arg(failed.join('\n')));
            } else {
                QMessageBox::information(this, "Conversion Complete",
                                         QString("Successfully converted all %1 images!").arg(summary.succeeded));
                if (m_autoClear) {
                    m_files.clear();
                    m_fileList->clear();
                    updateFileCount();
                }
            }
            break;
        }
        case ProgressMessage::Type::Error:
            m_statusLabel->setText("Conversion failed.");
            QMessageBox::critical(this, "Conversion Error",
                                  QString("An error occurred during conversion:\n%1").arg(text));
            break;
        case ProgressMessage::Type::Cancelled:
            m_statusLabel->setText(QString("Cancelled: %1 of %2 converted")
                                       .arg(summary.succeeded)
                                       .arg(summary.total));
            break;
        case ProgressMessage::Type::Progress:
            break;
    }
}

void ConvertTab::setRunning(bool running)
{
    m_startButton->setVisible(!running);
    m_cancelButton->setVisible(running);
    m_cancelButton->setEnabled(running);
    m_formatCombo->setEnabled(!running);
    m_resizeCheck->setEnabled(!running);
    m_qualityCheck->setEnabled(!running);
    m_widthSpin->setEnabled(!running && m_resizeCheck->isChecked());
    m_heightSpin->setEnabled(!running && m_resizeCheck->isChecked());
    m_qualitySpin->setEnabled(!running && m_qualityCheck->isChecked());
}
