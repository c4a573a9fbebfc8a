#pragma once

#include "core/BatchConverter.h"

#include <QThread>
#include <atomic>
#include <vector>

namespace ConverterPro {
class ImageConverter;
class Logger;
}

/**
 * @brief Background thread running one batch.
 *
 * The file list and settings are copied in at construction. Results go to
 * the message queue only; the owner polls it.
 */
class ConversionWorker : public QThread
{
    Q_OBJECT

public:
    ConversionWorker(ConverterPro::Logger& logger,
                     const ConverterPro::ImageConverter& converter,
                     ConverterPro::MessageQueue<ConverterPro::ProgressMessage>& queue,
                     std::vector<std::filesystem::path> files,
                     ConverterPro::ConversionSettings settings,
                     QObject* parent = nullptr);

    // Stops before the next file; the current one finishes
    void requestCancel();

protected:
    void run() override;

private:
    ConverterPro::Logger& m_logger;
    const ConverterPro::ImageConverter& m_converter;
    ConverterPro::MessageQueue<ConverterPro::ProgressMessage>& m_queue;
    const std::vector<std::filesystem::path> m_files;
    const ConverterPro::ConversionSettings m_settings;
    std::atomic<bool> m_cancelRequested{false};
};
