#include "ConversionWorker.h"
#include "utils/Logger.h"

#include <utility>

using namespace ConverterPro;

ConversionWorker::ConversionWorker(Logger& logger,
                                   const ImageConverter& converter,
                                   MessageQueue<ProgressMessage>& queue,
                                   std::vector<fs::path> files,
                                   ConversionSettings settings,
                                   QObject* parent)
    : QThread(parent),
      m_logger(logger),
      m_converter(converter),
      m_queue(queue),
      m_files(std::move(files)),
      m_settings(std::move(settings))
{
}

void ConversionWorker::requestCancel()
{
    m_cancelRequested.store(true);
}

void ConversionWorker::run()
{
    try {
        BatchConverter batch(m_logger, m_converter, m_queue);
        batch.run(m_files, m_settings, m_cancelRequested);
    } catch (const std::exception& e) {
        m_logger.error(std::string("Conversion worker failed: ") + e.what());
        ProgressMessage message;
        message.type = ProgressMessage::Type::Error;
        message.text = e.what();
        message.totalFiles = m_files.size();
        m_queue.push(std::move(message));
    }
}
