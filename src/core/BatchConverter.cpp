#include "BatchConverter.h"
#include "FileSystemUtil.h"
#include "ImageConverter.h"
#include "utils/Logger.h"

#include <chrono>
#include <utility>

namespace ConverterPro
{
    BatchConverter::BatchConverter(Logger& logger, const ImageConverter& converter, MessageQueue<ProgressMessage>& queue)
        : BatchConverter(logger,
                         [&converter](const fs::path& path, const ConversionSettings& settings) {
                             return converter.convert(path, settings);
                         },
                         queue)
    {
    }

    BatchConverter::BatchConverter(Logger& logger, ConvertFunction convert, MessageQueue<ProgressMessage>& queue)
        : m_logger(logger), m_convert(std::move(convert)), m_queue(queue)
    {
    }

    BatchSummary BatchConverter::run(const std::vector<fs::path>& files, const ConversionSettings& settings,
                                     const std::atomic<bool>& cancelRequested)
    {
        const auto start = std::chrono::steady_clock::now();
        auto elapsed = [&start] {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        };

        BatchSummary summary;
        summary.total = files.size();
        m_logger.info("Starting batch conversion of " + std::to_string(files.size()) + " file(s) to " +
                      settings.outputFormat);

        try {
            for (size_t i = 0; i < files.size(); ++i) {
                if (cancelRequested.load()) {
                    summary.elapsedSeconds = elapsed();
                    m_logger.warning("Conversion cancelled after " + std::to_string(i) + " of " +
                                     std::to_string(files.size()) + " file(s)");
                    pushTerminal(ProgressMessage::Type::Cancelled,
                                 "Conversion cancelled: " + std::to_string(summary.succeeded) + "/" +
                                 std::to_string(summary.total) + " successful",
                                 summary);
                    return summary;
                }

                const fs::path& file = files[i];
                ProgressMessage progress;
                progress.type = ProgressMessage::Type::Progress;
                progress.fraction = static_cast<double>(i) / static_cast<double>(files.size());
                progress.text = "Converting " + file.filename().string() + "...";
                progress.fileIndex = i;
                progress.totalFiles = files.size();
                m_queue.push(std::move(progress));

                const ConversionResult result = m_convert(file, settings);
                if (result.success) {
                    ++summary.succeeded;
                    summary.outputPaths.push_back(result.outputPath);
                } else {
                    summary.failures.push_back({file, result.failureReason, result.message});
                }
            }
        } catch (const std::exception& e) {
            summary.elapsedSeconds = elapsed();
            m_logger.error(std::string("Batch conversion error: ") + e.what());
            pushTerminal(ProgressMessage::Type::Error, e.what(), summary);
            return summary;
        }

        summary.elapsedSeconds = elapsed();
        const std::string text = "Conversion complete: " + std::to_string(summary.succeeded) + "/" +
                                 std::to_string(summary.total) + " successful";
        m_logger.info(text + " (" + FileSystemUtil::formatDuration(summary.elapsedSeconds) + ")");
        pushTerminal(ProgressMessage::Type::Complete, text, summary);
        return summary;
    }

    void BatchConverter::pushTerminal(ProgressMessage::Type type, const std::string& text, const BatchSummary& summary)
    {
        ProgressMessage message;
        message.type = type;
        message.fraction = type == ProgressMessage::Type::Complete ? 1.0
                         : summary.total == 0 ? 0.0
                         : static_cast<double>(summary.succeeded + summary.failures.size()) / static_cast<double>(summary.total);
        message.text = text;
        message.fileIndex = summary.succeeded + summary.failures.size();
        message.totalFiles = summary.total;
        message.summary = summary;
        m_queue.push(std::move(message));
    }

} // namespace ConverterPro
