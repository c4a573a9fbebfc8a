#pragma once

#include "ConversionTypes.h"
#include "MessageQueue.h"

#include <atomic>
#include <functional>
#include <vector>

namespace ConverterPro
{
    class ImageConverter;
    class Logger;

    struct FailedFile
    {
        fs::path path;
        ErrorKind kind = ErrorKind::None;
        std::string message;
    };

    struct BatchSummary
    {
        size_t total = 0;
        size_t succeeded = 0;
        std::vector<FailedFile> failures;
        std::vector<fs::path> outputPaths;
        double elapsedSeconds = 0.0;
    };

    struct ProgressMessage
    {
        enum class Type
        {
            Progress,
            Complete,
            Error,
            Cancelled
        };

        Type type = Type::Progress;
        double fraction = 0.0;
        std::string text;
        size_t fileIndex = 0;
        size_t totalFiles = 0;
        BatchSummary summary;   // Complete / Cancelled only

        bool isTerminal() const { return type != Type::Progress; }
    };

    /**
     * @brief Runs the conversion pipeline over a file list, one file at a
     * time, and reports through a message queue.
     *
     * Message order: one Progress before each file, then exactly one
     * terminal message (Complete, Error or Cancelled). Failed files are
     * collected in the summary; they never stop the batch.
     */
    class BatchConverter
    {
    public:
        using ConvertFunction = std::function<ConversionResult(const fs::path&, const ConversionSettings&)>;

        BatchConverter(Logger& logger, const ImageConverter& converter, MessageQueue<ProgressMessage>& queue);

        // Any per-file conversion; an exception it throws halts the batch with an Error message
        BatchConverter(Logger& logger, ConvertFunction convert, MessageQueue<ProgressMessage>& queue);

        /**
         * @brief Converts the files in order. Blocks until done.
         * @param cancelRequested Checked before each file; the file in
         *        flight always finishes.
         * @return The summary also carried by the terminal message.
         */
        BatchSummary run(const std::vector<fs::path>& files, const ConversionSettings& settings,
                         const std::atomic<bool>& cancelRequested);

    private:
        void pushTerminal(ProgressMessage::Type type, const std::string& text, const BatchSummary& summary);

        Logger& m_logger;
        ConvertFunction m_convert;
        MessageQueue<ProgressMessage>& m_queue;
    };

} // namespace ConverterPro
