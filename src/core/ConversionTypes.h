#pragma once

#include "Common.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ConverterPro
{
    /**
     * @brief Options of one conversion. Copied into the worker before a batch
     * starts and never modified afterwards.
     */
    struct ConversionSettings
    {
        std::string outputFormat = "png";
        std::optional<fs::path> outputFolder;           // empty/absent: next to the source
        bool resize = false;
        std::optional<std::pair<int, int>> resizeTarget; // width, height
        std::optional<int> quality;                      // JPEG and WebP only
    };

    struct ConversionResult
    {
        bool success = false;
        fs::path outputPath;
        ErrorKind failureReason = ErrorKind::None;
        std::string message;

        static ConversionResult ok(const fs::path& path)
        {
            ConversionResult r;
            r.success = true;
            r.outputPath = path;
            return r;
        }

        static ConversionResult failure(ErrorKind kind, const std::string& message)
        {
            ConversionResult r;
            r.failureReason = kind;
            r.message = message;
            return r;
        }
    };

    // Summary shown by the preview dialog
    struct ImageInfo
    {
        std::string name;
        std::string format;
        std::string mode;
        int width = 0;
        int height = 0;
        std::uintmax_t fileSize = 0;
        bool hasTransparency = false;
        bool hasExif = false;
    };

} // namespace ConverterPro
