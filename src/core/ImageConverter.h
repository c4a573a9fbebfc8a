#pragma once

#include "ConversionTypes.h"
#include "FormatTable.h"
#include "ImageBuffer.h"

#include <optional>
#include <vector>

namespace ConverterPro
{
    class Logger;

    /**
     * @brief Single-file conversion pipeline.
     *
     * validate -> output path -> decode -> transparency -> orientation ->
     * resize -> encode and write. Every step is a hard gate; the first
     * failure is returned as a ConversionResult and logged, nothing throws
     * out of convert().
     *
     * The converter holds no per-file state, so one instance can serve a
     * whole batch.
     */
    class ImageConverter
    {
    public:
        explicit ImageConverter(Logger& logger);
        virtual ~ImageConverter() = default;

        ConversionResult convert(const fs::path& inputPath, const ConversionSettings& settings) const;

        /**
         * @brief True if the file extension is a supported input extension.
         */
        static bool isSupportedFormat(const fs::path& path);

        /**
         * @brief Decodes the file header and pixels to describe it.
         * @return std::nullopt if the file is missing or cannot be decoded.
         */
        std::optional<ImageInfo> imageInfo(const fs::path& path) const;

    private:
        static void validateSettings(const ConversionSettings& settings);
        fs::path prepareOutputPath(const fs::path& inputPath, const ConversionSettings& settings,
                                   const CapabilityEntry& format) const;
        static void prepareForEncoder(ImageBuffer& image, const CapabilityEntry& format);
        static std::vector<uint8_t> encode(const ImageBuffer& image, const CapabilityEntry& format, int quality);

        Logger& m_logger;

    protected:
        /**
         * @brief Writes the encoded bytes to the output path.
         * @throws ConversionError (EncodeError) or any std::exception; the
         * caller removes whatever was written.
         */
        virtual void writeOutput(const fs::path& outputPath, const std::vector<uint8_t>& bytes) const;
    };

} // namespace ConverterPro
