#include "ImageConverter.h"
#include "FileSystemUtil.h"
#include "ImageProbe.h"
#include "IcoCodec.h"
#include "utils/Definitions.h"
#include "utils/Logger.h"

#include <algorithm>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

namespace ConverterPro
{
    namespace
    {
        // libtiff COMPRESSION_LZW
        constexpr int TIFF_COMPRESSION_LZW = 5;
        constexpr int PNG_MAX_COMPRESSION = 9;

        /**
         * Runs one pipeline step. Codec and filesystem exceptions raised inside
         * it are reported as that step's error kind.
         */
        template <typename Fn>
        auto runStep(ErrorKind kind, Fn&& fn) -> decltype(fn())
        {
            try {
                return fn();
            } catch (const ConversionError&) {
                throw;
            } catch (const cv::Exception& e) {
                throw ConversionError(kind, e.what());
            } catch (const std::exception& e) {
                throw ConversionError(kind, e.what());
            }
        }

        const char* encoderExtension(EncoderId id)
        {
            switch (id) {
                case EncoderId::PNG: return ".png";
                case EncoderId::JPEG: return ".jpg";
                case EncoderId::WEBP: return ".webp";
                case EncoderId::TIFF: return ".tiff";
                case EncoderId::BMP: return ".bmp";
                case EncoderId::GIF: return ".gif";
                case EncoderId::ICO: return ".ico";
            }
            return ".png";
        }

        bool inDimensionRange(int v)
        {
            return v >= Definitions::MIN_DIMENSION && v <= Definitions::MAX_DIMENSION;
        }
    } // namespace

    ImageConverter::ImageConverter(Logger& logger)
        : m_logger(logger)
    {
    }

    bool ImageConverter::isSupportedFormat(const fs::path& path)
    {
        const auto& exts = Definitions::SUPPORTED_INPUT_EXTENSIONS;
        return std::find(exts.begin(), exts.end(), lower_extension(path)) != exts.end();
    }

    ConversionResult ImageConverter::convert(const fs::path& inputPath, const ConversionSettings& settings) const
    {
        const std::string name = inputPath.filename().string();
        fs::path outputPath;
        bool outputTouched = false;

        try {
            // 1. Existence & input format
            std::error_code ec;
            if (!fs::is_regular_file(inputPath, ec)) {
                throw ConversionError(ErrorKind::InputNotFound, "Input file not found: " + inputPath.string());
            }
            if (!isSupportedFormat(inputPath)) {
                throw ConversionError(ErrorKind::UnsupportedInputFormat,
                                      "Unsupported input format: " + inputPath.extension().string());
            }

            // 2. Output format & settings; nothing is written before this passes
            const std::optional<CapabilityEntry> format = FormatTable::instance().lookup(settings.outputFormat);
            if (!format) {
                throw ConversionError(ErrorKind::UnsupportedOutputFormat,
                                      "Unsupported output format: " + settings.outputFormat);
            }
            validateSettings(settings);

            // 3. Output path
            outputPath = runStep(ErrorKind::IOError, [&] {
                return prepareOutputPath(inputPath, settings, *format);
            });

            // 4. Decode
            ImageBuffer image = runStep(ErrorKind::DecodeError, [&] {
                ImageBuffer decoded = ImageBuffer::decode(inputPath);
                if (!format->supportsHighBitDepth ||
                    (decoded.depth() != CV_8U && decoded.depth() != CV_16U)) {
                    decoded.toEightBit();
                }
                return decoded;
            });

            runStep(ErrorKind::DecodeError, [&] {
                // 5. Transparency
                if (!format->supportsTransparency && image.hasAlpha()) {
                    image.flattenTransparency(cv::Scalar(255, 255, 255));
                }
                // 6. Orientation
                image.applyOrientation();
                // 7. Resize
                if (settings.resize && settings.resizeTarget) {
                    image.resizeToFit(cv::Size(settings.resizeTarget->first, settings.resizeTarget->second));
                }
            });

            // 8. Encode & write
            const int quality = std::clamp(settings.quality.value_or(Definitions::DEFAULT_QUALITY),
                                           Definitions::MIN_QUALITY, Definitions::MAX_QUALITY);
            runStep(ErrorKind::EncodeError, [&] {
                prepareForEncoder(image, *format);
                const std::vector<uint8_t> bytes = encode(image, *format, quality);
                image.release();
                outputTouched = true;
                writeOutput(outputPath, bytes);
            });

            m_logger.info("Successfully converted " + name + " to " + outputPath.string());
            return ConversionResult::ok(outputPath);
        } catch (const ConversionError& e) {
            if (outputTouched && e.kind() == ErrorKind::EncodeError) {
                std::error_code ec;
                fs::remove(outputPath, ec);
                if (ec) {
                    m_logger.warning("Could not remove partial output " + outputPath.string() + ": " + ec.message());
                }
            }
            m_logger.error("Error converting " + name + " (" + errorKindName(e.kind()) + "): " + e.what());
            return ConversionResult::failure(e.kind(), e.what());
        }
    }

    void ImageConverter::validateSettings(const ConversionSettings& settings)
    {
        if (settings.resize && settings.resizeTarget) {
            const int w = settings.resizeTarget->first;
            const int h = settings.resizeTarget->second;
            if (!inDimensionRange(w) || !inDimensionRange(h)) {
                throw ConversionError(ErrorKind::InvalidSettings,
                                      "Resize target " + std::to_string(w) + "x" + std::to_string(h) +
                                      " is outside 1..65535");
            }
        }
    }

    fs::path ImageConverter::prepareOutputPath(const fs::path& inputPath, const ConversionSettings& settings,
                                               const CapabilityEntry& format) const
    {
        fs::path folder = inputPath.parent_path();
        if (settings.outputFolder && !settings.outputFolder->empty()) {
            folder = *settings.outputFolder;
        }
        if (!FileSystemUtil::createDirectory(folder)) {
            throw ConversionError(ErrorKind::IOError, "Cannot create output folder: " + folder.string());
        }
        return FileSystemUtil::uniqueOutputPath(folder, inputPath.stem().string(), format.name);
    }

    void ImageConverter::prepareForEncoder(ImageBuffer& image, const CapabilityEntry& format)
    {
        // No OpenCV encoder takes 2-channel data
        if (image.channels() == 2) {
            if (format.supportsTransparency) {
                image.expandGrayAlpha();
            } else {
                image.toColor();
            }
        }

        switch (format.encoderId) {
            case EncoderId::JPEG:
                if (image.channels() != 3) {
                    image.toColor();
                }
                break;
            case EncoderId::ICO:
                if (image.width() > Definitions::ICO_MAX_DIMENSION || image.height() > Definitions::ICO_MAX_DIMENSION) {
                    image.resizeToFit(cv::Size(Definitions::ICO_MAX_DIMENSION, Definitions::ICO_MAX_DIMENSION));
                }
                break;
            default:
                break;
        }
    }

    std::vector<uint8_t> ImageConverter::encode(const ImageBuffer& image, const CapabilityEntry& format, int quality)
    {
        std::vector<uint8_t> bytes;

        if (format.encoderId == EncoderId::ICO) {
            bytes = IcoCodec::encode(image.pixels());
            if (bytes.empty()) {
                throw ConversionError(ErrorKind::EncodeError, "ICO encoder rejected the image");
            }
            return bytes;
        }

        std::vector<int> params;
        switch (format.encoderId) {
            case EncoderId::JPEG:
                params = {cv::IMWRITE_JPEG_QUALITY, quality, cv::IMWRITE_JPEG_OPTIMIZE, 1};
                break;
            case EncoderId::PNG:
                params = {cv::IMWRITE_PNG_COMPRESSION, PNG_MAX_COMPRESSION};
                break;
            case EncoderId::WEBP:
                params = {cv::IMWRITE_WEBP_QUALITY, quality};
                break;
            case EncoderId::TIFF:
                params = {cv::IMWRITE_TIFF_COMPRESSION, TIFF_COMPRESSION_LZW};
                break;
            default:
                break;
        }

        if (!cv::imencode(encoderExtension(format.encoderId), image.pixels(), bytes, params) || bytes.empty()) {
            throw ConversionError(ErrorKind::EncodeError,
                                  std::string("Encoder ") + encoderName(format.encoderId) + " failed");
        }
        return bytes;
    }

    void ImageConverter::writeOutput(const fs::path& outputPath, const std::vector<uint8_t>& bytes) const
    {
        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw ConversionError(ErrorKind::EncodeError, "Cannot open output file: " + outputPath.string());
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.close();
        if (file.fail()) {
            throw ConversionError(ErrorKind::EncodeError, "Failed to write output file: " + outputPath.string());
        }
    }

    std::optional<ImageInfo> ImageConverter::imageInfo(const fs::path& path) const
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return std::nullopt;
        }

        std::vector<uint8_t> bytes;
        if (!ImageProbe::readFileBytes(path, bytes)) {
            m_logger.warning("Cannot read " + path.string());
            return std::nullopt;
        }

        ImageInfo info;
        info.name = path.filename().string();
        info.format = ImageProbe::detectFormat(bytes);
        info.fileSize = bytes.size();
        info.hasExif = ImageProbe::hasExif(bytes);

        try {
            const ImageBuffer image = ImageBuffer::decode(path);
            info.mode = pixelModeName(image.mode());
            info.width = image.width();
            info.height = image.height();
            info.hasTransparency = image.hasAlpha() || ImageProbe::hasPaletteTransparency(bytes);
        } catch (const ConversionError& e) {
            m_logger.warning("Error getting image info for " + info.name + ": " + e.what());
            return std::nullopt;
        } catch (const cv::Exception& e) {
            m_logger.warning("Error getting image info for " + info.name + ": " + e.what());
            return std::nullopt;
        }
        return info;
    }

} // namespace ConverterPro
