#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include <opencv2/core.hpp>

namespace ConverterPro
{
    /**
     * @brief Reader/writer for Windows icon (.ico) containers.
     *
     * OpenCV has no ICO codec. Icons are written as a single PNG-compressed
     * entry (valid since Windows Vista); reading accepts PNG entries and
     * uncompressed 24/32-bit DIB entries.
     */
    class IcoCodec
    {
    public:
        /**
         * @brief Encodes an 8-bit image (1, 3 or 4 channels, at most 256x256).
         * @return The container bytes, or an empty vector if encoding failed.
         */
        static std::vector<uint8_t> encode(const cv::Mat& image);

        /**
         * @brief Encodes and writes an icon file.
         * @return true on success.
         */
        static bool write(const std::filesystem::path& path, const cv::Mat& image);

        /**
         * @brief Decodes the largest entry of an icon container.
         * @return BGRA image, or an empty Mat if the data is not a usable icon.
         */
        static cv::Mat decode(const std::vector<uint8_t>& bytes);

        static cv::Mat read(const std::filesystem::path& path);

    private:
        static cv::Mat decodeDib(const uint8_t* data, size_t size);
    };

} // namespace ConverterPro
