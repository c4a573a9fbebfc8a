#pragma once

#include "Common.h"

#include <opencv2/core.hpp>

namespace ConverterPro
{
    /**
     * @brief Channel layout of a decoded image.
     *
     * Palette images are expanded by the codec; a palette image with a
     * transparent index reaches the pipeline as 4-channel data in Palette mode.
     */
    enum class PixelMode
    {
        Grayscale,
        GrayscaleAlpha,
        RGB,
        RGBA,
        Palette
    };

    const char* pixelModeName(PixelMode mode);

    /**
     * @brief Decoded raster owned by one conversion.
     *
     * Pixels are kept in OpenCV order (BGR / BGRA). The buffer is a value
     * type; its memory is released when it goes out of scope.
     */
    class ImageBuffer
    {
    public:
        ImageBuffer() = default;
        ImageBuffer(cv::Mat pixels, PixelMode mode, int orientation = 1);

        /**
         * @brief Decodes an image file (OpenCV codecs, ICO through IcoCodec).
         * @throws ConversionError with ErrorKind::DecodeError.
         */
        static ImageBuffer decode(const fs::path& path);

        int width() const { return m_pixels.cols; }
        int height() const { return m_pixels.rows; }
        int channels() const { return m_pixels.channels(); }
        int depth() const { return m_pixels.depth(); }
        bool empty() const { return m_pixels.empty(); }
        PixelMode mode() const { return m_mode; }
        int orientation() const { return m_orientation; }

        /**
         * @brief True if the pixels carry an alpha channel (including an
         * expanded palette transparency).
         */
        bool hasAlpha() const;

        const cv::Mat& pixels() const { return m_pixels; }

        /**
         * @brief Scales 16-bit and floating point samples down to 8 bit.
         */
        void toEightBit();

        /**
         * @brief Composites the image onto an opaque background using the
         * alpha channel as blend mask; the result is 3-channel RGB.
         * @return false if there was no alpha channel (buffer unchanged).
         */
        bool flattenTransparency(const cv::Scalar& background = cv::Scalar(255, 255, 255));

        /**
         * @brief Rotates/flips the pixels according to the EXIF orientation
         * and resets the orientation to 1 (upright).
         */
        void applyOrientation();

        /**
         * @brief Best-fit dimensions of @p source inside @p box, aspect ratio
         * preserved; enlarges when the box is bigger than the source.
         */
        static cv::Size fitWithin(const cv::Size& source, const cv::Size& box);

        /**
         * @brief Resizes to fitWithin(size, box) with area averaging when
         * shrinking and Lanczos when enlarging.
         */
        void resizeToFit(const cv::Size& box);

        /**
         * @brief Converts grayscale or alpha layouts to 3-channel color.
         */
        void toColor();

        /**
         * @brief Grayscale+alpha to 4-channel color with the same alpha.
         */
        void expandGrayAlpha();

        void release();

    private:
        cv::Mat m_pixels;
        PixelMode m_mode = PixelMode::RGB;
        int m_orientation = 1;
    };

} // namespace ConverterPro
