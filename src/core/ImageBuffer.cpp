#include "ImageBuffer.h"
#include "IcoCodec.h"
#include "ImageProbe.h"

#include <cmath>
#include <utility>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace ConverterPro
{
    const char* pixelModeName(PixelMode mode)
    {
        switch (mode) {
            case PixelMode::Grayscale: return "L";
            case PixelMode::GrayscaleAlpha: return "LA";
            case PixelMode::RGB: return "RGB";
            case PixelMode::RGBA: return "RGBA";
            case PixelMode::Palette: return "P";
        }
        return "RGB";
    }

    namespace
    {
        double maxSampleValue(int depth)
        {
            switch (depth) {
                case CV_8U: return 255.0;
                case CV_16U: return 65535.0;
                case CV_32F:
                case CV_64F: return 1.0;
                default: return 255.0;
            }
        }
    } // namespace

    ImageBuffer::ImageBuffer(cv::Mat pixels, PixelMode mode, int orientation)
        : m_pixels(std::move(pixels)), m_mode(mode), m_orientation(orientation)
    {
    }

    ImageBuffer ImageBuffer::decode(const fs::path& path)
    {
        std::vector<uint8_t> bytes;
        if (!ImageProbe::readFileBytes(path, bytes) || bytes.empty()) {
            throw ConversionError(ErrorKind::DecodeError, "Cannot read file: " + path.string());
        }

        cv::Mat pixels;
        if (ImageProbe::detectFormat(bytes) == "ico") {
            pixels = IcoCodec::decode(bytes);
        } else {
            pixels = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
        }
        if (pixels.empty()) {
            throw ConversionError(ErrorKind::DecodeError, "Cannot decode image: " + path.string());
        }

        PixelMode mode;
        const bool palette = ImageProbe::isPaletteImage(bytes);
        switch (pixels.channels()) {
            case 1:
                mode = palette ? PixelMode::Palette : PixelMode::Grayscale;
                break;
            case 2:
                mode = PixelMode::GrayscaleAlpha;
                break;
            case 3:
                mode = palette ? PixelMode::Palette : PixelMode::RGB;
                break;
            default:
                if (palette) {
                    mode = PixelMode::Palette;
                } else if (ImageProbe::isGrayAlphaImage(bytes)) {
                    mode = PixelMode::GrayscaleAlpha;
                } else {
                    mode = PixelMode::RGBA;
                }
                break;
        }

        return ImageBuffer(pixels, mode, ImageProbe::readOrientation(bytes));
    }

    bool ImageBuffer::hasAlpha() const
    {
        return m_pixels.channels() == 2 || m_pixels.channels() == 4;
    }

    void ImageBuffer::toEightBit()
    {
        if (m_pixels.empty() || m_pixels.depth() == CV_8U) {
            return;
        }
        cv::Mat converted;
        switch (m_pixels.depth()) {
            case CV_16U:
                m_pixels.convertTo(converted, CV_8U, 1.0 / 257.0);
                break;
            case CV_32F:
            case CV_64F:
                m_pixels.convertTo(converted, CV_8U, 255.0);
                break;
            default:
                m_pixels.convertTo(converted, CV_8U);
                break;
        }
        m_pixels = converted;
    }

    bool ImageBuffer::flattenTransparency(const cv::Scalar& background)
    {
        if (!hasAlpha()) {
            return false;
        }

        const int depth = m_pixels.depth();
        const double maxValue = maxSampleValue(depth);

        std::vector<cv::Mat> channels;
        cv::split(m_pixels, channels);

        cv::Mat alpha;
        channels.back().convertTo(alpha, CV_32F, 1.0 / maxValue);
        channels.pop_back();
        if (channels.size() == 1) {
            channels = {channels[0], channels[0], channels[0]};
        }

        // Blend: dst = src * alpha + bg * (1 - alpha)
        std::vector<cv::Mat> blended(3);
        for (int i = 0; i < 3; ++i) {
            cv::Mat src;
            channels[i].convertTo(src, CV_32F);
            const double bg = background[i] / 255.0 * maxValue;
            cv::Mat res = src.mul(alpha) + (1.0 - alpha) * bg;
            res.convertTo(blended[i], depth);
        }

        cv::merge(blended, m_pixels);
        m_mode = PixelMode::RGB;
        return true;
    }

    void ImageBuffer::applyOrientation()
    {
        if (m_pixels.empty() || m_orientation <= 1 || m_orientation > 8) {
            m_orientation = 1;
            return;
        }

        cv::Mat out;
        switch (m_orientation) {
            case 2: // mirrored horizontally
                cv::flip(m_pixels, out, 1);
                break;
            case 3:
                cv::rotate(m_pixels, out, cv::ROTATE_180);
                break;
            case 4: // mirrored vertically
                cv::flip(m_pixels, out, 0);
                break;
            case 5: // transpose
                cv::transpose(m_pixels, out);
                break;
            case 6:
                cv::rotate(m_pixels, out, cv::ROTATE_90_CLOCKWISE);
                break;
            case 7: // transverse
                cv::transpose(m_pixels, out);
                cv::rotate(out, out, cv::ROTATE_180);
                break;
            case 8:
                cv::rotate(m_pixels, out, cv::ROTATE_90_COUNTERCLOCKWISE);
                break;
        }
        m_pixels = out;
        m_orientation = 1;
    }

    cv::Size ImageBuffer::fitWithin(const cv::Size& source, const cv::Size& box)
    {
        if (source.width <= 0 || source.height <= 0 || box.width <= 0 || box.height <= 0) {
            return source;
        }
        const double scale = std::min(static_cast<double>(box.width) / source.width,
                                      static_cast<double>(box.height) / source.height);
        const int width = static_cast<int>(std::lround(source.width * scale));
        const int height = static_cast<int>(std::lround(source.height * scale));
        return cv::Size(std::max(1, width), std::max(1, height));
    }

    void ImageBuffer::resizeToFit(const cv::Size& box)
    {
        if (m_pixels.empty()) {
            return;
        }
        const cv::Size target = fitWithin(m_pixels.size(), box);
        if (target == m_pixels.size()) {
            return;
        }
        const bool shrinking = target.width < m_pixels.cols || target.height < m_pixels.rows;
        cv::Mat resized;
        cv::resize(m_pixels, resized, target, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
        m_pixels = resized;
    }

    void ImageBuffer::toColor()
    {
        switch (m_pixels.channels()) {
            case 1:
                cv::cvtColor(m_pixels, m_pixels, cv::COLOR_GRAY2BGR);
                break;
            case 2: {
                std::vector<cv::Mat> channels;
                cv::split(m_pixels, channels);
                cv::merge(std::vector<cv::Mat>{channels[0], channels[0], channels[0]}, m_pixels);
                break;
            }
            case 4:
                cv::cvtColor(m_pixels, m_pixels, cv::COLOR_BGRA2BGR);
                break;
            default:
                break;
        }
        m_mode = PixelMode::RGB;
    }

    void ImageBuffer::expandGrayAlpha()
    {
        if (m_pixels.channels() != 2) {
            return;
        }
        std::vector<cv::Mat> channels;
        cv::split(m_pixels, channels);
        cv::merge(std::vector<cv::Mat>{channels[0], channels[0], channels[0], channels[1]}, m_pixels);
        m_mode = PixelMode::RGBA;
    }

    void ImageBuffer::release()
    {
        m_pixels.release();
    }

} // namespace ConverterPro
