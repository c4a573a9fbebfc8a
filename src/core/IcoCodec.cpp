#include "IcoCodec.h"
#include "ImageProbe.h"
#include "utils/Definitions.h"

#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace ConverterPro
{
    namespace
    {
        constexpr size_t ICONDIR_SIZE = 6;
        constexpr size_t ICONDIRENTRY_SIZE = 16;

        void putU16(std::vector<uint8_t>& out, uint16_t v)
        {
            out.push_back(static_cast<uint8_t>(v & 0xFF));
            out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        }

        void putU32(std::vector<uint8_t>& out, uint32_t v)
        {
            for (int i = 0; i < 4; ++i) {
                out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
            }
        }

        uint16_t getU16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

        uint32_t getU32(const uint8_t* p)
        {
            return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                   (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
        }

        // Width/height bytes of ICONDIRENTRY use 0 for 256.
        int entryDimension(uint8_t v) { return v == 0 ? 256 : v; }
    } // namespace

    std::vector<uint8_t> IcoCodec::encode(const cv::Mat& image)
    {
        const int maxSide = Definitions::ICO_MAX_DIMENSION;
        if (image.empty() || image.depth() != CV_8U || image.cols > maxSide || image.rows > maxSide) {
            return {};
        }

        std::vector<uint8_t> png;
        if (!cv::imencode(".png", image, png)) {
            return {};
        }

        std::vector<uint8_t> out;
        out.reserve(ICONDIR_SIZE + ICONDIRENTRY_SIZE + png.size());

        // ICONDIR
        putU16(out, 0);     // reserved
        putU16(out, 1);     // type: icon
        putU16(out, 1);     // image count

        // ICONDIRENTRY
        out.push_back(static_cast<uint8_t>(image.cols >= 256 ? 0 : image.cols));
        out.push_back(static_cast<uint8_t>(image.rows >= 256 ? 0 : image.rows));
        out.push_back(0);   // palette size
        out.push_back(0);   // reserved
        putU16(out, 1);     // color planes
        putU16(out, 32);    // bits per pixel
        putU32(out, static_cast<uint32_t>(png.size()));
        putU32(out, static_cast<uint32_t>(ICONDIR_SIZE + ICONDIRENTRY_SIZE));

        out.insert(out.end(), png.begin(), png.end());
        return out;
    }

    bool IcoCodec::write(const fs::path& path, const cv::Mat& image)
    {
        const std::vector<uint8_t> bytes = encode(image);
        if (bytes.empty()) {
            return false;
        }
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.close();
        return !file.fail();
    }

    cv::Mat IcoCodec::read(const fs::path& path)
    {
        std::vector<uint8_t> bytes;
        if (!ImageProbe::readFileBytes(path, bytes)) {
            return cv::Mat();
        }
        return decode(bytes);
    }

    cv::Mat IcoCodec::decode(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() < ICONDIR_SIZE || getU16(bytes.data()) != 0 || getU16(bytes.data() + 2) != 1) {
            return cv::Mat();
        }
        const uint16_t count = getU16(bytes.data() + 4);
        if (count == 0 || bytes.size() < ICONDIR_SIZE + static_cast<size_t>(count) * ICONDIRENTRY_SIZE) {
            return cv::Mat();
        }

        // Pick the largest entry, then the deepest one
        size_t best = 0;
        long bestArea = -1;
        int bestBits = -1;
        for (uint16_t i = 0; i < count; ++i) {
            const uint8_t* entry = bytes.data() + ICONDIR_SIZE + static_cast<size_t>(i) * ICONDIRENTRY_SIZE;
            const long area = static_cast<long>(entryDimension(entry[0])) * entryDimension(entry[1]);
            const int bits = getU16(entry + 6);
            if (area > bestArea || (area == bestArea && bits > bestBits)) {
                best = i;
                bestArea = area;
                bestBits = bits;
            }
        }

        const uint8_t* entry = bytes.data() + ICONDIR_SIZE + best * ICONDIRENTRY_SIZE;
        const uint32_t size = getU32(entry + 8);
        const uint32_t offset = getU32(entry + 12);
        if (static_cast<size_t>(offset) + size > bytes.size() || size < 8) {
            return cv::Mat();
        }

        const std::vector<uint8_t> payload(bytes.begin() + offset, bytes.begin() + offset + size);
        if (ImageProbe::detectFormat(payload) == "png") {
            cv::Mat img = cv::imdecode(payload, cv::IMREAD_UNCHANGED);
            if (!img.empty() && img.channels() == 3) {
                cv::cvtColor(img, img, cv::COLOR_BGR2BGRA);
            } else if (!img.empty() && img.channels() == 1) {
                cv::cvtColor(img, img, cv::COLOR_GRAY2BGRA);
            }
            return img;
        }
        return decodeDib(payload.data(), payload.size());
    }

    cv::Mat IcoCodec::decodeDib(const uint8_t* data, size_t size)
    {
        if (size < 40) {
            return cv::Mat();
        }
        const uint32_t headerSize = getU32(data);
        const int width = static_cast<int>(getU32(data + 4));
        const int height = static_cast<int>(getU32(data + 8)) / 2; // XOR + AND masks
        const int bitCount = getU16(data + 14);
        const uint32_t compression = getU32(data + 16);
        if (headerSize < 40 || width <= 0 || height <= 0 || compression != 0 ||
            (bitCount != 24 && bitCount != 32)) {
            return cv::Mat();
        }

        const size_t bytesPerPixel = static_cast<size_t>(bitCount) / 8;
        const size_t xorStride = ((static_cast<size_t>(width) * bitCount + 31) / 32) * 4;
        const size_t andStride = ((static_cast<size_t>(width) + 31) / 32) * 4;
        const size_t xorOffset = headerSize;
        const size_t andOffset = xorOffset + xorStride * static_cast<size_t>(height);
        if (andOffset > size) {
            return cv::Mat();
        }
        const bool hasMask = andOffset + andStride * static_cast<size_t>(height) <= size;

        cv::Mat out(height, width, CV_8UC4, cv::Scalar(0, 0, 0, 255));
        bool anyAlpha = false;
        for (int y = 0; y < height; ++y) {
            // DIB rows are stored bottom-up
            const uint8_t* src = data + xorOffset + xorStride * static_cast<size_t>(height - 1 - y);
            cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
            for (int x = 0; x < width; ++x) {
                const uint8_t* px = src + static_cast<size_t>(x) * bytesPerPixel;
                const uint8_t alpha = bitCount == 32 ? px[3] : 255;
                anyAlpha = anyAlpha || (bitCount == 32 && alpha != 0);
                dst[x] = cv::Vec4b(px[0], px[1], px[2], alpha);
            }
        }

        // A 32-bit icon with an all-zero alpha plane relies on the AND mask
        const bool useMask = hasMask && (bitCount == 24 || !anyAlpha);
        if (useMask) {
            for (int y = 0; y < height; ++y) {
                const uint8_t* mask = data + andOffset + andStride * static_cast<size_t>(height - 1 - y);
                cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
                for (int x = 0; x < width; ++x) {
                    const bool transparent = (mask[x / 8] >> (7 - (x % 8))) & 0x01;
                    dst[x][3] = transparent ? 0 : 255;
                }
            }
        }
        return out;
    }

} // namespace ConverterPro
