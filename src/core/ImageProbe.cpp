#include "ImageProbe.h"

#include <cstring>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace ConverterPro
{
    namespace
    {
        constexpr uint16_t TAG_ORIENTATION = 0x0112;
        constexpr uint16_t TAG_EXIF_IFD = 0x8769;
        constexpr uint16_t TAG_GPS_IFD = 0x8825;
        constexpr uint16_t TYPE_SHORT = 3;
        const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
        const char EXIF_HEADER[6] = {'E', 'x', 'i', 'f', '\0', '\0'};

        uint16_t readU16(const uint8_t* p, bool littleEndian)
        {
            return littleEndian ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                                : static_cast<uint16_t>((p[0] << 8) | p[1]);
        }

        uint32_t readU32(const uint8_t* p, bool littleEndian)
        {
            if (littleEndian) {
                return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                       (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
            }
            return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                   (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        }

        bool startsWith(const std::vector<uint8_t>& bytes, size_t offset, const void* magic, size_t len)
        {
            return bytes.size() >= offset + len && std::memcmp(bytes.data() + offset, magic, len) == 0;
        }

        bool isPng(const std::vector<uint8_t>& bytes)
        {
            return startsWith(bytes, 0, PNG_SIGNATURE, sizeof(PNG_SIGNATURE));
        }

        // Skips an optional "Exif\0\0" prefix in front of a TIFF structure.
        void skipExifHeader(const std::vector<uint8_t>& bytes, size_t& offset, size_t& length)
        {
            if (length >= sizeof(EXIF_HEADER) && startsWith(bytes, offset, EXIF_HEADER, sizeof(EXIF_HEADER))) {
                offset += sizeof(EXIF_HEADER);
                length -= sizeof(EXIF_HEADER);
            }
        }

        // Calls visit(type, dataOffset, dataLength) for each PNG chunk until it returns false.
        template <typename Visitor>
        void forEachPngChunk(const std::vector<uint8_t>& bytes, Visitor visit)
        {
            size_t pos = sizeof(PNG_SIGNATURE);
            while (pos + 8 <= bytes.size()) {
                const uint32_t length = readU32(bytes.data() + pos, false);
                const std::string type(reinterpret_cast<const char*>(bytes.data() + pos + 4), 4);
                const size_t dataOffset = pos + 8;
                if (dataOffset + length > bytes.size()) {
                    return;
                }
                if (!visit(type, dataOffset, static_cast<size_t>(length))) {
                    return;
                }
                pos = dataOffset + length + 4; // skip CRC
            }
        }

        // Byte order and IFD0 offset of a TIFF header; false if it is not one
        bool locateIfd0(const uint8_t* data, size_t size, bool& littleEndian, uint32_t& ifdOffset)
        {
            if (size < 8) {
                return false;
            }
            if (data[0] == 'I' && data[1] == 'I') {
                littleEndian = true;
            } else if (data[0] == 'M' && data[1] == 'M') {
                littleEndian = false;
            } else {
                return false;
            }
            if (readU16(data + 2, littleEndian) != 42) {
                return false;
            }
            ifdOffset = readU32(data + 4, littleEndian);
            return ifdOffset >= 8 && static_cast<size_t>(ifdOffset) + 2 <= size;
        }

        // Orientation, Exif IFD pointer or GPS IFD pointer in IFD0
        bool hasTiffExifTags(const uint8_t* data, size_t size)
        {
            bool littleEndian = false;
            uint32_t ifdOffset = 0;
            if (!locateIfd0(data, size, littleEndian, ifdOffset)) {
                return false;
            }
            const uint16_t entryCount = readU16(data + ifdOffset, littleEndian);
            for (uint16_t i = 0; i < entryCount; ++i) {
                const size_t entry = static_cast<size_t>(ifdOffset) + 2 + static_cast<size_t>(i) * 12;
                if (entry + 12 > size) {
                    return false;
                }
                const uint16_t tag = readU16(data + entry, littleEndian);
                if (tag == TAG_ORIENTATION || tag == TAG_EXIF_IFD || tag == TAG_GPS_IFD) {
                    return true;
                }
            }
            return false;
        }

    } // namespace

    bool ImageProbe::readFileBytes(const fs::path& path, std::vector<uint8_t>& out)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return !file.bad();
    }

    std::string ImageProbe::detectFormat(const fs::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return "";
        }
        std::vector<uint8_t> header(32, 0);
        file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
        header.resize(static_cast<size_t>(file.gcount()));
        return detectFormat(header);
    }

    std::string ImageProbe::detectFormat(const std::vector<uint8_t>& bytes)
    {
        if (isPng(bytes)) return "png";
        if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) return "jpeg";
        if (startsWith(bytes, 0, "GIF87a", 6) || startsWith(bytes, 0, "GIF89a", 6)) return "gif";
        if (startsWith(bytes, 0, "BM", 2)) return "bmp";
        if (startsWith(bytes, 0, "II*\0", 4) || startsWith(bytes, 0, "MM\0*", 4)) return "tiff";
        if (startsWith(bytes, 0, "RIFF", 4) && startsWith(bytes, 8, "WEBP", 4)) return "webp";
        if (bytes.size() >= 6 && bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 1 && bytes[3] == 0) return "ico";
        if (startsWith(bytes, 4, "ftyp", 4) && (startsWith(bytes, 8, "avif", 4) || startsWith(bytes, 8, "avis", 4))) {
            return "avif";
        }
        if (bytes.size() >= 3 && bytes[0] == 'P' && bytes[1] >= '1' && bytes[1] <= '6' &&
            (bytes[2] == '\n' || bytes[2] == '\r' || bytes[2] == ' ' || bytes[2] == '\t')) {
            return "pnm";
        }
        return "";
    }

    std::string ImageProbe::mimeTypeForFormat(const std::string& format)
    {
        if (format == "png") return "image/png";
        if (format == "jpeg" || format == "jpg") return "image/jpeg";
        if (format == "gif") return "image/gif";
        if (format == "bmp") return "image/bmp";
        if (format == "tiff" || format == "tif") return "image/tiff";
        if (format == "webp") return "image/webp";
        if (format == "ico") return "image/x-icon";
        if (format == "avif") return "image/avif";
        if (format == "pnm" || format == "ppm") return "image/x-portable-pixmap";
        if (format == "pgm") return "image/x-portable-graymap";
        if (format == "pbm") return "image/x-portable-bitmap";
        return "";
    }

    std::string ImageProbe::guessMimeType(const fs::path& path)
    {
        return mimeTypeForFormat(detectFormat(path));
    }

    bool ImageProbe::isPaletteImage(const std::vector<uint8_t>& bytes)
    {
        const std::string format = detectFormat(bytes);
        if (format == "png") {
            // IHDR data starts at 16; color type is its 10th byte
            return bytes.size() > 25 && bytes[25] == 3;
        }
        if (format == "gif") {
            return true;
        }
        if (format == "bmp") {
            // BITMAPINFOHEADER biBitCount
            return bytes.size() > 29 && readU16(bytes.data() + 28, true) <= 8;
        }
        return false;
    }

    bool ImageProbe::isGrayAlphaImage(const std::vector<uint8_t>& bytes)
    {
        return isPng(bytes) && bytes.size() > 25 && bytes[25] == 4;
    }

    bool ImageProbe::hasPaletteTransparency(const std::vector<uint8_t>& bytes)
    {
        const std::string format = detectFormat(bytes);
        if (format == "png") {
            bool found = false;
            forEachPngChunk(bytes, [&](const std::string& type, size_t, size_t) {
                if (type == "tRNS") {
                    found = true;
                    return false;
                }
                return type != "IDAT";
            });
            return found;
        }
        if (format == "gif") {
            // Graphic control extension: 0x21 0xF9 0x04 <packed>, bit 0 = transparent index present
            for (size_t i = 13; i + 3 < bytes.size(); ++i) {
                if (bytes[i] == 0x21 && bytes[i + 1] == 0xF9 && bytes[i + 2] == 0x04) {
                    if (bytes[i + 3] & 0x01) {
                        return true;
                    }
                }
            }
        }
        return false;
    }

    int ImageProbe::parseTiffOrientation(const uint8_t* data, size_t size)
    {
        bool littleEndian = false;
        uint32_t ifdOffset = 0;
        if (!locateIfd0(data, size, littleEndian, ifdOffset)) {
            return 0;
        }
        const uint16_t entryCount = readU16(data + ifdOffset, littleEndian);
        for (uint16_t i = 0; i < entryCount; ++i) {
            const size_t entry = static_cast<size_t>(ifdOffset) + 2 + static_cast<size_t>(i) * 12;
            if (entry + 12 > size) {
                return 0;
            }
            const uint16_t tag = readU16(data + entry, littleEndian);
            if (tag != TAG_ORIENTATION) {
                continue;
            }
            const uint16_t type = readU16(data + entry + 2, littleEndian);
            if (type != TYPE_SHORT) {
                return 0;
            }
            const uint16_t value = readU16(data + entry + 8, littleEndian);
            return (value >= 1 && value <= 8) ? value : 0;
        }
        return 0;
    }

    bool ImageProbe::findExifBlock(const std::vector<uint8_t>& bytes, size_t& offset, size_t& length)
    {
        const std::string format = detectFormat(bytes);

        if (format == "tiff") {
            offset = 0;
            length = bytes.size();
            return true;
        }

        if (format == "jpeg") {
            size_t pos = 2;
            while (pos + 4 <= bytes.size()) {
                if (bytes[pos] != 0xFF) {
                    return false;
                }
                uint8_t marker = bytes[pos + 1];
                if (marker == 0xFF) { // fill byte
                    ++pos;
                    continue;
                }
                if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
                    pos += 2;
                    continue;
                }
                if (marker == 0xD9 || marker == 0xDA) { // EOI / start of scan
                    return false;
                }
                const size_t segmentLength = readU16(bytes.data() + pos + 2, false);
                if (segmentLength < 2 || pos + 2 + segmentLength > bytes.size()) {
                    return false;
                }
                if (marker == 0xE1 && segmentLength >= 2 + sizeof(EXIF_HEADER) &&
                    startsWith(bytes, pos + 4, EXIF_HEADER, sizeof(EXIF_HEADER))) {
                    offset = pos + 4 + sizeof(EXIF_HEADER);
                    length = segmentLength - 2 - sizeof(EXIF_HEADER);
                    return true;
                }
                pos += 2 + segmentLength;
            }
            return false;
        }

        if (format == "png") {
            bool found = false;
            forEachPngChunk(bytes, [&](const std::string& type, size_t dataOffset, size_t dataLength) {
                if (type == "eXIf") {
                    offset = dataOffset;
                    length = dataLength;
                    skipExifHeader(bytes, offset, length);
                    found = true;
                    return false;
                }
                return type != "IEND";
            });
            return found;
        }

        if (format == "webp") {
            size_t pos = 12;
            while (pos + 8 <= bytes.size()) {
                const uint32_t chunkSize = readU32(bytes.data() + pos + 4, true);
                const size_t dataOffset = pos + 8;
                if (dataOffset + chunkSize > bytes.size()) {
                    return false;
                }
                if (startsWith(bytes, pos, "EXIF", 4)) {
                    offset = dataOffset;
                    length = chunkSize;
                    skipExifHeader(bytes, offset, length);
                    return true;
                }
                pos = dataOffset + chunkSize + (chunkSize & 1u);
            }
        }
        return false;
    }

    int ImageProbe::readOrientation(const std::vector<uint8_t>& bytes)
    {
        size_t offset = 0;
        size_t length = 0;
        if (!findExifBlock(bytes, offset, length)) {
            return 1;
        }
        const int orientation = parseTiffOrientation(bytes.data() + offset, length);
        return orientation == 0 ? 1 : orientation;
    }

    bool ImageProbe::hasExif(const std::vector<uint8_t>& bytes)
    {
        if (detectFormat(bytes) == "tiff") {
            return hasTiffExifTags(bytes.data(), bytes.size());
        }
        size_t offset = 0;
        size_t length = 0;
        return findExifBlock(bytes, offset, length);
    }

} // namespace ConverterPro
