#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ConverterPro
{
    /**
     * @brief Header-level inspection of image files: format sniffing, MIME
     * types, palette detection and EXIF orientation.
     *
     * Nothing here decodes pixels; all functions work on the raw bytes.
     */
    class ImageProbe
    {
    public:
        /**
         * @brief Detects the container format from the file's magic bytes.
         * @return "png", "jpeg", "gif", "bmp", "tiff", "webp", "ico", "avif",
         *         "pnm", or "" when unknown or unreadable.
         */
        static std::string detectFormat(const std::filesystem::path& path);
        static std::string detectFormat(const std::vector<uint8_t>& bytes);

        /**
         * @brief Best-effort MIME type of a file, from its content.
         * @return e.g. "image/png", or "" when the content is not recognized.
         */
        static std::string guessMimeType(const std::filesystem::path& path);

        /**
         * @brief MIME type of a format name as returned by detectFormat().
         */
        static std::string mimeTypeForFormat(const std::string& format);

        /**
         * @brief True if the file stores palette-indexed pixels (PNG color
         * type 3, GIF, BMP with 8 bits per pixel or less).
         */
        static bool isPaletteImage(const std::vector<uint8_t>& bytes);

        /**
         * @brief True for PNG files declared as grayscale+alpha.
         */
        static bool isGrayAlphaImage(const std::vector<uint8_t>& bytes);

        /**
         * @brief True if a palette image declares a transparent index
         * (PNG tRNS chunk, GIF graphic control extension).
         */
        static bool hasPaletteTransparency(const std::vector<uint8_t>& bytes);

        /**
         * @brief EXIF orientation (1-8) stored in a JPEG APP1 segment, TIFF
         * IFD0, PNG eXIf chunk or WebP EXIF chunk; 1 when absent.
         */
        static int readOrientation(const std::vector<uint8_t>& bytes);

        /**
         * @brief True if the file carries an EXIF block. For TIFF, IFD0 must
         * hold an orientation, Exif IFD or GPS IFD tag.
         */
        static bool hasExif(const std::vector<uint8_t>& bytes);

        /**
         * @brief Orientation tag of a TIFF structure ("II*\0" / "MM\0*").
         * @return 1-8, or 0 if the structure has no orientation tag.
         */
        static int parseTiffOrientation(const uint8_t* data, size_t size);

        /**
         * @brief Reads a whole file into memory.
         * @return false if the file cannot be read.
         */
        static bool readFileBytes(const std::filesystem::path& path, std::vector<uint8_t>& out);

    private:
        static bool findExifBlock(const std::vector<uint8_t>& bytes, size_t& offset, size_t& length);
    };

} // namespace ConverterPro
