#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ConverterPro
{
    /**
     * @brief Codec used to write an output format.
     */
    enum class EncoderId
    {
        PNG,
        JPEG,
        WEBP,
        TIFF,
        BMP,
        GIF,
        ICO
    };

    const char* encoderName(EncoderId id);

    /**
     * @brief Static description of what an output format supports.
     */
    struct CapabilityEntry
    {
        std::string name;                 // lower-case key, also the output extension
        EncoderId encoderId;
        bool supportsTransparency;
        bool supportsQualityParam;
        bool supportsHighBitDepth;        // 16-bit samples can be written as-is
        std::string defaultCompression;   // codec-specific hint
        std::string mimeType;
    };

    /**
     * @brief Read-only mapping from output format name to its capability entry.
     *
     * Entries are fixed when the table is built; the table has no mutation API
     * and can be shared between threads.
     */
    class FormatTable
    {
    public:
        /**
         * @brief The process-wide table of supported output formats.
         */
        static const FormatTable& instance();

        /**
         * @brief Finds a format by name ("PNG", "jpeg", ".webp" ...).
         * @return The entry, or std::nullopt if the format is not supported.
         */
        std::optional<CapabilityEntry> lookup(const std::string& name) const;

        bool contains(const std::string& name) const;

        /**
         * @brief Supported names in display order.
         */
        const std::vector<std::string>& names() const { return m_order; }

    private:
        FormatTable();

        static std::string normalize(const std::string& name);

        std::map<std::string, CapabilityEntry> m_entries;
        std::vector<std::string> m_order;
    };

} // namespace ConverterPro
