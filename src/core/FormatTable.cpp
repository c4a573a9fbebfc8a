#include "FormatTable.h"
#include "Common.h"

namespace ConverterPro
{
    const char* encoderName(EncoderId id)
    {
        switch (id) {
            case EncoderId::PNG: return "PNG";
            case EncoderId::JPEG: return "JPEG";
            case EncoderId::WEBP: return "WEBP";
            case EncoderId::TIFF: return "TIFF";
            case EncoderId::BMP: return "BMP";
            case EncoderId::GIF: return "GIF";
            case EncoderId::ICO: return "ICO";
        }
        return "UNKNOWN";
    }

    FormatTable::FormatTable()
    {
        const std::vector<CapabilityEntry> entries = {
            // name    encoder            alpha  quality  16-bit  compression                mime
            {"png",  EncoderId::PNG,  true,  false, true,  "lossless, optimize",        "image/png"},
            {"jpeg", EncoderId::JPEG, false, true,  false, "optimized huffman",         "image/jpeg"},
            {"jpg",  EncoderId::JPEG, false, true,  false, "optimized huffman",         "image/jpeg"},
            {"webp", EncoderId::WEBP, true,  true,  false, "method 6",                  "image/webp"},
            {"tiff", EncoderId::TIFF, false, false, true,  "lzw",                       "image/tiff"},
            {"bmp",  EncoderId::BMP,  false, false, false, "none",                      "image/bmp"},
            {"gif",  EncoderId::GIF,  true,  false, false, "lzw",                       "image/gif"},
            {"ico",  EncoderId::ICO,  true,  false, false, "png-compressed entry",      "image/x-icon"},
        };

        for (const auto& entry : entries) {
            m_order.push_back(entry.name);
            m_entries.emplace(entry.name, entry);
        }
    }

    const FormatTable& FormatTable::instance()
    {
        static const FormatTable table;
        return table;
    }

    std::string FormatTable::normalize(const std::string& name)
    {
        std::string key = to_lower(name);
        if (!key.empty() && key.front() == '.') {
            key.erase(0, 1);
        }
        return key;
    }

    std::optional<CapabilityEntry> FormatTable::lookup(const std::string& name) const
    {
        auto it = m_entries.find(normalize(name));
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool FormatTable::contains(const std::string& name) const
    {
        return m_entries.count(normalize(name)) > 0;
    }

} // namespace ConverterPro
