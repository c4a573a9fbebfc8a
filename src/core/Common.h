#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for Image Converter Pro.
 */
namespace ConverterPro
{
    /**
     * @brief Failure categories of a single-file conversion.
     */
    enum class ErrorKind
    {
        None,
        InputNotFound,
        UnsupportedInputFormat,
        UnsupportedOutputFormat,
        InvalidSettings,
        DecodeError,
        EncodeError,
        IOError,
        Cancelled
    };

    /**
     * @brief Stable, human-readable name of an error kind.
     */
    inline const char* errorKindName(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::None: return "None";
            case ErrorKind::InputNotFound: return "InputNotFound";
            case ErrorKind::UnsupportedInputFormat: return "UnsupportedInputFormat";
            case ErrorKind::UnsupportedOutputFormat: return "UnsupportedOutputFormat";
            case ErrorKind::InvalidSettings: return "InvalidSettings";
            case ErrorKind::DecodeError: return "DecodeError";
            case ErrorKind::EncodeError: return "EncodeError";
            case ErrorKind::IOError: return "IOError";
            case ErrorKind::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    /**
     * @brief Exception raised by the conversion steps; carries the error kind
     * so the file boundary can turn it into a result record.
     */
    class ConversionError : public std::runtime_error {
    public:
        ConversionError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return data;
    }

    /**
     * @brief Lower-cased extension of a path including the dot ("" if none).
     */
    inline std::string lower_extension(const fs::path& path) {
        return to_lower(path.extension().string());
    }

} // namespace ConverterPro
