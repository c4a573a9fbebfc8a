#ifndef CONVERTERPRO_DEFINITIONS_H
#define CONVERTERPRO_DEFINITIONS_H

#include <string>
#include <vector>

namespace ConverterPro {
namespace Definitions {

// --- Application ---
const std::string APP_NAME = "Image Converter Pro";
const std::string APP_VERSION = "1.0.0";

// --- Files (relative to the working directory unless overridden) ---
const std::string LOG_FILE = "image_converter.log";
const std::string CONFIG_FILE = "config.json";

// --- Image manipulation ---

// Extensions accepted as conversion input (lower-case, with dot)
const std::vector<std::string> SUPPORTED_INPUT_EXTENSIONS = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif",
    ".webp", ".avif", ".ico", ".ppm", ".pgm", ".pbm"
};

// MIME types that confirm an image file during classification
const std::vector<std::string> IMAGE_MIME_TYPES = {
    "image/jpeg", "image/jpg", "image/png", "image/gif", "image/bmp",
    "image/tiff", "image/webp", "image/avif", "image/x-icon",
    "image/x-portable-pixmap", "image/x-portable-graymap", "image/x-portable-bitmap"
};

constexpr int DEFAULT_QUALITY = 95;
constexpr int MIN_QUALITY = 1;
constexpr int MAX_QUALITY = 100;

constexpr int MIN_DIMENSION = 1;
constexpr int MAX_DIMENSION = 65535;

constexpr int DEFAULT_RESIZE_WIDTH = 1920;
constexpr int DEFAULT_RESIZE_HEIGHT = 1080;

// ICO entries cannot exceed 256x256
constexpr int ICO_MAX_DIMENSION = 256;

// --- GUI settings ---
constexpr int QUEUE_POLL_INTERVAL_MS = 100;
const std::vector<std::string> APP_THEMES = { "dark", "light" };

} // namespace Definitions
} // namespace ConverterPro

#endif // CONVERTERPRO_DEFINITIONS_H
