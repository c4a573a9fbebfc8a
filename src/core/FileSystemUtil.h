#ifndef CONVERTERPRO_FILESYSTEM_UTIL_H
#define CONVERTERPRO_FILESYSTEM_UTIL_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace ConverterPro {

// Path handling, output naming and image-file classification
class FileSystemUtil {
public:
    /**
     * @brief Creates a directory (and its parents) if it doesn't exist.
     * @param path The path to the directory.
     * @param isFilePath If true, treats 'path' as a file path and creates its parent directory.
     * @return false if the directory could not be created.
     */
    static bool createDirectory(const std::filesystem::path& path, bool isFilePath = false);

    /**
     * @brief Resolves a path to its absolute, canonical form.
     */
    static std::filesystem::path resolvePath(const std::filesystem::path& path);

    /**
     * @brief First free path "<dir>/<stem>.<ext>", "<dir>/<stem>_1.<ext>", "<dir>/<stem>_2.<ext>", ...
     * @param directory Output directory.
     * @param stem Base file name without extension.
     * @param extension Extension with or without the leading dot.
     */
    static std::filesystem::path uniqueOutputPath(const std::filesystem::path& directory,
                                                  const std::string& stem,
                                                  const std::string& extension);

    /**
     * @brief Is this path plausibly an image file?
     *
     * The extension must be a known image extension; a best-effort MIME
     * lookup on the content then confirms it. If the content type cannot be
     * determined the extension decides.
     */
    static bool isImageFile(const std::filesystem::path& path);

    /**
     * @brief Keeps the regular files classified as images, preserving order.
     */
    static std::vector<std::filesystem::path> filterImageFiles(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Gets all files with a specific extension in a directory.
     * @param directory The directory to search.
     * @param extension The file extension (e.g., ".jpg" or "jpg"), matched case-insensitively.
     * @param recursive Whether to search subdirectories.
     * @return Absolute file paths, sorted.
     */
    static std::vector<std::filesystem::path> getFilesByExtension(const std::filesystem::path& directory,
                                                                  const std::string& extension,
                                                                  bool recursive = false);

    /**
     * @brief Image files of a directory (every supported input extension), sorted.
     */
    static std::vector<std::filesystem::path> getImageFiles(const std::filesystem::path& directory, bool recursive = false);

    /**
     * @brief Creates the folder if needed and checks that a file can be written into it.
     */
    static bool validateOutputFolder(const std::filesystem::path& folder);

    /**
     * @brief Bytes available to the current user on the volume of 'folder'.
     */
    static std::optional<std::uintmax_t> availableSpace(const std::filesystem::path& folder);

    static std::optional<std::uintmax_t> fileSize(const std::filesystem::path& path);

    /**
     * @brief Human-readable size: "0 B", "512.0 B", "1.5 KB", "3.2 MB", "1.0 GB".
     */
    static std::string formatFileSize(std::uintmax_t sizeBytes);

    /**
     * @brief Human-readable duration: "12.3s", "4m 5s", "1h 2m".
     */
    static std::string formatDuration(double seconds);
};

} // namespace ConverterPro

#endif // CONVERTERPRO_FILESYSTEM_UTIL_H
