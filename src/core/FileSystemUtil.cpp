#include "FileSystemUtil.h"
#include "Common.h"
#include "ImageProbe.h"
#include "utils/Definitions.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ConverterPro {

namespace {

bool isImageExtension(const std::string& ext) {
    const auto& exts = Definitions::SUPPORTED_INPUT_EXTENSIONS;
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool isImageMimeType(const std::string& mime) {
    const auto& types = Definitions::IMAGE_MIME_TYPES;
    return std::find(types.begin(), types.end(), mime) != types.end();
}

} // namespace

bool FileSystemUtil::createDirectory(const fs::path& path, bool isFilePath) {
    fs::path dirToCreate = isFilePath ? path.parent_path() : path;

    std::error_code ec;
    if (dirToCreate.empty() || fs::is_directory(dirToCreate, ec)) {
        return true;
    }
    try {
        fs::create_directories(dirToCreate);
        std::cout << "Created directory: " << dirToCreate.string() << std::endl;
        return true;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "ERROR: could not create directory '" << dirToCreate.string() << "': " << e.what() << std::endl;
        return false;
    }
}

fs::path FileSystemUtil::resolvePath(const fs::path& path) {
    try {
        if (fs::exists(path)) {
            return fs::canonical(path);
        }
        return fs::absolute(path);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "resolvePath error: " << e.what() << std::endl;
        return path;
    }
}

fs::path FileSystemUtil::uniqueOutputPath(const fs::path& directory, const std::string& stem, const std::string& extension) {
    const std::string ext = (extension.empty() || extension.front() == '.') ? extension : "." + extension;

    // symlink_status: a dangling link is taken, never written through
    auto taken = [](const fs::path& path) {
        std::error_code ec;
        return fs::symlink_status(path, ec).type() != fs::file_type::not_found;
    };

    fs::path candidate = directory / (stem + ext);
    for (unsigned long counter = 1; taken(candidate); ++counter) {
        candidate = directory / (stem + "_" + std::to_string(counter) + ext);
    }
    return candidate;
}

bool FileSystemUtil::isImageFile(const fs::path& path) {
    if (!isImageExtension(lower_extension(path))) {
        return false;
    }
    // Content sniffing is best effort; an unknown type falls back to the extension
    const std::string mime = ImageProbe::guessMimeType(path);
    if (mime.empty()) {
        return true;
    }
    return isImageMimeType(mime);
}

std::vector<fs::path> FileSystemUtil::filterImageFiles(const std::vector<fs::path>& paths) {
    std::vector<fs::path> images;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec) && isImageFile(path)) {
            images.push_back(path);
        }
    }
    return images;
}

std::vector<fs::path> FileSystemUtil::getFilesByExtension(const fs::path& directory, const std::string& extension, bool recursive) {
    std::vector<fs::path> files;
    std::string ext = to_lower(extension.find('.') == 0 ? extension : "." + extension);
    fs::path dir = resolvePath(directory);

    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                if (entry.is_regular_file() && lower_extension(entry.path()) == ext) {
                    files.push_back(entry.path());
                }
            }
        } else {
            for (const auto& entry : fs::directory_iterator(dir)) {
                if (entry.is_regular_file() && lower_extension(entry.path()) == ext) {
                    files.push_back(entry.path());
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "getFilesByExtension error: " << e.what() << std::endl;
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> FileSystemUtil::getImageFiles(const fs::path& directory, bool recursive) {
    std::vector<fs::path> files;
    for (const auto& ext : Definitions::SUPPORTED_INPUT_EXTENSIONS) {
        auto found = getFilesByExtension(directory, ext, recursive);
        files.insert(files.end(), found.begin(), found.end());
    }
    std::sort(files.begin(), files.end());
    return filterImageFiles(files);
}

bool FileSystemUtil::validateOutputFolder(const fs::path& folder) {
    if (!createDirectory(folder)) {
        return false;
    }

    const fs::path probe = folder / ".test_write_permissions";
    {
        std::ofstream f(probe);
        if (!f) {
            return false;
        }
        f << "test";
        if (!f) {
            return false;
        }
    }
    std::error_code ec;
    fs::remove(probe, ec);
    if (ec) {
        std::cerr << "WARNING: could not remove '" << probe.string() << "': " << ec.message() << std::endl;
    }
    return true;
}

std::optional<std::uintmax_t> FileSystemUtil::availableSpace(const fs::path& folder) {
    std::error_code ec;
    const fs::space_info info = fs::space(folder, ec);
    if (ec) {
        std::cerr << "availableSpace error for '" << folder.string() << "': " << ec.message() << std::endl;
        return std::nullopt;
    }
    return info.available;
}

std::optional<std::uintmax_t> FileSystemUtil::fileSize(const fs::path& path) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

std::string FileSystemUtil::formatFileSize(std::uintmax_t sizeBytes) {
    if (sizeBytes == 0) {
        return "0 B";
    }
    static const char* sizeNames[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(sizeBytes);
    size_t i = 0;
    while (size >= 1024.0 && i < 3) {
        size /= 1024.0;
        ++i;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << sizeNames[i];
    return oss.str();
}

std::string FileSystemUtil::formatDuration(double seconds) {
    std::ostringstream oss;
    if (seconds < 60.0) {
        oss << std::fixed << std::setprecision(1) << seconds << "s";
    } else if (seconds < 3600.0) {
        const long total = static_cast<long>(seconds);
        oss << total / 60 << "m " << total % 60 << "s";
    } else {
        const long total = static_cast<long>(seconds);
        oss << total / 3600 << "h " << (total % 3600) / 60 << "m";
    }
    return oss.str();
}

} // namespace ConverterPro
