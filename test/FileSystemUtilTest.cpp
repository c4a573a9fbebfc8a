#include "BaseTestFixture.h"
#include "core/FileSystemUtil.h"

class FileSystemUtilTest : public BaseTestFixture {};

TEST_F(FileSystemUtilTest, CreateDirectory) {
    const fs::path nested = tempDir / "a" / "b" / "c";
    EXPECT_TRUE(FileSystemUtil::createDirectory(nested));
    EXPECT_TRUE(fs::is_directory(nested));
    // Existing directory is fine
    EXPECT_TRUE(FileSystemUtil::createDirectory(nested));

    const fs::path file = tempDir / "x" / "file.txt";
    EXPECT_TRUE(FileSystemUtil::createDirectory(file, true));
    EXPECT_TRUE(fs::is_directory(tempDir / "x"));
    EXPECT_FALSE(fs::exists(file));

    touch(tempDir / "plain");
    EXPECT_FALSE(FileSystemUtil::createDirectory(tempDir / "plain" / "sub"));
}

TEST_F(FileSystemUtilTest, UniqueOutputPath) {
    EXPECT_EQ(FileSystemUtil::uniqueOutputPath(tempDir, "photo", "png"), tempDir / "photo.png");
    touch(tempDir / "photo.png");
    EXPECT_EQ(FileSystemUtil::uniqueOutputPath(tempDir, "photo", ".png"), tempDir / "photo_1.png");
    touch(tempDir / "photo_1.png");
    touch(tempDir / "photo_2.png");
    EXPECT_EQ(FileSystemUtil::uniqueOutputPath(tempDir, "photo", "png"), tempDir / "photo_3.png");
    // Other extensions don't collide
    EXPECT_EQ(FileSystemUtil::uniqueOutputPath(tempDir, "photo", "jpg"), tempDir / "photo.jpg");
}

TEST_F(FileSystemUtilTest, UniqueOutputPathSkipsDanglingSymlink) {
    const fs::path out = tempDir / "out";
    const fs::path elsewhere = tempDir / "elsewhere";
    fs::create_directories(out);
    fs::create_directories(elsewhere);

    std::error_code ec;
    fs::create_symlink(elsewhere / "victim.png", out / "name.png", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks not available: " << ec.message();
    }
    ASSERT_FALSE(fs::exists(out / "name.png"));

    EXPECT_EQ(FileSystemUtil::uniqueOutputPath(out, "name", "png"), out / "name_1.png");
}

TEST_F(FileSystemUtilTest, ClassifiesImageFiles) {
    const fs::path png = createImage("real.png", 4, 4);
    EXPECT_TRUE(FileSystemUtil::isImageFile(png));

    const fs::path upper = tempDir / "UPPER.PNG";
    fs::copy_file(png, upper);
    EXPECT_TRUE(FileSystemUtil::isImageFile(upper));

    touch(tempDir / "notes.txt", "text");
    EXPECT_FALSE(FileSystemUtil::isImageFile(tempDir / "notes.txt"));

    // Unrecognized content falls back to the extension
    touch(tempDir / "unknown.webp", "????");
    EXPECT_TRUE(FileSystemUtil::isImageFile(tempDir / "unknown.webp"));
}

TEST_F(FileSystemUtilTest, FilterImageFilesKeepsOrder) {
    const fs::path b = createImage("b.png", 4, 4);
    const fs::path a = createImage("a.jpg", 4, 4);
    touch(tempDir / "c.txt");
    fs::create_directories(tempDir / "folder.png");

    const auto images = FileSystemUtil::filterImageFiles(
        {b, tempDir / "c.txt", a, tempDir / "missing.png", tempDir / "folder.png"});
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0], b);
    EXPECT_EQ(images[1], a);
}

TEST_F(FileSystemUtilTest, GetImageFilesFromDirectory) {
    createImage("one.png", 4, 4);
    createImage("two.BMP", 4, 4);
    touch(tempDir / "readme.md");
    fs::create_directories(tempDir / "sub");
    cv::imwrite((tempDir / "sub" / "three.jpg").string(), cv::Mat(4, 4, CV_8UC3, cv::Scalar(0)));

    auto flat = FileSystemUtil::getImageFiles(tempDir);
    ASSERT_EQ(flat.size(), 2u);
    for (const auto& path : flat) {
        EXPECT_TRUE(path.is_absolute());
    }

    auto recursive = FileSystemUtil::getImageFiles(tempDir, true);
    EXPECT_EQ(recursive.size(), 3u);

    EXPECT_TRUE(FileSystemUtil::getImageFiles(tempDir / "does_not_exist").empty());
}

TEST_F(FileSystemUtilTest, GetFilesByExtension) {
    touch(tempDir / "a.txt");
    touch(tempDir / "b.TXT");
    touch(tempDir / "c.log");
    EXPECT_EQ(FileSystemUtil::getFilesByExtension(tempDir, "txt").size(), 2u);
    EXPECT_EQ(FileSystemUtil::getFilesByExtension(tempDir, ".log").size(), 1u);
}

TEST_F(FileSystemUtilTest, ValidateOutputFolder) {
    const fs::path folder = tempDir / "out" / "deep";
    EXPECT_TRUE(FileSystemUtil::validateOutputFolder(folder));
    EXPECT_TRUE(fs::is_directory(folder));
    EXPECT_TRUE(fs::is_empty(folder));

    touch(tempDir / "file");
    EXPECT_FALSE(FileSystemUtil::validateOutputFolder(tempDir / "file"));
}

TEST_F(FileSystemUtilTest, SpaceAndSize) {
    EXPECT_TRUE(FileSystemUtil::availableSpace(tempDir).has_value());
    touch(tempDir / "five", "12345");
    EXPECT_EQ(FileSystemUtil::fileSize(tempDir / "five").value(), 5u);
    EXPECT_FALSE(FileSystemUtil::fileSize(tempDir / "missing").has_value());
}

TEST(FileSystemUtilFormatTest, FormatFileSize) {
    EXPECT_EQ(FileSystemUtil::formatFileSize(0), "0 B");
    EXPECT_EQ(FileSystemUtil::formatFileSize(512), "512.0 B");
    EXPECT_EQ(FileSystemUtil::formatFileSize(1536), "1.5 KB");
    EXPECT_EQ(FileSystemUtil::formatFileSize(3 * 1024 * 1024), "3.0 MB");
    EXPECT_EQ(FileSystemUtil::formatFileSize(1024ull * 1024 * 1024), "1.0 GB");
}

TEST(FileSystemUtilFormatTest, FormatDuration) {
    EXPECT_EQ(FileSystemUtil::formatDuration(12.34), "12.3s");
    EXPECT_EQ(FileSystemUtil::formatDuration(245), "4m 5s");
    EXPECT_EQ(FileSystemUtil::formatDuration(3720), "1h 2m");
}
