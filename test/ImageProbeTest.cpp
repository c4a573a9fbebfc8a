#include "BaseTestFixture.h"
#include "core/IcoCodec.h"
#include "core/ImageProbe.h"

class ImageProbeTest : public BaseTestFixture {};

TEST_F(ImageProbeTest, DetectsFormatFromContent) {
    EXPECT_EQ(ImageProbe::detectFormat(createImage("a.png", 4, 4)), "png");
    EXPECT_EQ(ImageProbe::detectFormat(createImage("b.jpg", 4, 4)), "jpeg");
    EXPECT_EQ(ImageProbe::detectFormat(createImage("c.bmp", 4, 4)), "bmp");

    // Extension does not matter
    const fs::path disguised = tempDir / "really_png.jpg";
    fs::copy_file(tempDir / "a.png", disguised);
    EXPECT_EQ(ImageProbe::detectFormat(disguised), "png");

    const fs::path text = tempDir / "text.png";
    touch(text, "hello world");
    EXPECT_EQ(ImageProbe::detectFormat(text), "");
    EXPECT_EQ(ImageProbe::detectFormat(tempDir / "missing.png"), "");
}

TEST(ImageProbeBytesTest, DetectsMagicBytes) {
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{'G', 'I', 'F', '8', '9', 'a', 0, 0}), "gif");
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{'I', 'I', '*', 0, 8, 0, 0, 0}), "tiff");
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{'M', 'M', 0, '*', 0, 0, 0, 8}), "tiff");
    EXPECT_EQ(ImageProbe::detectFormat(
                  std::vector<uint8_t>{'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'}), "webp");
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{0, 0, 1, 0, 1, 0}), "ico");
    EXPECT_EQ(ImageProbe::detectFormat(
                  std::vector<uint8_t>{0, 0, 0, 0x1C, 'f', 't', 'y', 'p', 'a', 'v', 'i', 'f'}), "avif");
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{'P', '6', '\n', '1'}), "pnm");
    EXPECT_EQ(ImageProbe::detectFormat(std::vector<uint8_t>{}), "");
}

TEST(ImageProbeBytesTest, MimeTypes) {
    EXPECT_EQ(ImageProbe::mimeTypeForFormat("png"), "image/png");
    EXPECT_EQ(ImageProbe::mimeTypeForFormat("jpeg"), "image/jpeg");
    EXPECT_EQ(ImageProbe::mimeTypeForFormat("ico"), "image/x-icon");
    EXPECT_EQ(ImageProbe::mimeTypeForFormat("pnm"), "image/x-portable-pixmap");
    EXPECT_EQ(ImageProbe::mimeTypeForFormat(""), "");
}

TEST_F(ImageProbeTest, ReadsJpegOrientation) {
    std::vector<uint8_t> bytes = readBytes(createOrientedJpeg("rot.jpg", 8, 8, 6));
    EXPECT_EQ(ImageProbe::readOrientation(bytes), 6);
    EXPECT_TRUE(ImageProbe::hasExif(bytes));

    bytes = readBytes(createImage("plain.jpg", 8, 8));
    EXPECT_EQ(ImageProbe::readOrientation(bytes), 1);
    EXPECT_FALSE(ImageProbe::hasExif(bytes));
}

TEST(ImageProbeBytesTest, ParsesTiffOrientationBothByteOrders) {
    const std::vector<uint8_t> little = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x01, 0x00,
        0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_EQ(ImageProbe::parseTiffOrientation(little.data(), little.size()), 3);
    EXPECT_EQ(ImageProbe::readOrientation(little), 3);

    const std::vector<uint8_t> big = {
        'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08,
        0x00, 0x01,
        0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x08, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_EQ(ImageProbe::parseTiffOrientation(big.data(), big.size()), 8);

    // Out-of-range value and truncated IFD
    std::vector<uint8_t> bad = big;
    bad[19] = 9;
    EXPECT_EQ(ImageProbe::parseTiffOrientation(bad.data(), bad.size()), 0);
    EXPECT_EQ(ImageProbe::readOrientation(bad), 1);
    EXPECT_EQ(ImageProbe::parseTiffOrientation(big.data(), 12), 0);
}

TEST(ImageProbeBytesTest, TiffExifWithoutOrientation) {
    // IFD0 holds only an Exif IFD pointer (LONG, offset 26)
    const std::vector<uint8_t> exifPointer = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x01, 0x00,
        0x69, 0x87, 0x04, 0x00, 0x01, 0x00, 0x00, 0x00, 0x1A, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    };
    EXPECT_TRUE(ImageProbe::hasExif(exifPointer));
    EXPECT_EQ(ImageProbe::parseTiffOrientation(exifPointer.data(), exifPointer.size()), 0);
    EXPECT_EQ(ImageProbe::readOrientation(exifPointer), 1);

    // GPS IFD pointer, big-endian
    const std::vector<uint8_t> gps = {
        'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08,
        0x00, 0x01,
        0x88, 0x25, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x1A,
        0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    };
    EXPECT_TRUE(ImageProbe::hasExif(gps));

    // Only ImageWidth: plain TIFF tags are not EXIF
    const std::vector<uint8_t> plain = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x01, 0x00,
        0x00, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_FALSE(ImageProbe::hasExif(plain));
}

TEST_F(ImageProbeTest, PaletteAndGrayAlphaDetection) {
    const std::vector<uint8_t> rgba = readBytes(createHalfTransparentPng("rgba.png", 4, 4));
    EXPECT_FALSE(ImageProbe::isPaletteImage(rgba));
    EXPECT_FALSE(ImageProbe::isGrayAlphaImage(rgba));
    EXPECT_FALSE(ImageProbe::hasPaletteTransparency(rgba));

    // Same file with IHDR color type patched to 3 (palette) / 4 (gray+alpha)
    std::vector<uint8_t> palette = rgba;
    palette[25] = 3;
    EXPECT_TRUE(ImageProbe::isPaletteImage(palette));
    std::vector<uint8_t> grayAlpha = rgba;
    grayAlpha[25] = 4;
    EXPECT_TRUE(ImageProbe::isGrayAlphaImage(grayAlpha));

    const std::vector<uint8_t> gif = {'G', 'I', 'F', '8', '9', 'a', 1, 0, 1, 0, 0, 0, 0,
                                      0x21, 0xF9, 0x04, 0x01, 0, 0, 0, 0};
    EXPECT_TRUE(ImageProbe::isPaletteImage(gif));
    EXPECT_TRUE(ImageProbe::hasPaletteTransparency(gif));
}

TEST_F(ImageProbeTest, GuessMimeTypeFromContent) {
    EXPECT_EQ(ImageProbe::guessMimeType(createImage("x.png", 2, 2)), "image/png");
    const fs::path icon = tempDir / "x.ico";
    ASSERT_TRUE(IcoCodec::write(icon, cv::Mat(16, 16, CV_8UC4, cv::Scalar(1, 2, 3, 255))));
    EXPECT_EQ(ImageProbe::guessMimeType(icon), "image/x-icon");
}
