#include "BaseTestFixture.h"
#include "core/IcoCodec.h"
#include "core/ImageProbe.h"

class IcoCodecTest : public BaseTestFixture {};

TEST_F(IcoCodecTest, WritesReadableIcon) {
    cv::Mat image(32, 48, CV_8UC4, cv::Scalar(10, 20, 30, 255));
    image(cv::Rect(0, 0, 8, 8)).setTo(cv::Scalar(0, 0, 0, 0));
    const fs::path path = tempDir / "app.ico";

    ASSERT_TRUE(IcoCodec::write(path, image));
    EXPECT_EQ(ImageProbe::detectFormat(path), "ico");

    const cv::Mat decoded = IcoCodec::read(path);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 48);
    EXPECT_EQ(decoded.rows, 32);
    EXPECT_EQ(decoded.channels(), 4);
    EXPECT_EQ(decoded.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(decoded.at<cv::Vec4b>(20, 20), cv::Vec4b(10, 20, 30, 255));
}

TEST_F(IcoCodecTest, DirectoryEntryUsesZeroFor256) {
    const std::vector<uint8_t> bytes = IcoCodec::encode(cv::Mat(256, 256, CV_8UC3, cv::Scalar(1, 1, 1)));
    ASSERT_GT(bytes.size(), 22u);
    EXPECT_EQ(bytes[2], 1);  // type icon
    EXPECT_EQ(bytes[4], 1);  // one image
    EXPECT_EQ(bytes[6], 0);  // width 256
    EXPECT_EQ(bytes[7], 0);  // height 256
    EXPECT_EQ(IcoCodec::decode(bytes).cols, 256);
}

TEST_F(IcoCodecTest, RejectsOversizedAndDeepImages) {
    EXPECT_TRUE(IcoCodec::encode(cv::Mat(257, 10, CV_8UC3)).empty());
    EXPECT_TRUE(IcoCodec::encode(cv::Mat(10, 10, CV_16UC3)).empty());
    EXPECT_TRUE(IcoCodec::encode(cv::Mat()).empty());
    EXPECT_FALSE(IcoCodec::write(tempDir / "big.ico", cv::Mat(300, 300, CV_8UC3)));
}

TEST_F(IcoCodecTest, DecodesUncompressedDibEntry) {
    // 2x2, 32 bpp BITMAPINFOHEADER entry with doubled height for the AND mask
    std::vector<uint8_t> dib(40, 0);
    dib[0] = 40;
    dib[4] = 2;
    dib[8] = 4;
    dib[12] = 1;
    dib[14] = 32;
    // XOR rows, bottom-up: bottom row blue, top row green
    const uint8_t pixels[] = {255, 0, 0, 255, 255, 0, 0, 255, 0, 255, 0, 255, 0, 255, 0, 255};
    dib.insert(dib.end(), std::begin(pixels), std::end(pixels));
    dib.insert(dib.end(), 8, 0); // AND mask, two 4-byte rows

    std::vector<uint8_t> ico = {0, 0, 1, 0, 1, 0, 2, 2, 0, 0, 1, 0, 32, 0};
    const uint32_t size = static_cast<uint32_t>(dib.size());
    for (int i = 0; i < 4; ++i) ico.push_back(static_cast<uint8_t>((size >> (8 * i)) & 0xFF));
    ico.insert(ico.end(), {22, 0, 0, 0});
    ico.insert(ico.end(), dib.begin(), dib.end());

    const cv::Mat decoded = IcoCodec::decode(ico);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 2);
    EXPECT_EQ(decoded.rows, 2);
    EXPECT_EQ(decoded.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 255, 0, 255));
    EXPECT_EQ(decoded.at<cv::Vec4b>(1, 1), cv::Vec4b(255, 0, 0, 255));
}

TEST_F(IcoCodecTest, GarbageDecodesToEmpty) {
    EXPECT_TRUE(IcoCodec::decode({1, 2, 3}).empty());
    EXPECT_TRUE(IcoCodec::decode({0, 0, 1, 0, 5, 0}).empty());
    EXPECT_TRUE(IcoCodec::read(tempDir / "missing.ico").empty());
}
