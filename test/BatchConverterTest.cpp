#include "BaseTestFixture.h"
#include "core/BatchConverter.h"
#include "core/ImageConverter.h"

#include <stdexcept>
#include <thread>

class BatchConverterTest : public BaseTestFixture {
protected:
    ImageConverter converter{logger};
    MessageQueue<ProgressMessage> queue;
    BatchConverter batch{logger, converter, queue};
    std::atomic<bool> cancelled{false};

    ConversionSettings jpegSettings() {
        ConversionSettings settings;
        settings.outputFormat = "jpeg";
        settings.outputFolder = outputDir;
        return settings;
    }

    std::vector<fs::path> createInputs(size_t count) {
        std::vector<fs::path> files;
        for (size_t i = 0; i < count; ++i) {
            files.push_back(createImage("image_" + std::to_string(i) + ".png", 24, 24));
        }
        return files;
    }
};

TEST_F(BatchConverterTest, ConvertsEveryFile) {
    const auto files = createInputs(3);
    const BatchSummary summary = batch.run(files, jpegSettings(), cancelled);

    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.succeeded, 3u);
    EXPECT_TRUE(summary.failures.empty());
    ASSERT_EQ(summary.outputPaths.size(), 3u);
    for (size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(summary.outputPaths[i], outputDir / ("image_" + std::to_string(i) + ".jpeg"));
        EXPECT_TRUE(fs::exists(summary.outputPaths[i]));
    }
    EXPECT_GE(summary.elapsedSeconds, 0.0);
}

TEST_F(BatchConverterTest, ProgressBeforeEachFileThenOneTerminal) {
    const auto files = createInputs(3);
    batch.run(files, jpegSettings(), cancelled);

    const std::vector<ProgressMessage> messages = queue.drain();
    ASSERT_EQ(messages.size(), 4u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(messages[i].type, ProgressMessage::Type::Progress);
        EXPECT_FALSE(messages[i].isTerminal());
        EXPECT_EQ(messages[i].fileIndex, i);
        EXPECT_EQ(messages[i].totalFiles, 3u);
        EXPECT_DOUBLE_EQ(messages[i].fraction, static_cast<double>(i) / 3.0);
        EXPECT_EQ(messages[i].text, "Converting image_" + std::to_string(i) + ".png...");
    }

    const ProgressMessage& last = messages.back();
    EXPECT_EQ(last.type, ProgressMessage::Type::Complete);
    EXPECT_TRUE(last.isTerminal());
    EXPECT_DOUBLE_EQ(last.fraction, 1.0);
    EXPECT_EQ(last.text, "Conversion complete: 3/3 successful");
    EXPECT_EQ(last.summary.succeeded, 3u);
}

TEST_F(BatchConverterTest, FailedFileDoesNotStopBatch) {
    auto files = createInputs(4);
    // Second file can no longer be decoded
    touch(files[1], "garbage");

    const BatchSummary summary = batch.run(files, jpegSettings(), cancelled);

    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.succeeded, 3u);
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].path, files[1]);
    EXPECT_EQ(summary.failures[0].kind, ErrorKind::DecodeError);
    EXPECT_FALSE(summary.failures[0].message.empty());

    EXPECT_TRUE(fs::exists(outputDir / "image_2.jpeg"));
    EXPECT_TRUE(fs::exists(outputDir / "image_3.jpeg"));
    EXPECT_FALSE(fs::exists(outputDir / "image_1.jpeg"));

    const auto messages = queue.drain();
    ASSERT_EQ(messages.size(), 5u);
    EXPECT_EQ(messages.back().type, ProgressMessage::Type::Complete);
    EXPECT_EQ(messages.back().text, "Conversion complete: 3/4 successful");
    EXPECT_EQ(messages.back().summary.failures.size(), 1u);
}

TEST_F(BatchConverterTest, MixedFailureKindsCollected) {
    std::vector<fs::path> files = createInputs(1);
    files.push_back(tempDir / "missing.png");
    const fs::path text = tempDir / "readme.txt";
    touch(text, "hello");
    files.push_back(text);

    const BatchSummary summary = batch.run(files, jpegSettings(), cancelled);
    EXPECT_EQ(summary.succeeded, 1u);
    ASSERT_EQ(summary.failures.size(), 2u);
    EXPECT_EQ(summary.failures[0].kind, ErrorKind::InputNotFound);
    EXPECT_EQ(summary.failures[1].kind, ErrorKind::UnsupportedInputFormat);
}

TEST_F(BatchConverterTest, CancelBeforeStartConvertsNothing) {
    const auto files = createInputs(2);
    cancelled = true;

    const BatchSummary summary = batch.run(files, jpegSettings(), cancelled);
    EXPECT_EQ(summary.succeeded, 0u);
    EXPECT_TRUE(summary.outputPaths.empty());
    EXPECT_FALSE(fs::exists(outputDir));

    const auto messages = queue.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].type, ProgressMessage::Type::Cancelled);
    EXPECT_EQ(messages[0].text, "Conversion cancelled: 0/2 successful");
}

TEST_F(BatchConverterTest, CancelStopsBeforeNextFile) {
    const auto files = createInputs(50);
    MessageQueue<ProgressMessage> observed;
    BatchConverter cancellingBatch(logger, converter, observed);

    std::thread worker([&] { cancellingBatch.run(files, jpegSettings(), cancelled); });
    // Cancel once the first file is in flight
    while (observed.empty()) {
        std::this_thread::yield();
    }
    cancelled = true;
    worker.join();

    const auto messages = observed.drain();
    ASSERT_FALSE(messages.empty());
    const ProgressMessage& last = messages.back();
    ASSERT_TRUE(last.isTerminal());
    // Cancellation is only observed between files, so a very fast machine may finish first
    if (last.type == ProgressMessage::Type::Cancelled) {
        EXPECT_LT(last.summary.succeeded, files.size());
        EXPECT_EQ(last.summary.outputPaths.size(), last.summary.succeeded);
        EXPECT_EQ(messages.size() - 1, last.summary.succeeded + last.summary.failures.size());
    } else {
        EXPECT_EQ(last.type, ProgressMessage::Type::Complete);
    }
    for (size_t i = 0; i + 1 < messages.size(); ++i) {
        EXPECT_EQ(messages[i].type, ProgressMessage::Type::Progress);
    }
}

TEST_F(BatchConverterTest, EmptyListCompletesImmediately) {
    const BatchSummary summary = batch.run({}, jpegSettings(), cancelled);
    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(summary.succeeded, 0u);

    const auto messages = queue.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].type, ProgressMessage::Type::Complete);
    EXPECT_EQ(messages[0].text, "Conversion complete: 0/0 successful");
}

TEST_F(BatchConverterTest, UnexpectedExceptionEndsBatchWithError) {
    const auto files = createInputs(5);
    std::vector<size_t> calls;
    BatchConverter throwingBatch(logger,
        [&](const fs::path& path, const ConversionSettings&) {
            const size_t index = calls.size();
            calls.push_back(index);
            if (index == 2) {
                throw std::runtime_error("converter crashed");
            }
            return ConversionResult::ok(outputDir / path.filename());
        },
        queue);

    const BatchSummary summary = throwingBatch.run(files, jpegSettings(), cancelled);
    EXPECT_EQ(calls, (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(summary.succeeded, 2u);

    const auto messages = queue.drain();
    ASSERT_EQ(messages.size(), 4u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(messages[i].type, ProgressMessage::Type::Progress);
        EXPECT_EQ(messages[i].fileIndex, i);
    }
    EXPECT_EQ(messages[3].type, ProgressMessage::Type::Error);
    EXPECT_TRUE(messages[3].isTerminal());
    EXPECT_EQ(messages[3].text, "converter crashed");
    EXPECT_EQ(messages[3].summary.succeeded, 2u);
}
