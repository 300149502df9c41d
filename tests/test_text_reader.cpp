#include <gtest/gtest.h>

#include "clock.hpp"
#include "text_reader.hpp"

using namespace spex;

namespace {
class ScriptedText : public TextAdapter {
public:
    TextReading next;
    TextMode last_mode{TextMode::DOCUMENT};
    int calls{0};

    TextReading read(const Frame&, TextMode mode) override {
        ++calls;
        last_mode = mode;
        return next;
    }
};

Frame blank_frame() {
    Frame f;
    f.image = cv::Mat::zeros(48, 64, CV_8UC3);
    return f;
}
}  // namespace

TEST(TextReader, FormatsPerMode) {
    EXPECT_EQ(TextReader::format("EXIT", TextMode::SIGN), "Sign reads: EXIT");
    EXPECT_EQ(TextReader::format("Milk 1L", TextMode::LABEL), "Label says: Milk 1L");
    EXPECT_EQ(TextReader::format("12:30", TextMode::DISPLAY), "Display shows: 12:30");
    EXPECT_EQ(TextReader::format("Cafe", TextMode::SCENE), "Detected text: Cafe");
    EXPECT_EQ(TextReader::format("Dear reader", TextMode::DOCUMENT), "Dear reader");
}

TEST(TextReader, PassesModeToAdapterAndFormatsResult) {
    ScriptedText ocr;
    ManualClock clock;
    TextReader reader(ocr, clock);
    ocr.next = TextReading{"  EXIT \n", 0.9f};
    EXPECT_EQ(reader.read(blank_frame(), TextMode::SIGN), "Sign reads: EXIT");
    EXPECT_EQ(ocr.last_mode, TextMode::SIGN);
}

TEST(TextReader, LowConfidenceOrEmptyIsNoText) {
    ScriptedText ocr;
    ManualClock clock;
    TextReader reader(ocr, clock, 0.6f);

    ocr.next = TextReading{"blurry", 0.4f};
    EXPECT_EQ(reader.read(blank_frame(), TextMode::DOCUMENT), "No text detected");
    ocr.next = TextReading{"   ", 0.99f};
    EXPECT_EQ(reader.read(blank_frame(), TextMode::DOCUMENT), "No text detected");
    EXPECT_TRUE(reader.history().empty());
}

TEST(TextReader, KeepsShortHistory) {
    ScriptedText ocr;
    ManualClock clock(0.0);
    TextReader reader(ocr, clock);

    ocr.next = TextReading{"first", 0.9f};
    reader.read(blank_frame(), TextMode::DOCUMENT);
    clock.set(3.0);
    ocr.next = TextReading{"second", 0.8f};
    reader.read(blank_frame(), TextMode::LABEL);

    auto hist = reader.history();
    ASSERT_EQ(hist.size(), 2u);
    EXPECT_EQ(hist[0].text, "first");
    EXPECT_EQ(hist[1].mode, TextMode::LABEL);

    clock.set(6.0);
    hist = reader.history();
    ASSERT_EQ(hist.size(), 1u);
    EXPECT_EQ(hist[0].text, "second");
}

TEST(TextReader, PicksModeFromUtterance) {
    EXPECT_EQ(TextReader::mode_from_utterance("read the sign"), TextMode::SIGN);
    EXPECT_EQ(TextReader::mode_from_utterance("Read this LABEL please"), TextMode::LABEL);
    EXPECT_EQ(TextReader::mode_from_utterance("read the display"), TextMode::DISPLAY);
    EXPECT_EQ(TextReader::mode_from_utterance("read the screen"), TextMode::DISPLAY);
    EXPECT_EQ(TextReader::mode_from_utterance("read the scene"), TextMode::SCENE);
    EXPECT_EQ(TextReader::mode_from_utterance("read this"), TextMode::DOCUMENT);
}
