#include "decoder.hh"
#include "morse.hh"
#include "settings.hh"
#include "gtest/gtest.h"
#include <cmath>

namespace {

class TextCollector: public CharacterHandler
{
public:
  TextCollector(): lastWpm(0) { }

  void handle(const std::string &text, float wpm) {
    this->text += text;
    lastWpm = wpm;
  }

  std::string text;
  float lastWpm;
};

/// Keys text with ideal timing starting at @c t, returns the time after the last key up.
int64_t
sendText(CWDecoder &decoder, const std::string &text, float wpm, int64_t t) {
  int64_t unit = ditDurationUs(wpm);
  bool first = true;
  for (size_t i=0; i<text.size(); i++) {
    if (' ' == text[i]) {
      t += 4*unit;
      continue;
    }
    if (! first)
      t += 3*unit;
    first = false;
    std::string pattern = morseEncode(text[i]);
    for (size_t j=0; j<pattern.size(); j++) {
      if (j)
        t += unit;
      decoder.keyDown(t);
      t += ('.' == pattern[j]) ? unit : 3*unit;
      decoder.keyUp(t);
    }
  }
  return t;
}

TEST(CWDecoderTest, DecodesLetterS) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  decoder.keyDown(0);
  decoder.keyUp(60000);
  decoder.keyDown(120000);
  decoder.keyUp(180000);
  decoder.keyDown(240000);
  decoder.keyUp(300000);
  EXPECT_EQ("...", decoder.pattern());
  EXPECT_EQ("", out.text);

  // still inside the character gap
  decoder.checkIdle(400000);
  EXPECT_EQ("", out.text);

  decoder.checkIdle(420000);
  EXPECT_EQ("S", out.text);
  EXPECT_EQ(CWDecoder::STATE_CHAR_GAP, decoder.state());
  EXPECT_NEAR(20.0, out.lastWpm, 0.01);
}

TEST(CWDecoderTest, DecodesText) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = sendText(decoder, "PARIS CQ DE TEST 73", 20, 1000000);
  decoder.checkIdle(t + 600000);

  EXPECT_EQ("PARIS CQ DE TEST 73", out.text);
  EXPECT_EQ(CWDecoder::STATE_WORD_GAP, decoder.state());
  EXPECT_EQ(0u, decoder.anomalies());
}

TEST(CWDecoderTest, DecodesAtDifferentSpeeds) {
  float speeds[] = { 12, 30, 40 };
  for (int i=0; i<3; i++) {
    TextCollector out;
    CWDecoder decoder(&out, speeds[i]);
    int64_t t = sendText(decoder, "QRL? 5NN", speeds[i], 0);
    decoder.checkIdle(t + 10*ditDurationUs(speeds[i]));
    EXPECT_EQ("QRL? 5NN", out.text) << speeds[i] << " WPM";
  }
}

TEST(CWDecoderTest, TracksFasterSpeed) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = sendText(decoder, "PARIS PARIS PARIS PARIS PARIS", 25, 0);
  EXPECT_NEAR(25.0, decoder.wpm(), 25*0.05);
  decoder.checkIdle(t + 1000000);
  EXPECT_EQ("PARIS PARIS PARIS PARIS PARIS", out.text);
}

TEST(CWDecoderTest, TracksSlowerSpeed) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  sendText(decoder, "SEE HIS SEE HIS SEE HIS", 15, 0);
  EXPECT_NEAR(15.0, decoder.wpm(), 15*0.05);
}

TEST(CWDecoderTest, IgnoresGlitchInGap) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  decoder.keyDown(0);
  decoder.keyUp(60000);
  decoder.keyDown(80000);
  decoder.keyUp(81000);
  decoder.keyDown(120000);
  decoder.keyUp(180000);
  decoder.checkIdle(400000);

  EXPECT_EQ("I", out.text);
  EXPECT_EQ(0u, decoder.anomalies());
  EXPECT_DOUBLE_EQ(60000, decoder.ditUnit());
}

TEST(CWDecoderTest, UnknownPatternEmitsPlaceholder) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = 0;
  const std::string pattern = "-.-.-.-";
  for (size_t i=0; i<pattern.size(); i++) {
    decoder.keyDown(t);
    t += ('.' == pattern[i]) ? 60000 : 180000;
    decoder.keyUp(t);
    t += 60000;
  }
  decoder.checkIdle(t + 1000000);
  EXPECT_EQ(UNKNOWN_CHARACTER, out.text);
}

TEST(CWDecoderTest, OverlongPatternIsAnomaly) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = 0;
  for (int i=0; i<8; i++) {
    decoder.keyDown(t);
    decoder.keyUp(t+60000);
    t += 120000;
  }
  decoder.checkIdle(t + 1000000);
  EXPECT_EQ(1u, decoder.anomalies());
  EXPECT_EQ("", out.text);

  // decoding recovers with the next character
  t = sendText(decoder, "K", 20, t + 1000000);
  decoder.checkIdle(t + 200000);
  EXPECT_EQ("K", out.text);
}

TEST(CWDecoderTest, UnbalancedTransitionsAreAnomalies) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  decoder.keyUp(1000);
  EXPECT_EQ(1u, decoder.anomalies());

  decoder.keyDown(10000);
  decoder.keyUp(70000);
  decoder.keyDown(130000);
  decoder.keyDown(140000);
  EXPECT_EQ(2u, decoder.anomalies());
  EXPECT_EQ("", decoder.pattern());
}

TEST(CWDecoderTest, LongMarkIsAnomaly) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  decoder.keyDown(0);
  decoder.keyUp(3000000);
  decoder.checkIdle(4000000);
  EXPECT_EQ(1u, decoder.anomalies());
  EXPECT_EQ("", out.text);
  EXPECT_DOUBLE_EQ(60000, decoder.ditUnit());
}

TEST(CWDecoderTest, WordSpaceOnlyAfterCharacter) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = sendText(decoder, "E", 20, 0);
  decoder.checkIdle(t + 2000000);
  EXPECT_EQ("E", out.text);

  t = sendText(decoder, "E", 20, t + 3000000);
  decoder.checkIdle(t + 2000000);
  EXPECT_EQ("E E", out.text);
}

TEST(CWDecoderTest, ClearDropsPendingCharacter) {
  TextCollector out;
  CWDecoder decoder(&out, 20);
  int64_t t = sendText(decoder, "AB", 20, 0);
  decoder.clear();
  decoder.checkIdle(t + 1000000);
  EXPECT_EQ("A", out.text);
  EXPECT_EQ("", decoder.pattern());

  // no leading word space after a clear
  t = sendText(decoder, "N", 20, t + 2000000);
  decoder.checkIdle(t + 1000000);
  EXPECT_EQ("AN", out.text);
}

TEST(CWDecoderTest, SeedReplacesEstimate) {
  CWDecoder decoder(0, 20);
  decoder.seed(30);
  EXPECT_NEAR(30.0, decoder.wpm(), 0.01);
  decoder.reset(10);
  EXPECT_DOUBLE_EQ(120000, decoder.ditUnit());
  EXPECT_EQ(CWDecoder::STATE_IDLE, decoder.state());
}

TEST(MorseTest, EncodesCharacters) {
  EXPECT_EQ(".-", morseEncode('A'));
  EXPECT_EQ(".-", morseEncode('a'));
  EXPECT_EQ("-----", morseEncode('0'));
  EXPECT_EQ("..--..", morseEncode('?'));
  EXPECT_EQ("", morseEncode('#'));
}

TEST(MorseTest, DecodesPatterns) {
  const std::string characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789.,?/=";
  for (size_t i=0; i<characters.size(); i++) {
    char c = 0;
    ASSERT_TRUE(morseDecode(morseEncode(characters[i]), c)) << characters[i];
    EXPECT_EQ(characters[i], c);
  }
  char c = 0;
  EXPECT_FALSE(morseDecode("........", c));
  EXPECT_FALSE(morseDecode("", c));
}

}
