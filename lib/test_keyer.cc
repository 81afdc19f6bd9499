#include "keyer.hh"
#include "settings.hh"
#include "gtest/gtest.h"
#include <utility>
#include <vector>

namespace {

// 20 WPM
const int64_t kDit = 60000;
const int64_t kDah = 180000;

/// Collects the key boundaries and pairs them up into elements.
class KeyRecorder: public KeyListener
{
public:
  KeyRecorder(): _downAt(0) { }

  void keyChanged(bool down, int64_t timestamp) {
    if (down) {
      _downAt = timestamp;
    } else {
      marks.push_back(std::make_pair(_downAt, timestamp-_downAt));
    }
  }

  /// Element string like ".-." classified by mark length.
  std::string elements() const {
    std::string result;
    for (size_t i=0; i<marks.size(); i++)
      result.push_back((marks[i].second < 2*kDit) ? '.' : '-');
    return result;
  }

  std::vector< std::pair<int64_t, int64_t> > marks;

protected:
  int64_t _downAt;
};

class KeyerEngineTest: public ::testing::Test
{
protected:
  KeyerEngineTest()
    : keyer(&recorder)
  {
    keyer.setTiming(20, 3, 0);
  }

  void useMode(KeyerMode mode) {
    keyer.setMode(mode, 0);
  }

  KeyRecorder recorder;
  KeyerEngine keyer;
};

TEST_F(KeyerEngineTest, StraightMirrorsContact) {
  useMode(KEYER_STRAIGHT);
  keyer.paddle(PADDLE_DIT, true, 1000);
  keyer.tick(500000);
  EXPECT_TRUE(keyer.isKeyDown());
  keyer.paddle(PADDLE_DIT, false, 701000);

  ASSERT_EQ(1u, recorder.marks.size());
  EXPECT_EQ(1000, recorder.marks[0].first);
  EXPECT_EQ(700000, recorder.marks[0].second);
}

TEST_F(KeyerEngineTest, BugRepeatsDitsAndKeysDahManually) {
  useMode(KEYER_BUG);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DIT, false, 250000);
  keyer.tick(400000);

  ASSERT_EQ(3u, recorder.marks.size());
  EXPECT_EQ(0, recorder.marks[0].first);
  EXPECT_EQ(120000, recorder.marks[1].first);
  EXPECT_EQ(240000, recorder.marks[2].first);
  for (size_t i=0; i<3; i++)
    EXPECT_EQ(kDit, recorder.marks[i].second);

  keyer.paddle(PADDLE_DAH, true, 500000);
  keyer.tick(800000);
  keyer.paddle(PADDLE_DAH, false, 900000);
  ASSERT_EQ(4u, recorder.marks.size());
  EXPECT_EQ(500000, recorder.marks[3].first);
  EXPECT_EQ(400000, recorder.marks[3].second);
}

TEST_F(KeyerEngineTest, ElectricBugTimesDahs) {
  useMode(KEYER_ELECTRIC_BUG);
  keyer.paddle(PADDLE_DAH, true, 0);
  keyer.paddle(PADDLE_DAH, false, 300000);
  keyer.tick(1000000);

  ASSERT_EQ(2u, recorder.marks.size());
  EXPECT_EQ(kDah, recorder.marks[0].second);
  EXPECT_EQ(240000, recorder.marks[1].first);
  EXPECT_EQ(kDah, recorder.marks[1].second);
}

TEST_F(KeyerEngineTest, SingleDotSendsOneDitPerPress) {
  useMode(KEYER_SINGLE_DOT);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.tick(500000);
  keyer.paddle(PADDLE_DIT, false, 500000);
  keyer.tick(600000);
  ASSERT_EQ(1u, recorder.marks.size());
  EXPECT_EQ(kDit, recorder.marks[0].second);

  // a short tap still gives a full dit
  keyer.paddle(PADDLE_DIT, true, 600000);
  keyer.paddle(PADDLE_DIT, false, 610000);
  keyer.tick(1000000);
  ASSERT_EQ(2u, recorder.marks.size());
  EXPECT_EQ(600000, recorder.marks[1].first);
  EXPECT_EQ(kDit, recorder.marks[1].second);
}

TEST_F(KeyerEngineTest, UltimaticLastPressedWins) {
  useMode(KEYER_ULTIMATIC);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 30000);
  keyer.paddle(PADDLE_DAH, false, 400000);
  keyer.tick(650000);
  keyer.paddle(PADDLE_DIT, false, 650000);
  keyer.tick(2000000);

  EXPECT_EQ(".--.", recorder.elements());
  EXPECT_EQ(120000, recorder.marks[1].first);
  EXPECT_EQ(360000, recorder.marks[2].first);
  EXPECT_EQ(600000, recorder.marks[3].first);
}

TEST_F(KeyerEngineTest, PlainIambicAlternatesWhileSqueezed) {
  useMode(KEYER_PLAIN_IAMBIC);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 10000);
  keyer.paddle(PADDLE_DIT, false, 500000);
  keyer.paddle(PADDLE_DAH, false, 500000);
  keyer.tick(2000000);

  EXPECT_EQ(".-.-", recorder.elements());
  EXPECT_EQ(480000, recorder.marks[3].first);
}

TEST_F(KeyerEngineTest, IambicAStopsAfterCurrentElement) {
  useMode(KEYER_IAMBIC_A);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 10000);
  keyer.paddle(PADDLE_DIT, false, 30000);
  keyer.paddle(PADDLE_DAH, false, 30000);
  keyer.tick(1000000);
  EXPECT_EQ(".", recorder.elements());

  // the same holds for a squeeze that starts with a dah
  recorder.marks.clear();
  keyer.paddle(PADDLE_DAH, true, 2000000);
  keyer.paddle(PADDLE_DIT, true, 2050000);
  keyer.paddle(PADDLE_DIT, false, 2100000);
  keyer.paddle(PADDLE_DAH, false, 2100000);
  keyer.tick(3000000);
  EXPECT_EQ("-", recorder.elements());
}

TEST_F(KeyerEngineTest, IambicBAppendsOneOppositeElement) {
  useMode(KEYER_IAMBIC_B);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 10000);
  keyer.paddle(PADDLE_DIT, false, 30000);
  keyer.paddle(PADDLE_DAH, false, 30000);
  keyer.tick(1000000);

  EXPECT_EQ(".-", recorder.elements());
  EXPECT_EQ(120000, recorder.marks[1].first);
}

TEST_F(KeyerEngineTest, IambicBAppendsDitAfterSqueezedDah) {
  useMode(KEYER_IAMBIC_B);
  keyer.paddle(PADDLE_DAH, true, 0);
  keyer.paddle(PADDLE_DIT, true, 50000);
  keyer.paddle(PADDLE_DIT, false, 100000);
  keyer.paddle(PADDLE_DAH, false, 100000);
  keyer.tick(1000000);

  EXPECT_EQ("-.", recorder.elements());
}

TEST_F(KeyerEngineTest, IambicContinuesSqueezeAfterRelease) {
  // a release and re-squeeze before the boundary behaves like a continuous squeeze
  useMode(KEYER_IAMBIC_B);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 10000);
  keyer.paddle(PADDLE_DAH, false, 20000);
  keyer.paddle(PADDLE_DAH, true, 40000);
  keyer.paddle(PADDLE_DIT, false, 130000);
  keyer.paddle(PADDLE_DAH, false, 130000);
  keyer.tick(1000000);

  EXPECT_EQ(".-.", recorder.elements());
}

TEST_F(KeyerEngineTest, DitMemory) {
  KeyerMode modes[] = { KEYER_PLAIN_IAMBIC, KEYER_IAMBIC_A, KEYER_IAMBIC_B };
  const char *expected[] = { "-", "-", "-." };
  for (int i=0; i<3; i++) {
    recorder.marks.clear();
    keyer.setMode(modes[i], 0);
    int64_t t = 10000000*(i+1);
    keyer.paddle(PADDLE_DAH, true, t);
    keyer.paddle(PADDLE_DIT, true, t+50000);
    keyer.paddle(PADDLE_DIT, false, t+70000);
    keyer.paddle(PADDLE_DAH, false, t+100000);
    keyer.tick(t+1000000);
    EXPECT_EQ(expected[i], recorder.elements()) << keyerModeName(modes[i]);
  }
}

TEST_F(KeyerEngineTest, DitMemoryWhileDahHeld) {
  KeyerMode modes[] = { KEYER_PLAIN_IAMBIC, KEYER_IAMBIC_A, KEYER_IAMBIC_B };
  const char *expected[] = { "--", "-.", "-." };
  for (int i=0; i<3; i++) {
    recorder.marks.clear();
    keyer.setMode(modes[i], 0);
    int64_t t = 10000000*(i+1);
    keyer.paddle(PADDLE_DAH, true, t);
    keyer.paddle(PADDLE_DIT, true, t+50000);
    keyer.paddle(PADDLE_DIT, false, t+70000);
    keyer.paddle(PADDLE_DAH, false, t+250000);
    keyer.tick(t+1000000);
    EXPECT_EQ(expected[i], recorder.elements()) << keyerModeName(modes[i]);
  }
}

TEST_F(KeyerEngineTest, SqueezeStartingWithDah) {
  // squeeze held into the second element, released during it
  KeyerMode modes[] = { KEYER_PLAIN_IAMBIC, KEYER_IAMBIC_A, KEYER_IAMBIC_B };
  const char *expected[] = { "-.", "-.", "-.-" };
  for (int i=0; i<3; i++) {
    recorder.marks.clear();
    keyer.setMode(modes[i], 0);
    int64_t t = 10000000*(i+1);
    keyer.paddle(PADDLE_DAH, true, t);
    keyer.paddle(PADDLE_DIT, true, t+50000);
    keyer.paddle(PADDLE_DIT, false, t+250000);
    keyer.paddle(PADDLE_DAH, false, t+250000);
    keyer.tick(t+1000000);
    EXPECT_EQ(expected[i], recorder.elements()) << keyerModeName(modes[i]);
    ASSERT_EQ(std::string(expected[i]).size(), recorder.marks.size());
    EXPECT_EQ(t+240000, recorder.marks[1].first);
  }
}

TEST_F(KeyerEngineTest, SqueezeDuringSpace) {
  // the dah closes after the dit mark ended, both open before the space ends
  KeyerMode modes[] = { KEYER_PLAIN_IAMBIC, KEYER_IAMBIC_A, KEYER_IAMBIC_B };
  const char *expected[] = { ".", ".", ".-" };
  for (int i=0; i<3; i++) {
    recorder.marks.clear();
    keyer.setMode(modes[i], 0);
    int64_t t = 10000000*(i+1);
    keyer.paddle(PADDLE_DIT, true, t);
    keyer.paddle(PADDLE_DAH, true, t+80000);
    keyer.paddle(PADDLE_DIT, false, t+100000);
    keyer.paddle(PADDLE_DAH, false, t+100000);
    keyer.tick(t+1000000);
    EXPECT_EQ(expected[i], recorder.elements()) << keyerModeName(modes[i]);
  }
}

TEST_F(KeyerEngineTest, KeyaheadBuffersTapDuringElement) {
  useMode(KEYER_KEYAHEAD);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DIT, false, 20000);
  keyer.paddle(PADDLE_DAH, true, 30000);
  keyer.paddle(PADDLE_DAH, false, 40000);
  keyer.tick(1000000);

  EXPECT_EQ(".-", recorder.elements());
  EXPECT_EQ(120000, recorder.marks[1].first);

  // the same taps are lost without lookahead
  recorder.marks.clear();
  keyer.setMode(KEYER_PLAIN_IAMBIC, 2000000);
  keyer.paddle(PADDLE_DIT, true, 2000000);
  keyer.paddle(PADDLE_DIT, false, 2020000);
  keyer.paddle(PADDLE_DAH, true, 2030000);
  keyer.paddle(PADDLE_DAH, false, 2040000);
  keyer.tick(3000000);
  EXPECT_EQ(".", recorder.elements());
}

TEST_F(KeyerEngineTest, KeyaheadBuffersRepeatedTaps) {
  useMode(KEYER_KEYAHEAD);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DIT, false, 10000);
  keyer.paddle(PADDLE_DIT, true, 20000);
  keyer.paddle(PADDLE_DIT, false, 30000);
  keyer.tick(1000000);

  EXPECT_EQ("..", recorder.elements());
}

TEST_F(KeyerEngineTest, SpeedChangeAppliesToNextElement) {
  useMode(KEYER_IAMBIC_A);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.tick(30000);
  keyer.setTiming(10, 3, 0);
  keyer.tick(200000);
  keyer.paddle(PADDLE_DIT, false, 200000);
  keyer.tick(1000000);

  ASSERT_EQ(2u, recorder.marks.size());
  EXPECT_EQ(kDit, recorder.marks[0].second);
  EXPECT_EQ(120000, recorder.marks[1].first);
  EXPECT_EQ(120000, recorder.marks[1].second);
}

TEST_F(KeyerEngineTest, WeightingKeepsElementPeriod) {
  useMode(KEYER_IAMBIC_A);
  keyer.setTiming(20, 3, 20);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DIT, false, 130000);
  keyer.tick(1000000);

  ASSERT_EQ(2u, recorder.marks.size());
  EXPECT_EQ(72000, recorder.marks[0].second);
  EXPECT_EQ(120000, recorder.marks[1].first);
}

TEST_F(KeyerEngineTest, RatioScalesDah) {
  useMode(KEYER_IAMBIC_A);
  keyer.setTiming(20, 4, 0);
  keyer.paddle(PADDLE_DAH, true, 0);
  keyer.paddle(PADDLE_DAH, false, 10000);
  keyer.tick(1000000);

  ASSERT_EQ(1u, recorder.marks.size());
  EXPECT_EQ(240000, recorder.marks[0].second);
}

TEST_F(KeyerEngineTest, SwapExchangesPaddles) {
  useMode(KEYER_IAMBIC_A);
  keyer.setSwapPaddles(true);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DIT, false, 10000);
  keyer.tick(1000000);

  EXPECT_EQ("-", recorder.elements());
}

TEST_F(KeyerEngineTest, ModeChangeReleasesKey) {
  useMode(KEYER_IAMBIC_A);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.setMode(KEYER_STRAIGHT, 30000);

  EXPECT_FALSE(keyer.isKeyDown());
  EXPECT_EQ(KeyerEngine::ELEMENT_NONE, keyer.current());
  ASSERT_EQ(1u, recorder.marks.size());
  EXPECT_EQ(30000, recorder.marks[0].second);

  keyer.tick(1000000);
  EXPECT_EQ(1u, recorder.marks.size());
}

TEST_F(KeyerEngineTest, ReleaseStopsRepeating) {
  useMode(KEYER_IAMBIC_B);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 0);
  keyer.release(200000);
  keyer.tick(2000000);

  EXPECT_FALSE(keyer.isKeyDown());
  EXPECT_EQ(-1, keyer.nextDeadline());
  // dit, dah in progress at release, then the bonus dit
  EXPECT_EQ(".-.", recorder.elements());
}

TEST_F(KeyerEngineTest, OneElementAtATime) {
  useMode(KEYER_PLAIN_IAMBIC);
  keyer.paddle(PADDLE_DIT, true, 0);
  keyer.paddle(PADDLE_DAH, true, 5000);
  keyer.tick(3000000);
  keyer.paddle(PADDLE_DIT, false, 3000000);
  keyer.paddle(PADDLE_DAH, false, 3000000);
  keyer.tick(4000000);

  for (size_t i=1; i<recorder.marks.size(); i++) {
    int64_t previousEnd = recorder.marks[i-1].first + recorder.marks[i-1].second;
    EXPECT_EQ(previousEnd + kDit, recorder.marks[i].first);
  }
}

}
