#ifndef CWMIX_KEYERLOOP_HH
#define CWMIX_KEYERLOOP_HH

#include "channel.hh"
#include "decoder.hh"
#include "keyer.hh"
#include "sidetone.hh"
#include <atomic>
#include <string>
#include <thread>


/** Keyer settings applied on the keyer thread. */
struct KeyerConfig
{
  KeyerMode mode;
  float wpm;
  float ratio;
  float weighting;
  bool swap;

  KeyerConfig();
};

/** Paddle contacts and commands for the keyer thread. */
struct InputEvent
{
  typedef enum { PADDLE, CONFIGURE, CLEAR, RELEASE } Type;

  Type type;
  Paddle paddle;
  bool down;
  int64_t timestamp;
  KeyerConfig config;

  InputEvent();
};

/** Key transitions and decoded characters leaving the keyer thread. */
struct OutputEvent
{
  typedef enum { KEY, DECODED } Type;

  Type type;
  bool down;
  std::string character;
  float wpm;
  int64_t timestamp;

  OutputEvent();
};


/** Owns the keyer engine and the decoder and drives both from one thread.
 *
 * Every key transition of the keyer is delivered in order to the shared key state of the
 * mixer, to the decoder and to the outgoing event channel. Producers on other threads
 * only talk to the loop through the bounded input channel. The keyer thread never waits
 * for the consumer: events that do not fit into the outgoing channel are dropped and
 * counted. A stopped loop cannot be started again. */
class KeyerLoop: public KeyListener, public CharacterHandler
{
public:
  explicit KeyerLoop(KeyState &key, size_t capacity=256);
  virtual ~KeyerLoop();

  void start();
  void stop();
  bool isRunning() const;

  bool paddle(Paddle paddle, bool down);
  bool configure(const KeyerConfig &config);
  bool clearText();
  bool release();

  /** Takes the next outgoing event without waiting. */
  bool pollEvent(OutputEvent &event);
  /** Number of outgoing events dropped on a full channel. */
  unsigned long dropped() const;

  /** Applies a single input event, called by the thread or directly by tests. */
  void process(const InputEvent &event);
  /** Lets elements expire and flushes idle characters. */
  void advance(int64_t now);

  const KeyerEngine &engine() const;
  const CWDecoder &decoder() const;

  /** Monotonic time in microseconds. */
  static int64_t now();

  void keyChanged(bool down, int64_t timestamp);
  void handle(const std::string &character, float wpm);

protected:
  bool post(const InputEvent &event);
  void deliver(const OutputEvent &event);
  void run();

protected:
  KeyState &_key;
  KeyerConfig _config;
  KeyerEngine _engine;
  CWDecoder _decoder;
  Channel<InputEvent> _input;
  Channel<OutputEvent> _output;
  std::thread _worker;
  std::atomic<bool> _running;
  int64_t _lastIdleCheck;
  std::atomic<unsigned long> _dropped;
  bool _overflow;
};

#endif // CWMIX_KEYERLOOP_HH
