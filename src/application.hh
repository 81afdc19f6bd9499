#ifndef CWMIX_APPLICATION_HH
#define CWMIX_APPLICATION_HH

#include <QApplication>
#include <QString>
#include <QStringList>
#include <QTimer>
#include "audioengine.hh"
#include "keyerloop.hh"
#include "midiinput.hh"
#include "mixer.hh"
#include "settings.hh"


/** Snapshot of the test recorder for the control surface. */
struct TestRecordingState
{
  bool isRecording;
  bool isPlaying;
  size_t samplesRecorded;
  double sampleRate;
  double durationSeconds;
  float playbackProgress;
};


class Application : public QApplication
{
	Q_OBJECT

public:
	Application(int &argc, char *argv[]);
	virtual ~Application();

  QStringList midiDevices() const;
  bool connectMidiDevice(const QString &name, Error &err);
  bool isMidiConnected() const;

  /** Synthetic paddle contacts, as if sent by the keyer hardware. */
  void keyDown(bool isDit);
  void keyUp();
  /** Straight key contact. */
  void key(bool down);
  void ditKey(bool down);
  void daKey(bool down);

  static QStringList outputDevices();
  static QStringList inputDevices();
  bool startAudio(const QString &output, Error &err);
  bool startAudioWithDevices(const QString &output, const QString &input, Error &err);
  bool startAudioWithAllDevices(const QString &output, const QString &input,
                                const QString &local, Error &err);
  void stopAudio();
  bool isAudioRunning() const;

  bool updateSettings(const Settings &settings, Error &err);
  const Settings &settings() const;

  float micLevel() const;
  float outputLevel() const;

  bool startTestRecording(Error &err);
  void stopTestRecording();
  bool playTestRecording(const QString &device, Error &err);
  void stopTestPlayback();
  TestRecordingState testRecordingState() const;

public slots:
  void clearText();
  void disconnectMidiDevice();

signals:
  void cwDecoded(QString character, float wpm);
  void cwKey(bool down);
  void midiStatus(bool connected);
  void audioRunning(bool running);

protected slots:
  void onPollEvents();

protected:
  static Settings loadSettings();
  static void storeSettings(const Settings &settings);
  static KeyerConfig keyerConfig(const Settings &settings);

protected:
  Settings _settings;
  MixerParameters _params;
  Mixer _mixer;
  AudioEngine *_audio;
  KeyerLoop _keyer;
  MidiInput *_midi;
  QTimer _eventTimer;
};

#endif // CWMIX_APPLICATION_HH
