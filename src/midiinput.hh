#ifndef CWMIX_MIDIINPUT_HH
#define CWMIX_MIDIINPUT_HH

#include <QObject>
#include <QTimer>
#include <RtMidi.h>
#include <string>
#include <vector>
#include "error.hh"
#include "keyerloop.hh"
#include "settings.hh"


/** Paddle input from a MIDI keyer adapter. Note events become paddle contacts of the keyer
 * loop, settings are mirrored to the adapter when its output port is available. */
class MidiInput: public QObject
{
  Q_OBJECT

public:
  explicit MidiInput(KeyerLoop &keyer, QObject *parent=nullptr);
  virtual ~MidiInput();

  static std::vector<std::string> devices();

  bool connectDevice(const std::string &name, Error &err);
  bool isConnected() const;
  const std::string &deviceName() const;
  void sync(const Settings &settings);

public slots:
  void disconnectDevice();
  /** Drops the connection if the port went away. */
  void checkConnection();

signals:
  void statusChanged(bool connected);

protected:
  void closePorts();

  static void _midi_callback(double timeStamp, std::vector<unsigned char> *message, void *userData);
  static void _midi_error_callback(RtMidiError::Type type, const std::string &errorText,
                                   void *userData);

protected:
  KeyerLoop &_keyer;
  RtMidiIn *_in;
  RtMidiOut *_out;
  std::string _name;
  QTimer _watchdog;
};

#endif // CWMIX_MIDIINPUT_HH
