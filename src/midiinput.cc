#include "midiinput.hh"
#include "midi.hh"
#include <QDebug>


MidiInput::MidiInput(KeyerLoop &keyer, QObject *parent)
  : QObject(parent), _keyer(keyer), _in(nullptr), _out(nullptr), _name(), _watchdog()
{
  _watchdog.setInterval(1000);
  connect(&_watchdog, SIGNAL(timeout()), this, SLOT(checkConnection()));
}

MidiInput::~MidiInput() {
  closePorts();
}

std::vector<std::string>
MidiInput::devices() {
  std::vector<std::string> names;
  try {
    RtMidiIn midi(RtMidi::UNSPECIFIED, "cwmix list");
    for (unsigned int i=0; i<midi.getPortCount(); i++)
      names.push_back(midi.getPortName(i));
  } catch (RtMidiError &e) {
    qDebug() << "Error: Cannot list MIDI devices:" << e.getMessage().c_str();
  }
  return names;
}

bool
MidiInput::isConnected() const {
  return nullptr != _in;
}

const std::string &
MidiInput::deviceName() const {
  return _name;
}

bool
MidiInput::connectDevice(const std::string &name, Error &err) {
  if (isConnected())
    disconnectDevice();

  try {
    _in = new RtMidiIn(RtMidi::UNSPECIFIED, "cwmix input");
    unsigned int port = _in->getPortCount();
    for (unsigned int i=0; i<_in->getPortCount(); i++) {
      if (name == _in->getPortName(i)) {
        port = i;
        break;
      }
    }
    if (port == _in->getPortCount()) {
      delete _in; _in = nullptr;
      err.set(Error::INPUT_SOURCE, "MIDI input device '" + name + "' not found");
      qDebug() << "Error:" << err.message().c_str();
      return false;
    }
    _in->setCallback(&MidiInput::_midi_callback, this);
    _in->setErrorCallback(&MidiInput::_midi_error_callback, this);
    _in->ignoreTypes(true, true, true);
    _in->openPort(port, "cwmix-input");
  } catch (RtMidiError &e) {
    delete _in; _in = nullptr;
    err.set(Error::INPUT_SOURCE, "Cannot connect MIDI input: " + e.getMessage());
    qDebug() << "Error:" << err.message().c_str();
    return false;
  }
  _name = name;

  try {
    _out = new RtMidiOut(RtMidi::UNSPECIFIED, "cwmix output");
    unsigned int port = _out->getPortCount();
    for (unsigned int i=0; i<_out->getPortCount(); i++) {
      if (name == _out->getPortName(i)) {
        port = i;
        break;
      }
    }
    if (port == _out->getPortCount()) {
      qDebug() << "Warning: MIDI output port" << name.c_str() << "not found.";
      delete _out; _out = nullptr;
    } else {
      _out->openPort(port, "cwmix-output");
      MidiMessage mode = midiModeMessage();
      _out->sendMessage(&mode);
    }
  } catch (RtMidiError &e) {
    qDebug() << "Warning: Could not connect MIDI output:" << e.getMessage().c_str();
    delete _out; _out = nullptr;
  }

  qDebug() << "MIDI device connected:" << name.c_str();
  _watchdog.start();
  emit statusChanged(true);
  return true;
}

void
MidiInput::closePorts() {
  _watchdog.stop();
  if (_in) {
    _in->cancelCallback();
    _in->closePort();
    delete _in; _in = nullptr;
  }
  if (_out) {
    _out->closePort();
    delete _out; _out = nullptr;
  }
  _name.clear();
}

void
MidiInput::disconnectDevice() {
  if (! isConnected())
    return;
  closePorts();
  // an absent input is an idle input
  _keyer.release();
  qDebug() << "MIDI device disconnected.";
  emit statusChanged(false);
}

void
MidiInput::checkConnection() {
  if (! isConnected())
    return;
  std::vector<std::string> names = devices();
  for (size_t i=0; i<names.size(); i++) {
    if (_name == names[i])
      return;
  }
  qDebug() << "Error: MIDI device" << _name.c_str() << "went away.";
  disconnectDevice();
}

void
MidiInput::sync(const Settings &settings) {
  if (nullptr == _out)
    return;
  try {
    MidiMessage msg = keyerProgramMessage(KEYER_PROGRAM_PASSTHROUGH);
    _out->sendMessage(&msg);
    msg = ditDurationMessage(settings.wpm);
    _out->sendMessage(&msg);
    msg = sidetoneNoteMessage(settings.sidetoneFrequency);
    _out->sendMessage(&msg);
  } catch (RtMidiError &e) {
    qDebug() << "Warning: Cannot sync settings to MIDI device:" << e.getMessage().c_str();
  }
}

void
MidiInput::_midi_callback(double timeStamp, std::vector<unsigned char> *message, void *userData) {
  Q_UNUSED(timeStamp);
  MidiInput *self = reinterpret_cast<MidiInput *>(userData);
  MidiEvent event;
  if ((nullptr == message) || (! parseMidiMessage(*message, event)))
    return;

  if (MidiEvent::CONTROL_CHANGE == event.type) {
    qDebug() << "MIDI CC" << int(event.number) << "=" << int(event.value);
    return;
  }
  self->_keyer.paddle(paddleForNote(event.number), MidiEvent::NOTE_ON == event.type);
}

void
MidiInput::_midi_error_callback(RtMidiError::Type type, const std::string &errorText,
                                void *userData)
{
  qDebug() << "Warning: MIDI error" << int(type) << errorText.c_str();
  QMetaObject::invokeMethod(reinterpret_cast<MidiInput *>(userData), "checkConnection",
                            Qt::QueuedConnection);
}
