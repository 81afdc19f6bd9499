#include "midi.hh"
#include <algorithm>
#include <cmath>

#define CC_MODE 0x00
#define CC_DIT_DURATION 0x01
#define CC_SIDETONE_NOTE 0x02
#define MODE_MIDI 0x00


bool
parseMidiMessage(const MidiMessage &message, MidiEvent &event) {
  if (message.empty())
    return false;

  switch (message[0] & 0xf0) {
  case 0x90:
    if (message.size() < 3)
      return false;
    event.type = (message[2] > 0) ? MidiEvent::NOTE_ON : MidiEvent::NOTE_OFF;
    event.number = message[1];
    event.value = message[2];
    return true;
  case 0x80:
    if (message.size() < 2)
      return false;
    event.type = MidiEvent::NOTE_OFF;
    event.number = message[1];
    event.value = 0;
    return true;
  case 0xb0:
    if (message.size() < 3)
      return false;
    event.type = MidiEvent::CONTROL_CHANGE;
    event.number = message[1];
    event.value = message[2];
    return true;
  default:
    break;
  }
  return false;
}

Paddle
paddleForNote(unsigned char note) {
  if ((1 == note) || (61 == note))
    return PADDLE_DIT;
  return PADDLE_DAH;
}

MidiMessage
midiModeMessage() {
  MidiMessage msg;
  msg.push_back(0xb0); msg.push_back(CC_MODE); msg.push_back(MODE_MIDI);
  return msg;
}

MidiMessage
keyerProgramMessage(unsigned char program) {
  MidiMessage msg;
  msg.push_back(0xc0); msg.push_back(std::min<unsigned char>(program, 9));
  return msg;
}

MidiMessage
ditDurationMessage(float wpm) {
  int ditMs = int(1200/std::max(5.f, wpm));
  MidiMessage msg;
  msg.push_back(0xb0); msg.push_back(CC_DIT_DURATION);
  msg.push_back((unsigned char)(std::min(127, ditMs/2)));
  return msg;
}

MidiMessage
sidetoneNoteMessage(float frequency) {
  MidiMessage msg;
  msg.push_back(0xb0); msg.push_back(CC_SIDETONE_NOTE);
  msg.push_back(midiNoteForFrequency(frequency));
  return msg;
}

unsigned char
midiNoteForFrequency(float frequency) {
  if (frequency <= 0)
    return 0;
  double note = std::round(69 + 12*std::log2(frequency/440.));
  return (unsigned char)(std::max(0., std::min(127., note)));
}
