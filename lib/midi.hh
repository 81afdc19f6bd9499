#ifndef CWMIX_MIDI_HH
#define CWMIX_MIDI_HH

#include "traits.hh"
#include <vector>

typedef std::vector<unsigned char> MidiMessage;

/** Channel message as sent by the keyer adapter. */
struct MidiEvent
{
  typedef enum { NOTE_ON, NOTE_OFF, CONTROL_CHANGE } Type;

  Type type;
  unsigned char number;
  unsigned char value;
};

/** Decodes note on/off and control change messages, note on with velocity 0 is a note
 * off. Returns @c false for anything else. */
bool parseMidiMessage(const MidiMessage &message, MidiEvent &event);
/** Notes 1 and 61 are the dit paddle, everything else the dah paddle. */
Paddle paddleForNote(unsigned char note);

/** Selects MIDI reporting (instead of keyboard emulation) on the adapter. */
MidiMessage midiModeMessage();
/** Selects the adapter keyer, 0 reports the raw paddle contacts. */
MidiMessage keyerProgramMessage(unsigned char program);
/** Dit duration in 2ms units. */
MidiMessage ditDurationMessage(float wpm);
MidiMessage sidetoneNoteMessage(float frequency);

/** Nearest MIDI note number for a frequency. */
unsigned char midiNoteForFrequency(float frequency);

#define KEYER_PROGRAM_PASSTHROUGH 0

#endif // CWMIX_MIDI_HH
