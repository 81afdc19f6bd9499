#include "interfaces.hh"

KeyListener::KeyListener() {
  // pass...
}

KeyListener::~KeyListener() {
  // pass...
}

CharacterHandler::CharacterHandler() {
  // pass...
}

CharacterHandler::~CharacterHandler() {
  // pass...
}

Sink::Sink() {
  // pass...
}

Sink::~Sink() {
  // pass...
}

Source::Source() {
  // pass...
}

Source::~Source() {
  // pass...
}
