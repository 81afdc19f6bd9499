#include "error.hh"

Error::Error()
  : _kind(NONE), _message()
{
  // pass...
}

bool
Error::isSet() const {
  return NONE != _kind;
}

Error::Kind
Error::kind() const {
  return _kind;
}

const std::string &
Error::message() const {
  return _message;
}

void
Error::set(Kind kind, const std::string &message) {
  _kind = kind;
  _message = message;
}

void
Error::clear() {
  _kind = NONE;
  _message.clear();
}

const char *
Error::kindName(Kind kind) {
  switch (kind) {
  case NONE: return "None";
  case DEVICE: return "DeviceError";
  case INPUT_SOURCE: return "InputSourceError";
  case DECODER_ANOMALY: return "DecoderAnomaly";
  case CONFIG: return "ConfigError";
  }
  return "Unknown";
}
