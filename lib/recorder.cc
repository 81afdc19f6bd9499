#include "recorder.hh"
#include <algorithm>
#include <cstring>


TestRecorder::TestRecorder(size_t capacity)
  : Sink(), Source(), _buffer(capacity), _recording(false), _count(0), _playing(false),
    _position(0)
{
  // pass...
}

TestRecorder::~TestRecorder() {
  // pass...
}

void
TestRecorder::startRecording() {
  _playing.store(false);
  _recording.store(false);
  _count.store(0);
  _recording.store(true);
}

void
TestRecorder::stopRecording() {
  _recording.store(false);
}

bool
TestRecorder::isRecording() const {
  return _recording.load();
}

void
TestRecorder::startPlayback() {
  _recording.store(false);
  _position.store(0);
  _playing.store(true);
}

void
TestRecorder::stopPlayback() {
  _playing.store(false);
}

bool
TestRecorder::isPlaying() const {
  return _playing.load();
}

size_t
TestRecorder::capacity() const {
  return _buffer.size();
}

size_t
TestRecorder::samplesRecorded() const {
  return _count.load();
}

double
TestRecorder::duration(double sampleRate) const {
  return double(samplesRecorded())/sampleRate;
}

float
TestRecorder::progress() const {
  size_t total = _count.load();
  if (0 == total)
    return 0;
  return std::min(1.f, float(_position.load())/total);
}

void
TestRecorder::write(const float *samples, int64_t nsamples) {
  if (! _recording.load(std::memory_order_acquire))
    return;

  size_t count = _count.load(std::memory_order_acquire);
  size_t n = std::min(size_t(nsamples), _buffer.size()-count);
  memcpy(_buffer.data()+count, samples, n*sizeof(float));
  // a restart from the control thread in the meantime wins
  if (_count.compare_exchange_strong(count, count+n, std::memory_order_acq_rel)
      && (_buffer.size() == count+n))
    _recording.store(false, std::memory_order_release);
}

void
TestRecorder::read(float *samples, int64_t nsamples) {
  size_t n = 0;
  if (_playing.load(std::memory_order_acquire)) {
    size_t total = _count.load(std::memory_order_acquire);
    size_t pos = _position.load(std::memory_order_relaxed);
    n = std::min(size_t(nsamples), (pos < total) ? total-pos : 0);
    memcpy(samples, _buffer.data()+pos, n*sizeof(float));
    _position.store(pos+n, std::memory_order_release);
    if (pos+n >= total)
      _playing.store(false, std::memory_order_release);
  }
  memset(samples+n, 0, (size_t(nsamples)-n)*sizeof(float));
}
