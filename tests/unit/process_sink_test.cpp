#include <arrow/io/memory.h>

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include "internal/playback/process_audio_sink.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using localdeck::playback::ProcessAudioSink;
using localdeck::testing::MakeBuffer;
using localdeck::testing::Mp3Bytes;

std::shared_ptr<arrow::io::RandomAccessFile> StreamOf(const std::string& bytes) {
  return std::make_shared<arrow::io::BufferReader>(MakeBuffer(bytes));
}

localdeck::storage::ContentEntry EntryOf(const std::string& bytes) {
  return localdeck::storage::ContentEntry{"test-ref", bytes.size(), "mp3"};
}

void TestPlayerReadsToEndAndFinishes() {
  ProcessAudioSink sink({"/bin/sh", "-c", "cat >/dev/null"}, std::chrono::seconds(2));

  // larger than a socket buffer so the feeder has to loop
  const auto bytes = Mp3Bytes(std::string(1024 * 1024, 'x'));

  std::promise<void> finished;
  auto               done = finished.get_future();
  sink.Start(StreamOf(bytes), EntryOf(bytes), [&finished] { finished.set_value(); });

  assert(done.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
  sink.Stop();
  assert(sink.ActivePid() == -1);
}

void TestStopTerminatesPlayerWithoutCallback() {
  ProcessAudioSink sink({"sleep", "30"}, std::chrono::seconds(2));

  bool       fired = false;
  const auto bytes = Mp3Bytes("short");
  sink.Start(StreamOf(bytes), EntryOf(bytes), [&fired] { fired = true; });
  assert(sink.ActivePid() > 0);

  const auto begin = std::chrono::steady_clock::now();
  sink.Stop();
  assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
  assert(sink.ActivePid() == -1);
  assert(!fired);

  sink.Stop();
}

void TestStubbornPlayerIsKilled() {
  ProcessAudioSink sink({"/bin/sh", "-c", "trap '' TERM; exec sleep 30"}, std::chrono::milliseconds(200));

  const auto bytes = Mp3Bytes("stubborn");
  sink.Start(StreamOf(bytes), EntryOf(bytes), nullptr);
  // let the shell install its trap before signalling
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const auto begin = std::chrono::steady_clock::now();
  sink.Stop();
  assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));
  assert(sink.ActivePid() == -1);
}

void TestStartReplacesRunningPlayer() {
  ProcessAudioSink sink({"sleep", "30"}, std::chrono::seconds(2));

  int        callbacks = 0;
  const auto bytes     = Mp3Bytes("one");
  sink.Start(StreamOf(bytes), EntryOf(bytes), [&callbacks] { ++callbacks; });
  const auto first = sink.ActivePid();

  sink.Start(StreamOf(bytes), EntryOf(bytes), [&callbacks] { ++callbacks; });
  const auto second = sink.ActivePid();

  assert(first > 0 && second > 0);
  assert(first != second);
  sink.Stop();
  assert(callbacks == 0);
}

void TestMissingPlayerFailsStart() {
  ProcessAudioSink sink({"/nonexistent/localdeck-player"}, std::chrono::seconds(1));

  const auto bytes = Mp3Bytes("nothing");
  bool       threw = false;
  try {
    sink.Start(StreamOf(bytes), EntryOf(bytes), nullptr);
  } catch (const std::system_error&) {
    threw = true;
  }
  assert(threw);
  assert(sink.ActivePid() == -1);
}

void TestEmptyCommandIsRejected() {
  bool threw = false;
  try {
    ProcessAudioSink sink({}, std::chrono::seconds(1));
  } catch (const localdeck::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlayerReadsToEndAndFinishes();
  TestStopTerminatesPlayerWithoutCallback();
  TestStubbornPlayerIsKilled();
  TestStartReplacesRunningPlayer();
  TestMissingPlayerFailsStart();
  TestEmptyCommandIsRejected();

  std::cout << "localdeck_unit_process_sink: pass\n";
  return 0;
}
