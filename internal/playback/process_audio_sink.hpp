#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audio_sink.hpp"

namespace localdeck::playback {

/*
  Plays through an external player process reading the payload on stdin.

  Start forks the configured command with one end of a socket pair as its
  stdin; a feeder thread streams the payload into the other end and a
  watcher thread reaps the child. Stop sends SIGTERM, then SIGKILL once
  stop_timeout has elapsed.
*/
class ProcessAudioSink final : public AudioSink {
 public:
  ProcessAudioSink(std::vector<std::string> command, std::chrono::milliseconds stop_timeout);
  ~ProcessAudioSink() override;

  ProcessAudioSink(const ProcessAudioSink&)            = delete;
  ProcessAudioSink& operator=(const ProcessAudioSink&) = delete;

  void Start(std::shared_ptr<arrow::io::RandomAccessFile> stream, const localdeck::storage::ContentEntry& entry,
             FinishedCallback on_finished) override;

  void Stop() override;

  // Pid of the running player, -1 when idle.
  pid_t ActivePid() const;

 private:
  struct Session {
    pid_t                   pid = -1;
    std::mutex              mutex;
    std::condition_variable exited_cv;
    bool                    stop_requested = false;
    bool                    exited         = false;
    int                     exit_code      = 0;
    std::thread             feeder;
    std::thread             watcher;
  };

  static void Feed(Session* session, std::shared_ptr<arrow::io::RandomAccessFile> stream, int fd);
  static void Watch(Session* session, FinishedCallback on_finished);

  void StopSession(Session& session);

  const std::vector<std::string> command_;
  const std::chrono::milliseconds stop_timeout_;

  mutable std::mutex       mutex_;
  std::unique_ptr<Session> session_;
};

} // namespace localdeck::playback
