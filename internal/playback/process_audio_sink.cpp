#include "process_audio_sink.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace localdeck::playback {

using localdeck::observability::IntField;
using localdeck::observability::StringField;

namespace {

constexpr int64_t kFeedChunkBytes = 64 * 1024;
constexpr int     kExecFailed     = 127;

void CloseFd(int fd) {
  if (fd >= 0 && ::close(fd) != 0 && errno != EINTR) {
    LOCALDECK_LOG_WARN("close failed", {IntField("fd", fd), IntField("errno", errno)});
  }
}

int ExitCodeFromStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

ProcessAudioSink::ProcessAudioSink(std::vector<std::string> command, std::chrono::milliseconds stop_timeout)
    : command_(std::move(command)), stop_timeout_(stop_timeout) {
  if (command_.empty() || command_.front().empty()) {
    throw localdeck::util::InvalidArgument("player command is empty");
  }
}

ProcessAudioSink::~ProcessAudioSink() {
  Stop();
}

void ProcessAudioSink::Start(std::shared_ptr<arrow::io::RandomAccessFile> stream, const localdeck::storage::ContentEntry& entry,
                             FinishedCallback on_finished) {
  if (!stream) {
    throw localdeck::util::InvalidArgument("no stream to play");
  }

  std::lock_guard lock(mutex_);
  if (session_) {
    StopSession(*session_);
    session_.reset();
  }

  // stdin is a socket so the feeder can write with MSG_NOSIGNAL
  int sockets[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockets) != 0) {
    throw std::system_error(errno, std::generic_category(), "player socketpair");
  }
  int exec_status[2];
  if (::pipe2(exec_status, O_CLOEXEC) != 0) {
    const int error = errno;
    CloseFd(sockets[0]);
    CloseFd(sockets[1]);
    throw std::system_error(error, std::generic_category(), "player status pipe");
  }

  std::vector<char*> argv;
  argv.reserve(command_.size() + 1);
  for (const auto& arg : command_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int error = errno;
    CloseFd(sockets[0]);
    CloseFd(sockets[1]);
    CloseFd(exec_status[0]);
    CloseFd(exec_status[1]);
    throw std::system_error(error, std::generic_category(), "fork player");
  }

  if (pid == 0) {
    ::dup2(sockets[1], STDIN_FILENO);
    ::execvp(argv[0], argv.data());
    const int error = errno;
    while (::write(exec_status[1], &error, sizeof(error)) < 0 && errno == EINTR) {
    }
    ::_exit(kExecFailed);
  }

  CloseFd(sockets[1]);
  CloseFd(exec_status[1]);

  // EOF here means exec succeeded; otherwise the child reports errno
  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(exec_status[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(exec_status[0]);

  if (n > 0) {
    CloseFd(sockets[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw std::system_error(child_errno, std::generic_category(), "start player '" + command_.front() + "'");
  }

  auto session     = std::make_unique<Session>();
  session->pid     = pid;
  session->feeder  = std::thread(&ProcessAudioSink::Feed, session.get(), std::move(stream), sockets[0]);
  session->watcher = std::thread(&ProcessAudioSink::Watch, session.get(), std::move(on_finished));
  session_         = std::move(session);

  LOCALDECK_LOG_INFO("player started", {IntField("pid", pid), StringField("content_ref", entry.content_ref), StringField("format", entry.format),
                                        IntField("bytes", static_cast<int64_t>(entry.byte_size))});
}

void ProcessAudioSink::Feed(Session* session, std::shared_ptr<arrow::io::RandomAccessFile> stream, int fd) {
  try {
    int64_t offset = 0;
    while (true) {
      {
        std::lock_guard lock(session->mutex);
        if (session->stop_requested) break;
      }

      auto chunk = localdeck::storage::common::Unwrap(stream->ReadAt(offset, kFeedChunkBytes));
      if (chunk->size() == 0) break;

      const uint8_t* data      = chunk->data();
      size_t         remaining = static_cast<size_t>(chunk->size());
      while (remaining > 0) {
        const ssize_t sent = ::send(fd, data, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
          if (errno == EINTR) continue;
          throw std::system_error(errno, std::generic_category(), "write to player");
        }
        data += sent;
        remaining -= static_cast<size_t>(sent);
      }
      offset += chunk->size();
    }
  } catch (const std::exception& e) {
    std::lock_guard lock(session->mutex);
    // a stopped or exited player closes its end; that is not worth a warning
    if (!session->stop_requested && !session->exited) {
      LOCALDECK_LOG_WARN("player feed interrupted", {IntField("pid", session->pid), StringField("error", e.what())});
    }
  }
  CloseFd(fd);
}

void ProcessAudioSink::Watch(Session* session, FinishedCallback on_finished) {
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(session->pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {
  }

  bool natural_end = false;
  int  exit_code   = 0;
  {
    std::lock_guard lock(session->mutex);
    // reap under the lock: Stop signals the pid only while it is unreaped
    int status = 0;
    while (::waitpid(session->pid, &status, 0) < 0 && errno == EINTR) {
    }
    session->exited    = true;
    session->exit_code = ExitCodeFromStatus(status);
    exit_code          = session->exit_code;
    natural_end        = !session->stop_requested;
  }
  session->exited_cv.notify_all();

  if (!natural_end) return;

  if (exit_code == 0) {
    LOCALDECK_LOG_INFO("player finished", {IntField("pid", session->pid)});
  } else {
    LOCALDECK_LOG_WARN("player exited with error", {IntField("pid", session->pid), IntField("exit_code", exit_code)});
  }
  if (on_finished) on_finished();
}

void ProcessAudioSink::StopSession(Session& session) {
  {
    std::unique_lock lock(session.mutex);
    session.stop_requested = true;
    if (!session.exited) {
      if (::kill(session.pid, SIGTERM) != 0) {
        LOCALDECK_LOG_WARN("SIGTERM failed", {IntField("pid", session.pid), IntField("errno", errno)});
      }
      if (!session.exited_cv.wait_for(lock, stop_timeout_, [&] { return session.exited; })) {
        LOCALDECK_LOG_WARN("player ignored SIGTERM; killing", {IntField("pid", session.pid)});
        if (::kill(session.pid, SIGKILL) != 0) {
          LOCALDECK_LOG_WARN("SIGKILL failed", {IntField("pid", session.pid), IntField("errno", errno)});
        }
        session.exited_cv.wait(lock, [&] { return session.exited; });
      }
    }
  }

  if (session.feeder.joinable()) session.feeder.join();
  if (session.watcher.joinable()) session.watcher.join();
}

void ProcessAudioSink::Stop() {
  std::lock_guard lock(mutex_);
  if (!session_) return;

  const pid_t pid = session_->pid;
  StopSession(*session_);
  session_.reset();
  LOCALDECK_LOG_INFO("player stopped", {IntField("pid", pid)});
}

pid_t ProcessAudioSink::ActivePid() const {
  std::lock_guard lock(mutex_);
  if (!session_) return -1;
  std::lock_guard session_lock(session_->mutex);
  return session_->exited ? -1 : session_->pid;
}

} // namespace localdeck::playback
