/* @file AudioProcess.cpp
 * @brief sound-file resolution, player discovery and the spawn / wait / terminate loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

// Reveille headers
#include "core/Logger.hpp"
#include "io/AudioProcess.hpp"

extern char** environ;

using namespace reveille::io;
namespace fs = std::filesystem;

namespace {

  constexpr const char* kTag = "audio";
  constexpr auto kPollStep = std::chrono::milliseconds{ 100 };
  constexpr auto kTermGrace = std::chrono::seconds{ 1 };

  std::optional<fs::path> findExecutable(const std::string& name) {
    const char* path = std::getenv("PATH");
    std::stringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
      if (dir.empty())
        continue;
      const fs::path candidate = fs::path(dir) / name;
      if (::access(candidate.c_str(), X_OK) == 0)
        return candidate;
    }
    return std::nullopt;
  }

  bool isRegularFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
  }

  // Reap \p pid if it has exited. True once the child is gone.
  bool reaped(pid_t pid, int& status) {
    for (;;) {
      const pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid)
        return true;
      if (r == 0)
        return false;
      if (errno == EINTR)
        continue;
      return true; // ECHILD: somebody else reaped it
    }
  }

} // namespace

AudioProcess::AudioProcess(fs::path soundsDirectory, std::shared_ptr<core::Logger> log)
    : dir_(std::move(soundsDirectory)), log_(std::move(log)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec)
    log_->warn(kTag, "Cannot create sounds directory " + dir_.string() + ": " + ec.message());
  else if (availableSounds().empty())
    log_->warn(kTag, "No alarm sounds found. Add audio files to " + dir_.string());

  worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

AudioProcess::~AudioProcess() {
  worker_.request_stop();
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

const std::vector<std::string>& AudioProcess::supportedExtensions() {
  static const std::vector<std::string> exts{ ".mp3", ".wav", ".ogg", ".flac" };
  return exts;
}

std::vector<std::string> AudioProcess::availableSounds() const {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    const auto ext = it->path().extension().string();
    const auto& exts = supportedExtensions();
    if (std::find(exts.begin(), exts.end(), ext) != exts.end())
      names.push_back(it->path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

// -------------------------------------------------------------------
// AudioProcess::resolve
//  1. <dir>/<sound>
//  2. <dir>/<sound><ext> for each supported extension
//  3. the alphabetically first available sound
// -------------------------------------------------------------------
std::optional<fs::path> AudioProcess::resolve(const std::string& sound) const {
  if (!sound.empty()) {
    if (const auto exact = dir_ / sound; isRegularFile(exact))
      return exact;
    for (const auto& ext : supportedExtensions()) {
      if (const auto withExt = dir_ / (sound + ext); isRegularFile(withExt))
        return withExt;
    }
  }

  const auto sounds = availableSounds();
  if (sounds.empty())
    return std::nullopt;
  return dir_ / sounds.front();
}

std::optional<std::vector<std::string>> AudioProcess::findPlayer() {
  static const std::vector<std::vector<std::string>> players{
    { "mpg123", "-q" },
    { "aplay" },
    { "paplay" },
    { "ffplay", "-nodisp", "-autoexit", "-loglevel", "quiet" },
  };
  for (const auto& argv : players) {
    if (findExecutable(argv.front()))
      return argv;
  }
  return std::nullopt;
}

bool AudioProcess::play(const std::string& sound, bool repeat) {
  const auto file = resolve(sound);
  if (!file) {
    log_->error(kTag, "Sound not found: " + sound);
    return false;
  }

  auto argv = findPlayer();
  if (!argv) {
    log_->warn(kTag, "No audio player found. Install mpg123, aplay, paplay or ffplay.");
    return false;
  }
  argv->push_back(file->string());

  {
    std::lock_guard lock(mtx_);
    ++generation_;
    pending_ = Request{ std::move(*argv), repeat };
  }
  cv_.notify_all();
  log_->info(kTag, std::string("Playing") + (repeat ? " (loop): " : ": ") +
                       file->filename().string());
  return true;
}

void AudioProcess::stop() {
  bool active = false;
  {
    std::lock_guard lock(mtx_);
    active = pending_.has_value() || child_ > 0;
    // bumped even when idle: the worker may have taken a request but not spawned yet
    ++generation_;
    pending_.reset();
  }
  cv_.notify_all();
  if (active)
    log_->debug(kTag, "Audio stop requested");
}

bool AudioProcess::playing() const {
  std::lock_guard lock(mtx_);
  return child_ > 0;
}

void AudioProcess::setVolume(int percent) {
  volume_ = std::clamp(percent, 0, 100);

  const auto amixer = findExecutable("amixer");
  if (!amixer) {
    log_->debug(kTag, "amixer not found, volume kept at " + std::to_string(volume_) + "%");
    return;
  }
  const pid_t pid =
      spawn({ amixer->string(), "-q", "sset", "Master", std::to_string(volume_) + "%" });
  if (pid < 0)
    return;

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
    log_->info(kTag, "Volume set to " + std::to_string(volume_) + "%");
  else
    log_->debug(kTag, "amixer could not set the volume");
}

// -------------------------------------------------------------------
// AudioProcess::run  (worker thread)
// Takes the latest request and plays it. A newer play()/stop() bumps the
// generation, which terminates the current child before anything else runs.
// -------------------------------------------------------------------
void AudioProcess::run(std::stop_token st) {
  while (!st.stop_requested()) {
    Request req;
    std::uint64_t generation = 0;
    {
      std::unique_lock lock(mtx_);
      if (!cv_.wait(lock, st, [this] { return pending_.has_value(); }))
        return;
      req = std::move(*pending_);
      pending_.reset();
      generation = generation_;
    }
    playRequest(st, req, generation);
  }
}

void AudioProcess::playRequest(std::stop_token st, const Request& req, std::uint64_t generation) {
  while (!superseded(st, generation)) {
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = spawn(req.argv);
    if (pid < 0)
      return;
    {
      std::lock_guard lock(mtx_);
      child_ = pid;
    }

    int status = 0;
    bool exited = false;
    while (!superseded(st, generation)) {
      if ((exited = reaped(pid, status)))
        break;
      std::unique_lock lock(mtx_);
      cv_.wait_for(lock, st, kPollStep, [&] { return generation_ != generation; });
    }
    if (!exited)
      terminate(pid);

    {
      std::lock_guard lock(mtx_);
      child_ = -1;
    }
    if (!exited || !req.repeat)
      return;

    // a player that fails straight away would otherwise be re-spawned ten times a second
    const bool failed = !WIFEXITED(status) || WEXITSTATUS(status) != 0;
    if (failed && std::chrono::steady_clock::now() - started < kTermGrace) {
      log_->error(kTag, "Player " + req.argv.front() + " failed immediately, giving up the loop");
      return;
    }
  }
}

bool AudioProcess::superseded(std::stop_token st, std::uint64_t generation) {
  if (st.stop_requested())
    return true;
  std::lock_guard lock(mtx_);
  return generation_ != generation;
}

pid_t AudioProcess::spawn(const std::vector<std::string>& argv) {
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv)
    args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  pid_t pid = -1;
  const int rc = ::posix_spawnp(&pid, args.front(), &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  if (rc != 0) {
    log_->error(kTag, "Failed to start " + argv.front() + ": " + std::strerror(rc));
    return -1;
  }
  return pid;
}

void AudioProcess::terminate(pid_t pid) {
  int status = 0;
  ::kill(pid, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reaped(pid, status))
      return;
    std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
  }

  log_->warn(kTag, "Player did not exit on SIGTERM, killing it");
  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}
