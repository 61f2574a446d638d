#pragma once
/** @file  AudioProcess.hpp
 *  @brief Plays a sound file through an external command-line player, optionally looping.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace reveille::core {
  class Logger;
}

namespace reveille::io {

  /**
 * @class AudioProcess
 * @brief Owns at most one player child process and the worker thread that
 *        spawns, re-spawns and terminates it.
 *
 *  * Sound names resolve inside the sounds directory: exact file, then the
 *    name plus each supported extension, then the alphabetically first sound.
 *  * Players are tried in order: mpg123, aplay, paplay, ffplay. With none on
 *    PATH, `play()` logs and returns false.
 *  * `play()` and `stop()` only post a request to the worker and return; the
 *    worker sends SIGTERM, escalates to SIGKILL after 1 s and reaps the child.
 *    Callers holding a lock never wait on a player process.
 *  * The destructor terminates any child and joins the worker.
 */
  class AudioProcess {
  public:
    AudioProcess(std::filesystem::path soundsDirectory, std::shared_ptr<core::Logger> log);
    ~AudioProcess();

    /// Replaces whatever is playing with \p sound. False if no file or no player was found.
    bool play(const std::string& sound, bool loop);
    void stop(); ///< asynchronous; playing() turns false once the child is reaped
    bool playing() const;

    /// Best effort `amixer sset Master N%`; the value is remembered either way.
    void setVolume(int percent);
    int volume() const { return volume_; }

    std::optional<std::filesystem::path> resolve(const std::string& sound) const;
    std::vector<std::string> availableSounds() const; ///< file names, sorted

    /// argv of the first installed player, without the file argument.
    static std::optional<std::vector<std::string>> findPlayer();

    static const std::vector<std::string>& supportedExtensions();

    AudioProcess(const AudioProcess&) = delete;
    AudioProcess& operator=(const AudioProcess&) = delete;

  private:
    struct Request {
      std::vector<std::string> argv;
      bool repeat{ false };
    };

    void run(std::stop_token st);
    void playRequest(std::stop_token st, const Request& req, std::uint64_t generation);
    bool superseded(std::stop_token st, std::uint64_t generation);
    pid_t spawn(const std::vector<std::string>& argv);
    void terminate(pid_t pid);

    std::filesystem::path dir_;
    std::shared_ptr<core::Logger> log_;
    int volume_{ 80 };

    mutable std::mutex mtx_;
    std::condition_variable_any cv_;
    std::optional<Request> pending_; ///< guarded by mtx_
    std::uint64_t generation_{ 0 };  ///< bumped by every play()/stop(), guarded by mtx_
    pid_t child_{ -1 };              ///< guarded by mtx_
    std::jthread worker_;            ///< last member: started after the rest is built
  };

} // namespace reveille::io
