#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace prerender::media {

struct ProcessResult {
    bool spawned = false;
    int exitCode = -1;    // -1 when killed by a signal or not spawned
    int spawnErrno = 0;   // errno from posix_spawnp when spawned == false
    std::string output;          // merged stdout/stderr, tail-truncated
    std::string standardOutput;  // stdout alone, for tools whose output is parsed

    bool ok() const {
        return spawned && exitCode == 0;
    }
};

// Runs external tools (curl, unzip, ffmpeg, ffprobe). Blocking; no timeout,
// a hung child is left to the supervisor.
class IProcessRunner {
   public:
    virtual ~IProcessRunner() = default;
    virtual ProcessResult run(const std::vector<std::string>& args) = 0;
};

class PosixProcessRunner : public IProcessRunner {
   public:
    explicit PosixProcessRunner(std::size_t maxCapturedBytes = 256 * 1024);

    ProcessResult run(const std::vector<std::string>& args) override;

   private:
    std::size_t maxCapturedBytes_;
};

// Shell-like rendering of an argv for log lines.
std::string describeCommand(const std::vector<std::string>& args);

}  // namespace prerender::media
