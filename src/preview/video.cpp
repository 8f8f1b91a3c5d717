#include "preview/video.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <array>
#include <cerrno>
#include <stdexcept>

namespace tf::preview::video {

namespace {

constexpr size_t MAX_FRAME_BYTES = 64 * 1024 * 1024;

std::vector<uint8_t> run_ffmpeg(const std::string& path, const std::string& seek) {
    try {
        return capture_stdout({
            "ffmpeg",
            "-v", "error",
            "-ss", seek,
            "-i", path,
            "-frames:v", "1",
            "-f", "image2pipe",
            "-vcodec", "png",
            "-"
        }, MAX_FRAME_BYTES);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(fmt::format("{} for {}", e.what(), path));
    }
}

}

std::vector<uint8_t> capture_stdout(const std::vector<std::string>& argv, const size_t maxBytes) {
    if (argv.empty()) throw std::invalid_argument("capture_stdout needs a program name");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // Both ends close on exec so concurrently spawned children never hold
    // each other's pipes open
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create pipe for " + argv.front());

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("Failed to fork " + argv.front());
    }

    if (pid == 0) {
        // Child: stdout into the pipe, stderr and stdin to /dev/null
        dup2(pipefd[1], STDOUT_FILENO);
        if (const int devnull = open("/dev/null", O_RDWR | O_CLOEXEC); devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            dup2(devnull, STDIN_FILENO);
        }
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    std::vector<uint8_t> out;
    std::array<uint8_t, 64 * 1024> buf{};
    bool overflow = false;
    for (;;) {
        const ssize_t n = read(pipefd[0], buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        if (out.size() + static_cast<size_t>(n) > maxBytes) {
            overflow = true;
            break;
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (overflow) throw std::runtime_error(argv.front() + " output exceeds size limit");
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw std::runtime_error(fmt::format("{} failed with status {}", argv.front(), WEXITSTATUS(status)));
    return out;
}

std::vector<uint8_t> extract_frame(const std::string& path, const double seekSeconds) {
    auto frame = run_ffmpeg(path, fmt::format("{:.3f}", seekSeconds));

    // Clips shorter than the seek point produce no frame; retry from the start
    if (frame.empty() && seekSeconds > 0.0) {
        log::Registry::preview()->debug("[video] No frame at {}s in {}, retrying at 0", seekSeconds, path);
        frame = run_ffmpeg(path, "0");
    }

    if (frame.empty()) throw std::runtime_error("ffmpeg produced no frame for " + path);
    return frame;
}

}
