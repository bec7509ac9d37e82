#include "file_forge/VideoConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <thread>

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace file_forge {

// --- helper -----------------------------------------------------------------
static std::string quote(const std::string& s)
{
    // оставляем как есть только «безопасные» символы
    const bool plain = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || std::strchr("_./:=+,@%-", c) != nullptr;
    });
    if (plain)
        return s;

    std::string out = "'";         // posix: одинарные кавычки, ' → '\''
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else           out += c;
    }
    return out + "'";
}

static std::string joinQuoted(const std::vector<std::string>& args)
{
    std::string cmd;
    for (const auto& arg : args) {
        if (!cmd.empty()) cmd += ' ';
        cmd += quote(arg);
    }
    return cmd;
}

int qualityToCrf(int quality)
{
    quality = std::clamp(quality, 1, 100);
    return 51 - static_cast<int>(std::lround((quality - 1) * 33.0 / 99.0));
}

std::vector<OptionRule> VideoConverter::optionRules() const
{
    return {{"quality", OptionRule::Type::Integer, 1, 100}};
}

bool VideoConverter::probe(const std::vector<char>& head) const
{
    // ffmpeg reads far more containers than we sniff; only rule out the
    // kinds that clearly are something else
    const FileKind kind = sniffMagic(head);
    if (kind == FileKind::VideoContainer) return true;
    return kind == FileKind::Unknown && !head.empty() && !isZipMagic(head) && !looksLikeText(head);
}

std::vector<std::string> VideoConverter::arguments(const std::string& in,
                                                   const std::string& out,
                                                   int                quality) const
{
    const std::string format = normalizeFormat(std::filesystem::path(out).extension().string());
    const std::string crf    = std::to_string(qualityToCrf(quality));

    std::vector<std::string> args = {
        config_.ffmpegPath, "-nostdin", "-hide_banner", "-loglevel", "error", "-y", "-i", in};

    if (format == "mp4" || format == "mov" || format == "m4v" || format == "mkv")
        args.insert(args.end(), {"-c:v", "libx264", "-preset", config_.ffmpegPreset,
                                 "-crf", crf, "-c:a", "aac", "-b:a", "192k"});
    else if (format == "webm")
        args.insert(args.end(), {"-c:v", "libvpx-vp9", "-b:v", "0", "-crf", crf,
                                 "-c:a", "libopus", "-b:a", "192k"});

    args.push_back(out);
    return args;
}

std::string VideoConverter::commandLine(const std::string& in,
                                        const std::string& out,
                                        int                quality) const
{
    return joinQuoted(arguments(in, out, quality));
}

// --- запуск ffmpeg -----------------------------------------------------------
// Runs argv[0] found through PATH, no shell in between. Polls the child so a
// cancelled context can kill it instead of waiting for the encode to finish.
static int runProcess(const std::vector<std::string>& args, const ConversionContext& ctx)
{
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
        throw std::runtime_error("[ffmpeg] cannot start " + args[0] + ": " + std::strerror(rc));

    int status = 0;
    for (;;) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR)
            throw std::runtime_error(std::string("[ffmpeg] waitpid failed: ") + std::strerror(errno));

        if (ctx.cancelled()) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            ctx.checkpoint();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// --- основная функция --------------------------------------------------------
ConversionResult VideoConverter::convert(const std::string&       in,
                                         const std::string&       out,
                                         const Options&           opts,
                                         const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = out;

    // ffmpeg picks the muxer from the extension, and the temp name keeps it
    AtomicFile file(out);
    const auto args = arguments(in, file.tempPath(),
                                opts.integer("quality", config_.convertQuality));
    ctx.checkpoint();

    const int ret = runProcess(args, ctx);
    if (ret != 0)
        throw std::runtime_error("[ffmpeg] failed, exit code "
                                 + std::to_string(ret)
                                 + "\nCommand: " + joinQuoted(args));

    ctx.checkpoint();
    result.bytesWritten = file.commit(ctx);
    return result;
}

} // namespace file_forge
