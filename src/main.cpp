#include "file_forge/BatchRunner.hpp"
#include "file_forge/ConverterFactory.hpp"
#include "file_forge/Dispatcher.hpp"
#include "file_forge/FileInfo.hpp"
#include "file_forge/ForgeConfig.hpp"
#include "file_forge/ForgeError.hpp"
#include "file_forge/PdfPagesConverter.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using namespace file_forge;

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitFail  = 1;
constexpr int kExitUsage = 2;

const char* kVersion = "file-forge v0.1.0";

void printUsage(const char* prog, std::ostream& os)
{
    os << "Usage: " << prog << " [--jobs N] [--timeout SECONDS] [--verbose] [--ffmpeg PATH] <command> ...\n";
    os << "\nCommands:\n";
    os << "  version                                    - Show file-forge version\n";
    os << "  info <file>                                - Show size, kind and format details\n";
    os << "  image convert <input> <format> [-o OUT] [-q 1-100]\n";
    os << "  image compress <input> [-q 1-100] [--max-width N] [--max-height N] [-o OUT]\n";
    os << "  image resize <input> [-w N] [-h N] [--maintain-aspect|--no-maintain-aspect] [-o OUT]\n";
    os << "  image rotate <input> <degrees> [--no-expand] [-o OUT]\n";
    os << "  doc convert <input> <format> [-o OUT]      - pdf→txt, docx→txt, txt→docx\n";
    os << "  doc extract <input> <pages> [-o OUT]       - pages like 2-4 or 1,3,5-\n";
    os << "  doc merge <output> <input> <input>...\n";
    os << "  video convert <input> <format> [-o OUT] [-q 1-100]\n";
    os << "  batch <manifest>                           - one request per line: input format [key=value...]\n";
    os << "\nGlobal parameters:\n";
    os << "  --jobs <n>          - Parallel batch workers (default: 1 = sequential)\n";
    os << "  --timeout <sec>     - Abort any single conversion after this many seconds\n";
    os << "  --verbose           - Trace every dispatch step on stderr\n";
    os << "  --ffmpeg <path>     - ffmpeg executable for video conversion (default: ffmpeg)\n";
    os << "\nExit status: 0 all conversions succeeded, 1 at least one failed, 2 usage error.\n";
}

// ─────────────────────── argument parsing ──────────────────────────────────
struct Args {
    std::vector<std::string>                     positional;
    std::unordered_map<std::string, std::string> values;
    std::unordered_set<std::string>              switches;

    bool has(const std::string& k) const { return values.count(k) || switches.count(k); }
    std::string value(const std::string& k) const
    {
        auto it = values.find(k);
        return it == values.end() ? std::string{} : it->second;
    }
};

struct FlagSpec {
    std::unordered_map<std::string, std::string> valued;    // "-o", "--output" → "output"
    std::unordered_map<std::string, std::string> switches;  // "--no-expand" → "no-expand"
};

bool looksNumeric(const std::string& s)
{
    if (s.size() < 2 || s[0] != '-') return false;
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end && *end == '\0';
}

bool parseArgs(const std::vector<std::string>& argv, const FlagSpec& flags, Args& out, std::string& error)
{
    for (std::size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.empty() || arg[0] != '-' || arg == "-" || looksNumeric(arg)) {
            out.positional.push_back(arg);
            continue;
        }
        if (auto it = flags.switches.find(arg); it != flags.switches.end()) {
            out.switches.insert(it->second);
            continue;
        }
        auto it = flags.valued.find(arg);
        if (it == flags.valued.end()) {
            error = "unknown parameter " + arg;
            return false;
        }
        if (i + 1 >= argv.size()) {
            error = "Parameter " + arg + " requires a value";
            return false;
        }
        out.values[it->second] = argv[++i];
    }
    return true;
}

// ─────────────────────── reporting ─────────────────────────────────────────
void printFailure(const ConversionFailure& f)
{
    std::cerr << "Error [" << toString(f.kind) << "]: " << f.message << '\n';
}

int report(const ConversionOutcome& outcome, const std::string& what)
{
    if (!outcome.ok()) {
        printFailure(outcome.failure());
        return kExitFail;
    }
    const auto& r = outcome.result();
    for (const auto& w : r.warnings)
        std::cerr << "Warning: " << w << '\n';
    std::cout << what << " successfully: " << r.outputPath << '\n';
    return kExitOk;
}

// ─────────────────────── commands ──────────────────────────────────────────
struct Context {
    ForgeConfig config;
    Dispatcher& dispatcher;
};

int usageError(const std::string& message)
{
    std::cerr << "Error: " << message << "\nUse --help for more information.\n";
    return kExitUsage;
}

std::string extensionOf(const std::string& path)
{
    return normalizeFormat(std::filesystem::path(path).extension().string());
}

ConversionOutcome run(Context& c, const ConversionRequest& request)
{
    return c.dispatcher.execute(request, c.config.timeout);
}

int imageConvert(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}, {"-q", "quality"}, {"--quality", "quality"}}, {}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 2) return usageError("image convert needs <input> <format>");

    Options opts;
    opts.params["quality"] = a.has("quality") ? a.value("quality") : std::to_string(c.config.convertQuality);
    const std::string format = normalizeFormat(a.positional[1]);
    if (!isLossyImageFormat(format) && !a.has("quality"))
        opts.params.erase("quality");

    ConversionRequest req(a.positional[0], FileKind::Unknown, format, opts, a.value("output"));
    return report(run(c, req), "Image converted");
}

int imageCompress(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}, {"-q", "quality"}, {"--quality", "quality"},
                   {"--max-width", "max_width"}, {"--max-height", "max_height"}}, {}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 1) return usageError("image compress needs <input>");

    const std::string input  = a.positional[0];
    const std::string format = extensionOf(input);

    Options opts;
    if (isLossyImageFormat(format))
        opts.params["quality"] = a.has("quality") ? a.value("quality") : std::to_string(c.config.compressQuality);
    else if (a.has("quality"))
        opts.params["quality"] = a.value("quality");
    if (format == "png") opts.params["compression"] = "9";
    for (const char* k : {"max_width", "max_height"})
        if (a.has(k)) opts.params[k] = a.value(k);

    ConversionRequest req(input, FileKind::Unknown, format, opts, a.value("output"), "_compressed");
    const ConversionOutcome outcome = run(c, req);
    const int code = report(outcome, "Image compressed");
    if (code != kExitOk) return code;

    std::error_code ec;
    const auto before = std::filesystem::file_size(input, ec);
    const auto after  = outcome.result().bytesWritten;
    std::cout << "Original size: " << readableSize(before) << '\n';
    std::cout << "Compressed size: " << readableSize(after) << '\n';
    if (!ec && before > 0) {
        const double reduction = (double(before) - double(after)) / double(before) * 100.0;
        std::ostringstream pct;
        pct.setf(std::ios::fixed);
        pct.precision(2);
        pct << reduction;
        std::cout << "Size reduction: " << pct.str() << "%\n";
    }
    return kExitOk;
}

int imageResize(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}, {"-w", "max_width"}, {"--width", "max_width"},
                   {"-h", "max_height"}, {"--height", "max_height"}},
                  {{"--maintain-aspect", "keep"}, {"--no-maintain-aspect", "stretch"}}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 1) return usageError("image resize needs <input>");
    if (!a.has("max_width") && !a.has("max_height")) {
        std::cerr << "Error: At least one of --width or --height must be specified\n";
        return kExitFail;
    }

    const std::string input  = a.positional[0];
    const std::string format = extensionOf(input);

    Options opts;
    for (const char* k : {"max_width", "max_height"})
        if (a.has(k)) opts.params[k] = a.value(k);
    opts.params["maintain_aspect"] = a.has("stretch") ? "false" : "true";
    if (isLossyImageFormat(format)) opts.params["quality"] = std::to_string(c.config.convertQuality);

    const std::string dims = (a.has("max_width") ? a.value("max_width") : "auto") + "x"
                           + (a.has("max_height") ? a.value("max_height") : "auto");
    ConversionRequest req(input, FileKind::Unknown, format, opts, a.value("output"), "_resized_" + dims);
    return report(run(c, req), "Image resized");
}

int imageRotate(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}}, {{"--no-expand", "no-expand"}}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 2) return usageError("image rotate needs <input> <degrees>");

    const std::string input  = a.positional[0];
    const std::string format = extensionOf(input);

    Options opts;
    opts.params["rotate"] = a.positional[1];
    opts.params["expand"] = a.has("no-expand") ? "false" : "true";
    if (isLossyImageFormat(format)) opts.params["quality"] = std::to_string(c.config.convertQuality);

    ConversionRequest req(input, FileKind::Unknown, format, opts, a.value("output"),
                          "_rotated_" + a.positional[1]);
    return report(run(c, req), "Image rotated");
}

int docConvert(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}}, {}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 2) return usageError("doc convert needs <input> <format>");

    ConversionRequest req(a.positional[0], FileKind::Unknown, a.positional[1], {}, a.value("output"));
    return report(run(c, req), "Document converted");
}

int docExtract(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}}, {}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 2) return usageError("doc extract needs <input> <pages>");

    Options opts;
    opts.params["pages"] = a.positional[1];
    ConversionRequest req(a.positional[0], FileKind::Unknown, "pdf", opts, a.value("output"), "_pages");
    return report(run(c, req), "Pages extracted");
}

int docMerge(Context&, const std::vector<std::string>& argv)
{
    if (argv.size() < 3) return usageError("doc merge needs <output> and at least two inputs");
    const std::vector<std::string> inputs(argv.begin() + 1, argv.end());
    try {
        const ConversionResult r = mergePdfs(inputs, argv[0]);
        for (const auto& w : r.warnings)
            std::cerr << "Warning: " << w << '\n';
        std::cout << "Documents merged successfully: " << r.outputPath << '\n';
        return kExitOk;
    } catch (const ForgeError& e) {
        std::cerr << "Error [" << toString(e.kind()) << "]: " << e.what() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error [" << toString(ErrorKind::ConversionFailed) << "]: " << e.what() << '\n';
    }
    return kExitFail;
}

int videoConvert(Context& c, const std::vector<std::string>& argv)
{
    Args a; std::string err;
    FlagSpec flags{{{"-o", "output"}, {"--output", "output"}, {"-q", "quality"}, {"--quality", "quality"}}, {}};
    if (!parseArgs(argv, flags, a, err)) return usageError(err);
    if (a.positional.size() != 2) return usageError("video convert needs <input> <format>");

    Options opts;
    opts.params["quality"] = a.has("quality") ? a.value("quality") : std::to_string(c.config.convertQuality);
    ConversionRequest req(a.positional[0], FileKind::Unknown, a.positional[1], opts, a.value("output"));
    return report(run(c, req), "Video converted");
}

int fileInfo(Context& c, const std::vector<std::string>& argv)
{
    if (argv.size() != 1) return usageError("info needs <file>");
    try {
        const FileInfo info = describeFile(argv[0], c.dispatcher);
        std::cout << "File: " << info.name << '\n'
                  << "Path: " << info.absolutePath << '\n'
                  << "Size: " << info.size << " bytes (" << readableSize(info.size) << ")\n"
                  << "Type: " << info.extension << '\n'
                  << "Kind: " << toString(info.kind) << '\n';
        for (const auto& [label, value] : info.details)
            std::cout << label << ": " << value << '\n';
        return kExitOk;
    } catch (const ForgeError& e) {
        std::cerr << "Error [" << toString(e.kind()) << "]: " << e.what() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error [" << toString(ErrorKind::IoError) << "]: " << e.what() << '\n';
    }
    return kExitFail;
}

// manifest: "<input> <format> [key=value ...]", '#' starts a comment,
// the key "output" sets an explicit output path
int batch(Context& c, const std::vector<std::string>& argv)
{
    if (argv.size() != 1) return usageError("batch needs <manifest>");
    std::ifstream manifest(argv[0]);
    if (!manifest) {
        std::cerr << "Error [" << toString(ErrorKind::IoError) << "]: cannot open manifest " << argv[0] << '\n';
        return kExitFail;
    }

    std::vector<ConversionRequest> requests;
    std::string line;
    for (int lineNo = 1; std::getline(manifest, line); ++lineNo) {
        if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
        std::istringstream ss(line);
        std::string input, format, token;
        if (!(ss >> input)) continue;
        if (!(ss >> format))
            return usageError("manifest line " + std::to_string(lineNo) + ": missing target format");

        Options opts;
        std::string output;
        while (ss >> token) {
            const auto eq = token.find('=');
            if (eq == std::string::npos || eq == 0)
                return usageError("manifest line " + std::to_string(lineNo) + ": expected key=value, got '" + token + "'");
            const std::string key = token.substr(0, eq);
            if (key == "output") output = token.substr(eq + 1);
            else                 opts.params[key] = token.substr(eq + 1);
        }
        requests.emplace_back(input, FileKind::Unknown, format, opts, output);
    }

    BatchRunner runner(c.dispatcher, c.config.jobs, c.config.timeout);
    const auto outcomes = runner.run(requests);

    int failed = 0;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        const auto& o = outcomes[i];
        if (o.ok()) {
            std::cout << "[" << i + 1 << "/" << outcomes.size() << "] ok      "
                      << requests[i].inputPath() << " -> " << o.result().outputPath << '\n';
            for (const auto& w : o.result().warnings)
                std::cerr << "Warning: " << requests[i].inputPath() << ": " << w << '\n';
        } else {
            ++failed;
            std::cout << "[" << i + 1 << "/" << outcomes.size() << "] failed  " << requests[i].inputPath() << '\n';
            printFailure(o.failure());
        }
    }
    std::cout << outcomes.size() - failed << " succeeded, " << failed << " failed\n";
    return failed ? kExitFail : kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ForgeConfig config;

    // Parse global parameters: everything before the command word
    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0], std::cout);
            return kExitOk;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << kVersion << '\n';
            return kExitOk;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--jobs" || arg == "--timeout" || arg == "--ffmpeg") {
            if (i + 1 >= args.size())
                return usageError("Parameter " + arg + " requires a value");
            const std::string value = args[++i];
            try {
                if (arg == "--jobs") {
                    const int jobs = std::stoi(value);
                    if (jobs < 1) return usageError("--jobs must be at least 1");
                    config.jobs = static_cast<unsigned>(jobs);
                } else if (arg == "--timeout") {
                    const double seconds = std::stod(value);
                    if (!(seconds > 0)) return usageError("--timeout must be positive");
                    config.timeout = timeoutFromSeconds(seconds);
                } else {
                    config.ffmpegPath = value;
                }
            } catch (const std::exception&) {
                return usageError("invalid value '" + value + "' for " + arg);
            }
        } else if (arg.rfind("--", 0) == 0) {
            return usageError("unknown parameter " + arg);
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        std::cerr << "Usage: " << argv[0] << " [global options] <command> ...\n";
        std::cerr << "Use --help for more information.\n";
        return kExitUsage;
    }

    const std::string command = args[i++];
    std::string sub;
    if (command == "image" || command == "doc" || command == "video") {
        if (i >= args.size()) return usageError(command + " needs a subcommand");
        sub = args[i++];
    }
    const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());

    if (command == "version") {
        std::cout << kVersion << "\nA trustworthy, local file processing tool\n";
        return kExitOk;
    }

    auto registry = ConverterFactory::createRegistry(config);
    Dispatcher dispatcher(registry, config.verbose ? &std::cerr : nullptr);
    Context ctx{config, dispatcher};

    if (command == "info")                         return fileInfo(ctx, rest);
    if (command == "batch")                        return batch(ctx, rest);
    if (command == "image" && sub == "convert")    return imageConvert(ctx, rest);
    if (command == "image" && sub == "compress")   return imageCompress(ctx, rest);
    if (command == "image" && sub == "resize")     return imageResize(ctx, rest);
    if (command == "image" && sub == "rotate")     return imageRotate(ctx, rest);
    if (command == "doc" && sub == "convert")      return docConvert(ctx, rest);
    if (command == "doc" && sub == "extract")      return docExtract(ctx, rest);
    if (command == "doc" && sub == "merge")        return docMerge(ctx, rest);
    if (command == "video" && sub == "convert")    return videoConvert(ctx, rest);

    return usageError("unknown command '" + command + (sub.empty() ? "" : " " + sub) + "'");
}
