#include "file_forge/Dispatcher.hpp"
#include "file_forge/DocxTextConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <sstream>
#include <stdexcept>

namespace file_forge {

namespace fs = std::filesystem;

static constexpr std::size_t kSniffBytes = 4096;

// ─────────────────────── content sniffing ──────────────────────────────────
static FileKind sniff(const std::string& path, const std::vector<char>& head)
{
    if (isZipMagic(head))
        return isDocxPackage(path) ? FileKind::DocxDocument : FileKind::Unknown;

    const FileKind kind = sniffMagic(head);
    if (kind != FileKind::Unknown)
        return kind;
    return looksLikeText(head) ? FileKind::PlainText : FileKind::Unknown;
}

// ─────────────────────── Dispatcher ────────────────────────────────────────
const char* toString(Dispatcher::Stage stage)
{
    switch (stage) {
    case Dispatcher::Stage::Pending:    return "Pending";
    case Dispatcher::Stage::Resolving:  return "Resolving";
    case Dispatcher::Stage::Validating: return "Validating";
    case Dispatcher::Stage::Converting: return "Converting";
    case Dispatcher::Stage::Succeeded:  return "Succeeded";
    case Dispatcher::Stage::Failed:     return "Failed";
    }
    return "Failed";
}

Dispatcher::Dispatcher(std::shared_ptr<const ConverterRegistry> registry, std::ostream* log)
    : registry_(std::move(registry)), log_(log)
{
    if (!registry_)
        throw std::invalid_argument("Dispatcher needs a registry");
}

Dispatcher::~Dispatcher()
{
    // cancelled conversions stop at their next checkpoint and never commit
    std::lock_guard<std::mutex> lock(abandonedMutex_);
    for (auto& t : abandoned_)
        if (t.joinable()) t.join();
}

FileKind Dispatcher::resolve(const std::string& path) const
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw ForgeError(ErrorKind::IoError, "File '" + path + "' not found");

    const FileKind byExt = kindFromExtension(fs::path(path).extension().string());
    if (byExt != FileKind::Unknown)
        return byExt;

    const FileKind bySniff = sniff(path, FileReader::readHead(path, kSniffBytes));
    if (bySniff == FileKind::Unknown)
        throw ForgeError(ErrorKind::UnrecognizedFileKind,
                         "cannot tell what kind of file '" + path + "' is");
    return bySniff;
}

void Dispatcher::stage(const ConversionRequest& request, Stage s)
{
    if (!observer_) return;
    // an observer failure is reported but never changes the outcome
    try {
        observer_(request, s);
    } catch (const std::exception& e) {
        log_.line("dispatch", std::string("stage observer failed at ") + toString(s) + ": " + e.what());
    } catch (...) {
        log_.line("dispatch", std::string("stage observer failed at ") + toString(s));
    }
}

ConversionOutcome Dispatcher::execute(const ConversionRequest&  request,
                                      std::chrono::milliseconds timeout)
{
    stage(request, Stage::Pending);

    ErrorKind   kind = ErrorKind::ConversionFailed;
    std::string message;
    try {
        ConversionResult result = run(request, timeout);
        stage(request, Stage::Succeeded);
        log_.line("dispatch", "wrote " + result.outputPath + " ("
                              + std::to_string(result.bytesWritten) + " bytes, "
                              + std::to_string(result.elapsed.count()) + " ms)");
        return ConversionOutcome::success(std::move(result));
    } catch (const ForgeError& e) {
        kind    = e.kind();
        message = e.what();
    } catch (const std::exception& e) {
        // backend errors (cv::Exception, MuPDF, libzip, ...) all land here
        kind    = ErrorKind::ConversionFailed;
        message = e.what();
    } catch (...) {
        kind    = ErrorKind::ConversionFailed;
        message = "unknown error while converting " + request.inputPath();
    }

    stage(request, Stage::Failed);
    log_.line("dispatch", std::string("failed [") + toString(kind) + "] " + message);
    return ConversionOutcome::failure(kind, std::move(message), request);
}

ConversionResult Dispatcher::run(const ConversionRequest& request,
                                 std::chrono::milliseconds timeout)
{
    // 1. ─────────────── resolve both sides ─────────────────────────────────
    stage(request, Stage::Resolving);
    const std::string in = request.inputPath();

    FileKind source = request.inputKind();
    if (source == FileKind::Unknown) {
        source = resolve(in);
    } else {
        std::error_code ec;
        if (!fs::is_regular_file(in, ec))
            throw ForgeError(ErrorKind::IoError, "File '" + in + "' not found");
    }

    if (request.targetKind() == FileKind::Unknown)
        throw ForgeError(ErrorKind::UnrecognizedFileKind,
                         "unrecognized target format '" + request.targetFormat() + "'");

    auto converter = registry_->lookup(source, request.targetKind());
    if (!converter) {
        std::ostringstream msg;
        msg << "Conversion from " << toString(source) << " to " << toString(request.targetKind())
            << " is not supported. Supported conversions:";
        for (const auto& [from, to] : registry_->pairs())
            msg << ' ' << toString(from) << "->" << toString(to);
        throw ForgeError(ErrorKind::UnsupportedConversion, msg.str());
    }

    // 2. ─────────────── validate options and input ─────────────────────────
    stage(request, Stage::Validating);
    const auto rules = converter->optionRules();
    for (const auto& [key, value] : request.options().params) {
        auto rule = std::find_if(rules.begin(), rules.end(),
                                 [&](const OptionRule& r) { return r.key == key; });
        if (rule == rules.end())
            throw ForgeError(ErrorKind::InvalidOption,
                             "option '" + key + "' is not accepted by the "
                             + converter->name() + " converter");
        if (auto problem = rule->check(value))
            throw ForgeError(ErrorKind::InvalidOption, *problem);
    }

    if (!converter->probe(FileReader::readHead(in, kSniffBytes)))
        throw ForgeError(ErrorKind::UnrecognizedFileKind,
                         "'" + in + "' does not contain " + toString(source) + " data");

    const std::string out = request.outputPath();
    const fs::path outDir = fs::path(out).parent_path();
    std::error_code ec;
    if (!outDir.empty() && !fs::is_directory(outDir, ec))
        throw ForgeError(ErrorKind::IoError,
                         "output directory '" + outDir.string() + "' does not exist");

    // 3. ─────────────── convert ────────────────────────────────────────────
    stage(request, Stage::Converting);
    log_.line("dispatch", in + " -> " + out + " (" + converter->name() + ")");

    const auto started = std::chrono::steady_clock::now();
    ConversionContext ctx;
    ConversionResult  result;

    if (timeout.count() <= 0) {
        result = converter->convert(in, out, request.options(), ctx);
    } else {
        auto task = std::make_shared<std::packaged_task<ConversionResult()>>(
            [converter, in, out, opts = request.options(), ctx] {
                return converter->convert(in, out, opts, ctx);
            });
        auto future = task->get_future();
        std::thread worker([task] { (*task)(); });

        if (future.wait_for(timeout) == std::future_status::timeout && ctx.cancel()) {
            std::lock_guard<std::mutex> lock(abandonedMutex_);
            abandoned_.push_back(std::move(worker));
            throw ForgeError(ErrorKind::Timeout,
                             "converting " + in + " took longer than "
                             + std::to_string(timeout.count()) + " ms");
        }
        worker.join();
        result = future.get();     // rethrows whatever convert() threw
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (result.outputPath.empty()) result.outputPath = out;
    return result;
}

} // namespace file_forge
