// tests/dispatcher_tests.cpp
// -----------------------------------------------------------------------------
// Registry, requests, dispatch pipeline, batches, timeouts and output
// atomicity. Uses small in-test converters on plain text so the checks do not
// depend on any codec.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "file_forge/BatchRunner.hpp"
#include "file_forge/ConverterFactory.hpp"
#include "file_forge/ConverterRegistry.hpp"
#include "file_forge/Dispatcher.hpp"
#include "file_forge/FileInfo.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeConfig.hpp"
#include "file_forge/ForgeError.hpp"

#include "TestFiles.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace file_forge;
using file_forge::test::ScratchDir;
namespace fs = std::filesystem;

namespace {

// TXT → TXT, upper-cases the input
class UpperCaseConverter : public IConverter {
public:
    const char* name() const override { return "upper"; }
    FileKind sourceKind() const override { return FileKind::PlainText; }
    FileKind targetKind() const override { return FileKind::PlainText; }
    std::vector<OptionRule> optionRules() const override
    {
        return {{"repeat", OptionRule::Type::Integer, 1, 3}};
    }
    bool probe(const std::vector<char>& head) const override { return looksLikeText(head); }

    ConversionResult convert(const std::string& in, const std::string& out,
                             const Options& opts, const ConversionContext& ctx) override
    {
        std::string text = FileReader::readText(in);
        for (char& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        std::string all;
        for (int i = opts.integer("repeat", 1); i > 0; --i) all += text;

        ConversionResult r;
        r.outputPath   = out;
        r.bytesWritten = FileWriter::writeAll(out, all, ctx);
        return r;
    }
};

// writes half of the output, then dies
class CrashingConverter : public UpperCaseConverter {
public:
    const char* name() const override { return "crashing"; }
    ConversionResult convert(const std::string&, const std::string& out,
                             const Options&, const ConversionContext&) override
    {
        AtomicFile file(out);
        file.write(std::string("partial output"));
        throw std::runtime_error("encoder crashed halfway");
    }
};

// keeps working until cancelled, then tries to publish anyway
class SlowConverter : public UpperCaseConverter {
public:
    const char* name() const override { return "slow"; }
    ConversionResult convert(const std::string&, const std::string& out,
                             const Options&, const ConversionContext& ctx) override
    {
        AtomicFile file(out);
        file.write(std::string("late"));
        for (int i = 0; i < 300 && !ctx.cancelled(); ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        ConversionResult r;
        r.outputPath   = out;
        r.bytesWritten = file.commit(ctx);    // refused once cancelled
        return r;
    }
};

std::shared_ptr<const ConverterRegistry> registryWith(std::shared_ptr<IConverter> conv)
{
    auto registry = std::make_shared<ConverterRegistry>();
    registry->add(std::move(conv));
    registry->freeze();
    return registry;
}

ConversionRequest request(const std::string& in, const std::string& format, Options opts = {},
                          const std::string& out = {})
{
    return ConversionRequest(in, FileKind::Unknown, format, std::move(opts), out);
}

} // namespace

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------
TEST(ConverterRegistry, LastRegistrationWins)
{
    ConverterRegistry registry;
    auto first  = std::make_shared<UpperCaseConverter>();
    auto second = std::make_shared<CrashingConverter>();
    registry.add(first);
    registry.add(second);

    EXPECT_EQ(registry.lookup(FileKind::PlainText, FileKind::PlainText), second);
    EXPECT_EQ(registry.pairs().size(), 1u);
    EXPECT_EQ(registry.lookup(FileKind::PlainText, FileKind::DocxDocument), nullptr);
}

TEST(ConverterRegistry, FrozenRejectsRegistration)
{
    ConverterRegistry registry;
    registry.add(std::make_shared<UpperCaseConverter>());
    registry.freeze();

    EXPECT_TRUE(registry.frozen());
    EXPECT_THROW(registry.add(std::make_shared<CrashingConverter>()), RegistryFrozen);
    EXPECT_STREQ(registry.lookup(FileKind::PlainText, FileKind::PlainText)->name(), "upper");
}

// -----------------------------------------------------------------------------
// Requests and options
// -----------------------------------------------------------------------------
TEST(ConversionRequest, DerivesOutputNextToInput)
{
    const ConversionRequest req("/data/in/photo.png", FileKind::Unknown, ".JPG", {}, {}, "_small");
    EXPECT_EQ(req.targetFormat(), "jpg");
    EXPECT_EQ(req.targetKind(), FileKind::ImageRaster);
    EXPECT_EQ(req.outputPath(), "/data/in/photo_small.jpg");
}

TEST(ConversionRequest, ExplicitOutputWins)
{
    const ConversionRequest req("a.txt", FileKind::PlainText, "docx", {}, "/tmp/b.docx");
    EXPECT_EQ(req.outputPath(), "/tmp/b.docx");
    EXPECT_EQ(req.inputKind(), FileKind::PlainText);
}

TEST(ConversionOutcome, WrongAccessorThrows)
{
    const auto failure = ConversionOutcome::failure(ErrorKind::Timeout, "slow", request("a.txt", "txt"));
    EXPECT_FALSE(failure.ok());
    EXPECT_THROW(failure.result(), std::logic_error);
    EXPECT_EQ(failure.failure().request.inputPath(), "a.txt");

    const auto success = ConversionOutcome::success(ConversionResult{});
    EXPECT_TRUE(success.ok());
    EXPECT_THROW(success.failure(), std::logic_error);
}

TEST(OptionRule, ChecksTypeAndRange)
{
    const OptionRule quality{"quality", OptionRule::Type::Integer, 1, 100};
    EXPECT_FALSE(quality.check("1").has_value());
    EXPECT_FALSE(quality.check("100").has_value());
    EXPECT_TRUE(quality.check("0").has_value());
    EXPECT_TRUE(quality.check("7.5").has_value());

    const OptionRule pages{"pages", OptionRule::Type::PageList};
    EXPECT_FALSE(pages.check("1,3,5-").has_value());
    EXPECT_TRUE(pages.check("0-2").has_value());
    EXPECT_TRUE(pages.check("4-2").has_value());
    EXPECT_TRUE(pages.check("1,,2").has_value());

    const OptionRule expand{"expand", OptionRule::Type::Bool};
    EXPECT_FALSE(expand.check("False").has_value());
    EXPECT_TRUE(expand.check("maybe").has_value());
}

// -----------------------------------------------------------------------------
// Kind resolution
// -----------------------------------------------------------------------------
TEST(FileKind, ExtensionTable)
{
    EXPECT_EQ(kindFromExtension(".PNG"), FileKind::ImageRaster);
    EXPECT_EQ(kindFromExtension("jpeg"), FileKind::ImageRaster);
    EXPECT_EQ(kindFromExtension("pdf"), FileKind::PdfDocument);
    EXPECT_EQ(kindFromExtension("docx"), FileKind::DocxDocument);
    EXPECT_EQ(kindFromExtension("txt"), FileKind::PlainText);
    EXPECT_EQ(kindFromExtension("mkv"), FileKind::VideoContainer);
    EXPECT_EQ(kindFromExtension("xyz"), FileKind::Unknown);
}

TEST(FileKind, SniffsFilesWithoutExtension)
{
    ScratchDir dir;
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));

    test::writeFile(dir.path("notes"), "shopping list\nmilk\n");
    test::writeMinimalPdf(dir.path("report"), {"page"});
    test::writeFile(dir.path("blob"), std::string("\x00\x01\x02\xff\xfe", 5));

    EXPECT_EQ(dispatcher.resolve(dir.path("notes")), FileKind::PlainText);
    EXPECT_EQ(dispatcher.resolve(dir.path("report")), FileKind::PdfDocument);
    try {
        dispatcher.resolve(dir.path("blob"));
        FAIL() << "binary blob resolved to a kind";
    } catch (const ForgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnrecognizedFileKind);
    }
}

TEST(FileKind, ExtensionIsTrustedOverContent)
{
    ScratchDir dir;
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));
    test::writeFile(dir.path("odd.pdf"), "plain words\n");
    EXPECT_EQ(dispatcher.resolve(dir.path("odd.pdf")), FileKind::PdfDocument);
}

TEST(FileKind, MissingFileIsIoError)
{
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));
    try {
        dispatcher.resolve("/definitely/not/here.png");
        FAIL() << "missing file resolved";
    } catch (const ForgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
    }
}

TEST(ForgeConfig, TimeoutRoundsUpToWholeMilliseconds)
{
    EXPECT_EQ(timeoutFromSeconds(0.0001), std::chrono::milliseconds(1));
    EXPECT_EQ(timeoutFromSeconds(0.0015), std::chrono::milliseconds(2));
    EXPECT_EQ(timeoutFromSeconds(2.5), std::chrono::milliseconds(2500));
    EXPECT_EQ(timeoutFromSeconds(60), std::chrono::seconds(60));

    EXPECT_THROW(timeoutFromSeconds(0), ForgeError);
    EXPECT_THROW(timeoutFromSeconds(-1), ForgeError);
    EXPECT_THROW(timeoutFromSeconds(std::nan("")), ForgeError);
    EXPECT_THROW(timeoutFromSeconds(1e300), ForgeError);
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------
TEST(Dispatcher, RunsMatchingConverter)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "abc\n");
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));

    Options opt;
    opt.params["repeat"] = "2";
    const auto outcome = dispatcher.execute(request(dir.path("in.txt"), "txt", opt, dir.path("out.txt")));
    ASSERT_TRUE(outcome.ok()) << outcome.failure().message;
    EXPECT_EQ(test::readFile(dir.path("out.txt")), "ABC\nABC\n");
    EXPECT_EQ(outcome.result().bytesWritten, 8u);
}

TEST(Dispatcher, ReportsStagesInOrder)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "abc\n");
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));

    std::vector<Dispatcher::Stage> seen;
    dispatcher.setStageObserver([&](const ConversionRequest&, Dispatcher::Stage s) { seen.push_back(s); });

    ASSERT_TRUE(dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("o.txt"))).ok());
    using S = Dispatcher::Stage;
    EXPECT_EQ(seen, (std::vector<S>{S::Pending, S::Resolving, S::Validating, S::Converting, S::Succeeded}));

    seen.clear();
    EXPECT_FALSE(dispatcher.execute(request(dir.path("in.txt"), "docx")).ok());
    EXPECT_EQ(seen, (std::vector<S>{S::Pending, S::Resolving, S::Failed}));
}

TEST(Dispatcher, UnsupportedPairWritesNothing)
{
    ScratchDir dir;
    test::writeFile(dir.path("letter.txt"), "hello\n");
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));

    const auto outcome = dispatcher.execute(request(dir.path("letter.txt"), "png"));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::UnsupportedConversion);
    EXPECT_NE(outcome.failure().message.find("PlainText"), std::string::npos);
    EXPECT_EQ(dir.entries(), std::vector<std::string>{"letter.txt"});
}

TEST(Dispatcher, UnknownTargetFormat)
{
    ScratchDir dir;
    test::writeFile(dir.path("letter.txt"), "hello\n");
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));

    const auto outcome = dispatcher.execute(request(dir.path("letter.txt"), "xyz"));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::UnrecognizedFileKind);
}

TEST(Dispatcher, MissingOutputDirectoryIsIoError)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "x\n");
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));

    const auto outcome = dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("nope/out.txt")));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::IoError);
}

TEST(Dispatcher, FailedConversionLeavesNoPartialOutput)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "x\n");
    test::writeFile(dir.path("out.txt"), "previous result\n");
    Dispatcher dispatcher(registryWith(std::make_shared<CrashingConverter>()));

    const auto outcome = dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("out.txt")));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::ConversionFailed);
    EXPECT_EQ(outcome.failure().message, "encoder crashed halfway");

    // the old file is untouched and no temp file is left behind
    EXPECT_EQ(test::readFile(dir.path("out.txt")), "previous result\n");
    EXPECT_EQ(dir.entries(), (std::vector<std::string>{"in.txt", "out.txt"}));
}

TEST(Dispatcher, TimeoutCancelsAndPublishesNothing)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "x\n");
    {
        Dispatcher dispatcher(registryWith(std::make_shared<SlowConverter>()));
        const auto started = std::chrono::steady_clock::now();
        const auto outcome = dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("out.txt")),
                                                std::chrono::milliseconds(100));
        const auto waited = std::chrono::steady_clock::now() - started;

        ASSERT_FALSE(outcome.ok());
        EXPECT_EQ(outcome.failure().kind, ErrorKind::Timeout);
        EXPECT_LT(waited, std::chrono::seconds(2));
    }
    // dispatcher gone → the abandoned worker has finished unwinding
    EXPECT_FALSE(fs::exists(dir.path("out.txt")));
    EXPECT_EQ(dir.entries(), std::vector<std::string>{"in.txt"});
}

TEST(Dispatcher, GenerousTimeoutStillSucceeds)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "x\n");
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));

    const auto outcome = dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("out.txt")),
                                            std::chrono::seconds(30));
    ASSERT_TRUE(outcome.ok()) << outcome.failure().message;
    EXPECT_EQ(test::readFile(dir.path("out.txt")), "X\n");
}

TEST(Dispatcher, VerboseLogTagsLines)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "x\n");
    std::ostringstream log;
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()), &log);

    ASSERT_TRUE(dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("o.txt"))).ok());
    EXPECT_EQ(log.str().rfind("[dispatch] ", 0), 0u);
    EXPECT_NE(log.str().find("wrote "), std::string::npos);
}

TEST(Dispatcher, ThrowingObserverDoesNotChangeOutcome)
{
    ScratchDir dir;
    test::writeFile(dir.path("in.txt"), "abc\n");
    std::ostringstream log;
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()), &log);
    dispatcher.setStageObserver([](const ConversionRequest&, Dispatcher::Stage) {
        throw std::runtime_error("progress display closed");
    });

    ConversionOutcome good = ConversionOutcome::failure(ErrorKind::IoError, "unset",
                                                        request(dir.path("in.txt"), "txt"));
    ASSERT_NO_THROW(good = dispatcher.execute(request(dir.path("in.txt"), "txt", {}, dir.path("o.txt"))));
    ASSERT_TRUE(good.ok()) << good.failure().message;
    EXPECT_EQ(test::readFile(dir.path("o.txt")), "ABC\n");

    ConversionOutcome bad = good;
    ASSERT_NO_THROW(bad = dispatcher.execute(request(dir.path("in.txt"), "docx")));
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.failure().kind, ErrorKind::UnsupportedConversion);
    EXPECT_NE(log.str().find("stage observer failed at Pending: progress display closed"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Batches
// -----------------------------------------------------------------------------
class Batch : public ::testing::TestWithParam<unsigned> {};

TEST_P(Batch, OneFailureDoesNotStopTheRest)
{
    ScratchDir dir;
    for (const char* n : {"a.txt", "b.txt", "c.txt"})
        test::writeFile(dir.path(n), std::string(n) + "\n");
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));

    Options bad;
    bad.params["quality"] = "50";     // txt2docx takes no options
    const std::vector<ConversionRequest> requests{
        request(dir.path("a.txt"), "docx"),
        request(dir.path("b.txt"), "docx", bad),
        request(dir.path("c.txt"), "docx"),
    };

    BatchRunner runner(dispatcher, GetParam());
    const auto outcomes = runner.run(requests);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].ok());
    ASSERT_FALSE(outcomes[1].ok());
    EXPECT_EQ(outcomes[1].failure().kind, ErrorKind::InvalidOption);
    EXPECT_EQ(outcomes[1].failure().request.inputPath(), dir.path("b.txt"));
    EXPECT_TRUE(outcomes[2].ok());

    EXPECT_TRUE(fs::exists(dir.path("a.docx")));
    EXPECT_FALSE(fs::exists(dir.path("b.docx")));
    EXPECT_TRUE(fs::exists(dir.path("c.docx")));
}

INSTANTIATE_TEST_SUITE_P(Workers, Batch, ::testing::Values(1u, 3u));

TEST(BatchRunner, KeepsRequestOrderUnderParallelism)
{
    ScratchDir dir;
    std::vector<ConversionRequest> requests;
    for (int i = 0; i < 24; ++i) {
        const auto in = dir.path("f" + std::to_string(i) + ".txt");
        test::writeFile(in, std::to_string(i) + "\n");
        requests.push_back(request(in, "txt", {}, dir.path("out" + std::to_string(i) + ".txt")));
    }
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));

    const auto outcomes = BatchRunner(dispatcher, 4).run(requests);
    ASSERT_EQ(outcomes.size(), requests.size());
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        ASSERT_TRUE(outcomes[i].ok());
        EXPECT_EQ(outcomes[i].result().outputPath, requests[i].outputPath());
    }
}

TEST(BatchRunner, ThrowingObserverInWorkers)
{
    ScratchDir dir;
    std::vector<ConversionRequest> requests;
    for (int i = 0; i < 6; ++i) {
        const auto in = dir.path("f" + std::to_string(i) + ".txt");
        test::writeFile(in, "x\n");
        if (i % 2)
            requests.push_back(request(in, "docx"));    // no txt → docx here
        else
            requests.push_back(request(in, "txt", {}, dir.path("o" + std::to_string(i) + ".txt")));
    }
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));
    dispatcher.setStageObserver([](const ConversionRequest&, Dispatcher::Stage s) {
        if (s == Dispatcher::Stage::Failed || s == Dispatcher::Stage::Converting)
            throw std::logic_error("observer bug");
    });

    const auto outcomes = BatchRunner(dispatcher, 3).run(requests);
    ASSERT_EQ(outcomes.size(), requests.size());
    for (std::size_t i = 0; i < outcomes.size(); ++i)
        EXPECT_EQ(outcomes[i].ok(), i % 2 == 0) << i;
}

TEST(BatchRunner, EmptyBatch)
{
    Dispatcher dispatcher(registryWith(std::make_shared<UpperCaseConverter>()));
    EXPECT_TRUE(BatchRunner(dispatcher, 8).run({}).empty());
}

// -----------------------------------------------------------------------------
// File info
// -----------------------------------------------------------------------------
TEST(FileInfo, DescribesTextFile)
{
    ScratchDir dir;
    test::writeFile(dir.path("notes.txt"), "one\ntwo\nthree");
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));

    const FileInfo info = describeFile(dir.path("notes.txt"), dispatcher);
    EXPECT_EQ(info.name, "notes.txt");
    EXPECT_EQ(info.size, 13u);
    EXPECT_EQ(info.extension, ".txt");
    EXPECT_EQ(info.kind, FileKind::PlainText);
    ASSERT_EQ(info.details.size(), 1u);
    EXPECT_EQ(info.details[0], (std::pair<std::string, std::string>{"Lines", "3"}));
}

TEST(FileInfo, MissingFileThrows)
{
    Dispatcher dispatcher(ConverterFactory::createRegistry(ForgeConfig{}));
    EXPECT_THROW(describeFile("/no/such/file.txt", dispatcher), ForgeError);
}

TEST(FileInfo, ReadableSize)
{
    EXPECT_EQ(readableSize(512), "512.00 B");
    EXPECT_EQ(readableSize(1536), "1.50 KB");
    EXPECT_EQ(readableSize(5ull * 1024 * 1024), "5.00 MB");
}
