#pragma once
#include "ConversionRequest.hpp"
#include "ConverterRegistry.hpp"
#include "FileKind.hpp"
#include "Log.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace file_forge {

class Dispatcher {
public:
    enum class Stage { Pending, Resolving, Validating, Converting, Succeeded, Failed };
    using StageObserver = std::function<void(const ConversionRequest&, Stage)>;

    explicit Dispatcher(std::shared_ptr<const ConverterRegistry> registry,
                        std::ostream*                            log = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&)            = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // extension first, then content sniffing; throws ForgeError
    // (UnrecognizedFileKind or IoError)
    FileKind resolve(const std::string& path) const;

    // never throws; timeout == 0 runs the converter on the calling thread
    ConversionOutcome execute(const ConversionRequest&  request,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    // must be set before any execute() call; exceptions it throws are logged
    // and otherwise ignored
    void setStageObserver(StageObserver observer) { observer_ = std::move(observer); }

    const ConverterRegistry& registry() const { return *registry_; }
    Log& log() { return log_; }

private:
    ConversionResult run(const ConversionRequest& request, std::chrono::milliseconds timeout);
    void stage(const ConversionRequest& request, Stage s);

    std::shared_ptr<const ConverterRegistry> registry_;
    Log                                      log_;
    StageObserver                            observer_;

    std::mutex               abandonedMutex_;
    std::vector<std::thread> abandoned_;    // timed-out conversions still unwinding
};

const char* toString(Dispatcher::Stage stage);

} // namespace file_forge
