#pragma once
#include <mutex>
#include <ostream>
#include <string>

namespace file_forge {

// Tagged diagnostic lines ("[dispatch] ..."), safe to share between batch
// workers. A null stream disables output.
class Log {
public:
    explicit Log(std::ostream* out = nullptr) : out_(out) {}

    bool enabled() const { return out_ != nullptr; }
    void line(const char* tag, const std::string& message);

private:
    std::ostream* out_;
    std::mutex    mutex_;
};

} // namespace file_forge
