#include "file_forge/Log.hpp"

namespace file_forge {

void Log::line(const char* tag, const std::string& message)
{
    if (!out_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << '[' << tag << "] " << message << '\n';
    out_->flush();
}

} // namespace file_forge
