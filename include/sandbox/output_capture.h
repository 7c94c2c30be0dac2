#pragma once

#include <string>
#include <memory>

namespace snipbox {
namespace sandbox {

// Points the interpreter's sys.stdout and sys.stderr at one shared in-memory
// buffer, so both streams interleave in write order. The previous streams
// come back on destruction; a pending interpreter error is kept intact.
// GIL required for construction, text() and destruction.
class ScopedOutputCapture {
public:
    ScopedOutputCapture();
    ~ScopedOutputCapture();

    ScopedOutputCapture(const ScopedOutputCapture&) = delete;
    ScopedOutputCapture& operator=(const ScopedOutputCapture&) = delete;

    bool ok() const;
    const std::string& error() const;

    std::string text() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
