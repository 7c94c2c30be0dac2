#include "sandbox/output_capture.h"
#include "python/runtime.h"
#include "utils/logger.h"

namespace snipbox {
namespace sandbox {

namespace py = pybind11;

struct ScopedOutputCapture::Impl {
    py::object sys;
    py::object buffer;
    py::object savedStdout;
    py::object savedStderr;
    bool installed = false;
    std::string error;

    void restoreStreams();
};

void ScopedOutputCapture::Impl::restoreStreams() {
    try {
        sys.attr("stdout") = savedStdout;
        sys.attr("stderr") = savedStderr;
    } catch (const py::error_already_set& e) {
        LOG_ERROR("Failed to restore interpreter output streams: " + python::describeError(e, false).message);
    }
}

ScopedOutputCapture::ScopedOutputCapture() : impl_(std::make_unique<Impl>()) {
    py::error_scope pending;
    try {
        impl_->sys = py::module_::import("sys");
        impl_->buffer = py::module_::import("io").attr("StringIO")();
        impl_->savedStdout = impl_->sys.attr("stdout");
        impl_->savedStderr = impl_->sys.attr("stderr");
    } catch (const py::error_already_set& e) {
        impl_->error = "cannot create output buffer: " + python::describeError(e, false).message;
        return;
    }

    try {
        impl_->sys.attr("stdout") = impl_->buffer;
        impl_->sys.attr("stderr") = impl_->buffer;
    } catch (const py::error_already_set& e) {
        impl_->error = "cannot redirect output: " + python::describeError(e, false).message;
        impl_->restoreStreams();
        return;
    }
    impl_->installed = true;
}

ScopedOutputCapture::~ScopedOutputCapture() {
    if (!impl_->installed) return;
    py::error_scope pending;
    impl_->restoreStreams();
}

bool ScopedOutputCapture::ok() const {
    return impl_->installed;
}

const std::string& ScopedOutputCapture::error() const {
    return impl_->error;
}

std::string ScopedOutputCapture::text() const {
    if (!impl_->buffer) return "";
    py::error_scope pending;
    try {
        // Lone surrogates (print('\ud800')) come out escaped, the rest intact.
        return python::toUtf8(impl_->buffer.attr("getvalue")());
    } catch (const py::error_already_set& e) {
        LOG_WARN("Cannot read captured output: " + python::describeError(e, false).message);
        return "";
    }
}

}
}
