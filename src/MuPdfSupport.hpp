#pragma once
// Internal: RAII around MuPDF handles.
//
// MuPDF reports errors with setjmp/longjmp (fz_try / fz_catch). A C++
// exception must never be thrown between fz_try and fz_catch, so callers
// record the failure inside the block and throw after it.

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace file_forge {

// one context per conversion; contexts are never shared between threads
class MuPdfContext {
public:
    MuPdfContext()
        : ctx_(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT))
    {
        if (!ctx_)
            throw std::runtime_error("cannot create MuPDF context");

        bool failed = false;
        fz_try(ctx_) { fz_register_document_handlers(ctx_); }
        fz_catch(ctx_) { failed = true; }
        if (failed) {
            fz_drop_context(ctx_);
            throw std::runtime_error("cannot register MuPDF document handlers");
        }
    }
    ~MuPdfContext() { fz_drop_context(ctx_); }

    MuPdfContext(const MuPdfContext&)            = delete;
    MuPdfContext& operator=(const MuPdfContext&) = delete;

    fz_context* get() const { return ctx_; }

private:
    fz_context* ctx_;
};

struct FzDocumentDrop {
    fz_context* ctx;
    void operator()(fz_document* doc) const { fz_drop_document(ctx, doc); }
};
struct PdfDocumentDrop {
    fz_context* ctx;
    void operator()(pdf_document* doc) const { pdf_drop_document(ctx, doc); }
};

using FzDocumentPtr  = std::unique_ptr<fz_document, FzDocumentDrop>;
using PdfDocumentPtr = std::unique_ptr<pdf_document, PdfDocumentDrop>;

inline FzDocumentPtr openDocument(fz_context* ctx, const std::string& path)
{
    fz_document* doc = nullptr;
    std::string  error;
    fz_var(doc);
    fz_try(ctx) { doc = fz_open_document(ctx, path.c_str()); }
    fz_catch(ctx) { error = fz_caught_message(ctx); }
    if (!doc)
        throw std::runtime_error("MuPDF cannot open " + path + ": " + error);
    return FzDocumentPtr(doc, FzDocumentDrop{ctx});
}

inline PdfDocumentPtr openPdf(fz_context* ctx, const std::string& path)
{
    pdf_document* doc = nullptr;
    std::string   error;
    fz_var(doc);
    fz_try(ctx) { doc = pdf_open_document(ctx, path.c_str()); }
    fz_catch(ctx) { error = fz_caught_message(ctx); }
    if (!doc)
        throw std::runtime_error("MuPDF cannot open " + path + ": " + error);
    return PdfDocumentPtr(doc, PdfDocumentDrop{ctx});
}

} // namespace file_forge
