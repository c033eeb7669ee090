#include "resolver.hpp"
#include "util.hpp"
#include <filesystem>

namespace slidesearch {

PdfPageResolver::PdfPageResolver(std::string pdf_dir) : pdf_dir_(std::move(pdf_dir)) {}

ArtifactHandle PdfPageResolver::resolve(const SlideRecord& record) const {
    std::string name = record.presentation_id;
    if (ends_with(to_lower(name), ".pptx")) {
        name = name.substr(0, name.size() - 5) + ".pdf";
    }

    ArtifactHandle handle;
    handle.document_path = (std::filesystem::path(pdf_dir_) / name).string();
    handle.page = record.slide_index + 1;
    return handle;
}

} // namespace slidesearch
