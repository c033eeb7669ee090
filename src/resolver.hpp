#pragma once
#include "slide.hpp"
#include <cstdint>
#include <string>

namespace slidesearch {

// Where a search hit can be viewed.
struct ArtifactHandle {
    std::string document_path;
    uint32_t page = 1;    // 1-based
};

// Maps a slide record to a renderable artifact. Resolvers only compute the
// location; they never open the document.
class ResultResolver {
public:
    virtual ~ResultResolver() = default;
    virtual ArtifactHandle resolve(const SlideRecord& record) const = 0;
};

// Slides exported one PDF per deck: "deck.pptx" slide 3 resolves to
// page 4 of "{pdf_dir}/deck.pdf".
class PdfPageResolver : public ResultResolver {
public:
    explicit PdfPageResolver(std::string pdf_dir);

    ArtifactHandle resolve(const SlideRecord& record) const override;

    const std::string& pdf_dir() const { return pdf_dir_; }

private:
    std::string pdf_dir_;
};

} // namespace slidesearch
