#include <catch2/catch.hpp>
#include "resolver.hpp"

using namespace slidesearch;

TEST_CASE("PdfPageResolver: pptx maps to pdf page index + 1", "[resolver]") {
    PdfPageResolver resolver("pdf_output");
    auto handle = resolver.resolve({"Q3 Review.pptx", 4, "Budget"});
    REQUIRE(handle.document_path == "pdf_output/Q3 Review.pdf");
    REQUIRE(handle.page == 5);
}

TEST_CASE("PdfPageResolver: first slide is page 1", "[resolver]") {
    PdfPageResolver resolver("/srv/pdf");
    REQUIRE(resolver.resolve({"deck.pptx", 0, "Intro"}).page == 1);
}

TEST_CASE("PdfPageResolver: extension match ignores case", "[resolver]") {
    PdfPageResolver resolver("out");
    REQUIRE(resolver.resolve({"DECK.PPTX", 0, "x"}).document_path == "out/DECK.pdf");
}

TEST_CASE("PdfPageResolver: other names are kept as is", "[resolver]") {
    PdfPageResolver resolver("out");
    REQUIRE(resolver.resolve({"deckA", 2, "x"}).document_path == "out/deckA");
    REQUIRE(resolver.resolve({"notes.pdf", 2, "x"}).document_path == "out/notes.pdf");
}

TEST_CASE("PdfPageResolver: usable through the interface", "[resolver]") {
    PdfPageResolver pdf("pdf_output");
    const ResultResolver& resolver = pdf;
    REQUIRE(resolver.resolve({"a.pptx", 9, "x"}).page == 10);
    REQUIRE(pdf.pdf_dir() == "pdf_output");
}
