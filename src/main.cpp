#include "config.hpp"
#include "corpus_store.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "query_engine.hpp"
#include "resolver.hpp"
#include "stores/sqlite_store.hpp"
#include "util.hpp"
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: slidesearch [options] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  build                Embed the slide summaries and save the index\n"
              << "  query TEXT           Print the slides that best match TEXT\n"
              << "  interactive          Read queries from stdin until EOF or /quit\n"
              << "\n"
              << "Options:\n"
              << "  --summaries FILE     Slide summaries (default: text_output/slide_summaries.json)\n"
              << "  --index FILE         Saved index (default: text_output/slide_index.db)\n"
              << "  -k N                 Number of results (default: 3)\n"
              << "  --embedder NAME      Embedding provider (ollama, openai, compatible, hashing)\n"
              << "  --model NAME         Embedding model\n"
              << "  --pdf-dir DIR        Directory holding the exported PDFs (default: pdf_output)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n"
              << "  COMPATIBLE_BASE_URL  Base URL for an OpenAI-compatible embedding server\n"
              << "  SLIDESEARCH_EMBEDDER Embedding provider\n"
              << "  SLIDESEARCH_MODEL    Embedding model\n";
}

static slidesearch::Corpus load_corpus(const slidesearch::Config& config) {
    auto store = slidesearch::create_corpus_store(config);
    return store->load();
}

static slidesearch::BuildOptions build_options(const slidesearch::Config& config) {
    slidesearch::BuildOptions options;
    options.batch_size = config.embeddings.batch_size;
    options.workers = config.embeddings.workers;
    return options;
}

// Saved index when it still matches the summaries, otherwise an in-memory
// build from them.
static void load_or_build(slidesearch::QueryEngine& engine, const slidesearch::Config& config) {
    std::string index_path = config.index_path();
    std::shared_ptr<const slidesearch::IndexSnapshot> saved;
    if (std::filesystem::exists(index_path)) {
        slidesearch::IndexSnapshotStore store(index_path);
        saved = store.load();
    }
    if (!saved) {
        std::cerr << "[slidesearch] No saved index at " << index_path
                  << ", building from summaries\n";
    }

    slidesearch::Corpus corpus;
    try {
        corpus = load_corpus(config);
    } catch (const slidesearch::CorpusIoError& e) {
        if (!saved) throw;
        std::cerr << "[slidesearch] Cannot read summaries (" << e.what()
                  << "), using the saved index as is\n";
        engine.install(std::move(saved));
        return;
    }
    engine.install_or_rebuild(std::move(saved), corpus);
}

static void print_results(const std::vector<slidesearch::SearchResult>& results,
                          const slidesearch::ResultResolver& resolver) {
    if (results.empty()) {
        std::cout << "No matches.\n";
        return;
    }
    for (const auto& r : results) {
        auto handle = resolver.resolve(r.record);
        std::cout << r.rank << ". " << r.record.presentation_id
                  << " - Slide " << (r.record.slide_index + 1)
                  << " (" << std::fixed << std::setprecision(3) << r.score << ")\n"
                  << "   " << handle.document_path << ", page " << handle.page << "\n";
    }
}

static int run_build(const slidesearch::Config& config, slidesearch::Embedder& embedder) {
    auto corpus = load_corpus(config);
    auto snapshot = slidesearch::build_snapshot(corpus, embedder, build_options(config));

    slidesearch::IndexSnapshotStore store(config.index_path());
    store.save(*snapshot, config.corpus_path());
    std::cout << "Indexed " << snapshot->corpus.size() << " slides into "
              << config.index_path() << "\n";
    return 0;
}

static int run_query(const slidesearch::Config& config, slidesearch::Embedder& embedder,
                     const std::string& text) {
    slidesearch::QueryEngine engine(embedder, build_options(config));
    load_or_build(engine, config);

    slidesearch::PdfPageResolver resolver(config.search.pdf_dir);
    print_results(engine.query(text, config.search.top_k), resolver);
    return 0;
}

static int run_interactive(const slidesearch::Config& config, slidesearch::Embedder& embedder) {
    slidesearch::QueryEngine engine(embedder, build_options(config));
    load_or_build(engine, config);
    slidesearch::PdfPageResolver resolver(config.search.pdf_dir);

    std::cout << "Slide search over " << engine.snapshot()->corpus.size() << " slides ("
              << embedder.model_id() << ")\n"
              << "Type a query, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "search> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = slidesearch::trim(line);
        if (line.empty()) continue;
        if (line == "/quit" || line == "/exit") break;

        try {
            print_results(engine.query(line, config.search.top_k), resolver);
        } catch (const slidesearch::EmbeddingError& e) {
            // The index is still usable; let the user try again.
            std::cerr << "Error: " << e.what() << "\n";
        }
        std::cout << "\n";
    }
    return 0;
}

static uint32_t parse_top_k(const std::string& arg) {
    size_t used = 0;
    unsigned long k = 0;
    try {
        k = std::stoul(arg, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != arg.size() || arg[0] == '-' || k == 0 || k > UINT32_MAX) {
        throw std::invalid_argument("-k expects a positive integer, got '" + arg + "'");
    }
    return static_cast<uint32_t>(k);
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string summaries_path;
    std::string index_path;
    std::string embedder_name;
    std::string model_name;
    std::string pdf_dir;
    std::string top_k;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--summaries") == 0 && i + 1 < argc) {
            summaries_path = argv[++i];
        } else if (std::strcmp(argv[i], "--index") == 0 && i + 1 < argc) {
            index_path = argv[++i];
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            top_k = argv[++i];
        } else if (std::strcmp(argv[i], "--embedder") == 0 && i + 1 < argc) {
            embedder_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--pdf-dir") == 0 && i + 1 < argc) {
            pdf_dir = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }
    const std::string command = positional.front();

    auto config = slidesearch::Config::load();

    // Override config with CLI args
    if (!summaries_path.empty()) {
        config.corpus.path = summaries_path;
        if (slidesearch::ends_with(slidesearch::to_lower(summaries_path), ".json")) {
            config.corpus.backend = "json";
        } else if (slidesearch::ends_with(slidesearch::to_lower(summaries_path), ".db")) {
            config.corpus.backend = "sqlite";
        }
    }
    if (!index_path.empty()) config.index.path = index_path;
    if (!embedder_name.empty()) config.embeddings.provider = embedder_name;
    if (!model_name.empty()) config.embeddings.model = model_name;
    if (!pdf_dir.empty()) config.search.pdf_dir = pdf_dir;
    if (!top_k.empty()) config.search.top_k = parse_top_k(top_k);

    slidesearch::SocketHttpClient http_client;
    auto embedder = slidesearch::create_embedder(config, http_client);

    if (command == "build" && positional.size() == 1) {
        return run_build(config, *embedder);
    }
    if (command == "query" && positional.size() >= 2) {
        std::string text;
        for (size_t i = 1; i < positional.size(); ++i) {
            if (!text.empty()) text += ' ';
            text += positional[i];
        }
        return run_query(config, *embedder, text);
    }
    if (command == "interactive" && positional.size() == 1) {
        return run_interactive(config, *embedder);
    }

    if (command == "query" && positional.size() == 1) {
        std::cerr << "Error: query needs search text\n";
    } else {
        std::cerr << "Unknown command: " << command << "\n";
    }
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
