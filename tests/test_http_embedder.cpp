#include <catch2/catch.hpp>
#include "embedders/http_embedder.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace slidesearch;

static bool has_header(const std::vector<Header>& headers, const std::string& name,
                       const std::string& value) {
    for (const auto& [k, v] : headers) {
        if (k == name && v == value) return true;
    }
    return false;
}

// ── Ollama ───────────────────────────────────────────────────────

TEST_CASE("OllamaEmbedder: sends the batch to /api/embed", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"embeddings": [[0.1, 0.2, 0.3], [0.4, 0.5, 0.6]]})");

    auto embedder = create_ollama_embedder(http, "", "", 12);
    auto vectors = embedder->embed_batch({"first", "second"});

    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_url == "http://localhost:11434/api/embed");
    REQUIRE(http.last_timeout == 12);

    auto body = nlohmann::json::parse(http.last_body);
    REQUIRE(body["model"] == "all-minilm");
    REQUIRE(body["input"] == nlohmann::json::array({"first", "second"}));

    REQUIRE(vectors.size() == 2);
    REQUIRE(vectors[1] == Embedding{0.4f, 0.5f, 0.6f});
}

TEST_CASE("OllamaEmbedder: dimensions follow the model's output", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"embeddings": [[1, 2, 3, 4, 5]]})");

    auto embedder = create_ollama_embedder(http, "http://gpu-box:11434", "nomic-embed-text", 30);
    REQUIRE(embedder->dimensions() == 384);
    embedder->embed_one("hello");
    REQUIRE(embedder->dimensions() == 5);
    REQUIRE(http.last_url == "http://gpu-box:11434/api/embed");
    REQUIRE(embedder->model_id() == "ollama:nomic-embed-text");
}

TEST_CASE("OllamaEmbedder: wrong number of vectors fails", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"embeddings": [[0.1, 0.2]]})");

    auto embedder = create_ollama_embedder(http, "", "", 30);
    REQUIRE_THROWS_AS(embedder->embed_batch({"a", "b"}), EmbeddingError);
}

TEST_CASE("OllamaEmbedder: ragged vectors fail", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"embeddings": [[0.1, 0.2], [0.3]]})");

    auto embedder = create_ollama_embedder(http, "", "", 30);
    REQUIRE_THROWS_AS(embedder->embed_batch({"a", "b"}), EmbeddingError);
}

// ── OpenAI ───────────────────────────────────────────────────────

TEST_CASE("OpenAIEmbedder: bearer auth and endpoint", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"data": [{"index": 0, "embedding": [0.5, 0.5]}]})");

    auto embedder = create_openai_embedder("sk-test", http, "", "", 30);
    embedder->embed_one("hello");

    REQUIRE(http.last_url == "https://api.openai.com/v1/embeddings");
    REQUIRE(has_header(http.last_headers, "Authorization", "Bearer sk-test"));
    REQUIRE(has_header(http.last_headers, "Content-Type", "application/json"));
    REQUIRE(nlohmann::json::parse(http.last_body)["model"] == "text-embedding-3-small");
}

TEST_CASE("OpenAIEmbedder: reorders results by index", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"data": [
        {"index": 2, "embedding": [3.0, 3.0]},
        {"index": 0, "embedding": [1.0, 1.0]},
        {"index": 1, "embedding": [2.0, 2.0]}
    ]})");

    auto embedder = create_openai_embedder("sk-test", http, "", "", 30);
    auto vectors = embedder->embed_batch({"a", "b", "c"});

    REQUIRE(vectors.size() == 3);
    REQUIRE(vectors[0] == Embedding{1.0f, 1.0f});
    REQUIRE(vectors[1] == Embedding{2.0f, 2.0f});
    REQUIRE(vectors[2] == Embedding{3.0f, 3.0f});
}

TEST_CASE("OpenAIEmbedder: repeated index is rejected", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"data": [
        {"index": 0, "embedding": [1.0]},
        {"index": 0, "embedding": [2.0]}
    ]})");

    auto embedder = create_openai_embedder("sk-test", http, "", "", 30);
    REQUIRE_THROWS_AS(embedder->embed_batch({"a", "b"}), EmbeddingError);
}

TEST_CASE("CompatibleEmbedder: no auth header without a key", "[http_embedder]") {
    MockHttpClient http;
    http.next_response = ok_response(R"({"data": [{"index": 0, "embedding": [0.1]}]})");

    auto embedder = create_compatible_embedder("", http, "http://embed:8080/v1", "", 30);
    embedder->embed_one("hello");

    REQUIRE(http.last_url == "http://embed:8080/v1/embeddings");
    for (const auto& [k, v] : http.last_headers) {
        REQUIRE(k != "Authorization");
    }
    REQUIRE(embedder->model_id() == "compatible:all-MiniLM-L6-v2");
}

// ── Failures ─────────────────────────────────────────────────────

static EmbeddingError capture_error(Embedder& embedder) {
    try {
        embedder.embed_one("hello");
    } catch (const EmbeddingError& e) {
        return e;
    }
    FAIL("expected EmbeddingError");
    return EmbeddingError("unreachable");
}

TEST_CASE("HttpEmbedder: transport failure is transient", "[http_embedder]") {
    MockHttpClient http;
    http.next_response.status_code = 0;
    http.next_response.error = "timed out after 30s";

    auto embedder = create_ollama_embedder(http, "", "", 30);
    auto err = capture_error(*embedder);
    REQUIRE(err.transient());
    REQUIRE(std::string(err.what()).find("timed out") != std::string::npos);
}

TEST_CASE("HttpEmbedder: server errors are transient", "[http_embedder]") {
    MockHttpClient http;
    auto embedder = create_openai_embedder("sk-test", http, "", "", 30);

    for (long status : {408L, 429L, 500L, 503L}) {
        http.next_response.status_code = status;
        http.next_response.body = "busy";
        REQUIRE(capture_error(*embedder).transient());
    }
}

TEST_CASE("HttpEmbedder: client errors are not transient", "[http_embedder]") {
    MockHttpClient http;
    auto embedder = create_openai_embedder("sk-bad", http, "", "", 30);

    for (long status : {400L, 401L, 404L}) {
        http.next_response.status_code = status;
        http.next_response.body = R"({"error": "nope"})";
        REQUIRE_FALSE(capture_error(*embedder).transient());
    }
}

TEST_CASE("HttpEmbedder: unreadable body is an embedding error", "[http_embedder]") {
    MockHttpClient http;
    auto embedder = create_ollama_embedder(http, "", "", 30);

    http.next_response = ok_response("<html>proxy error</html>");
    REQUIRE_THROWS_AS(embedder->embed_one("hello"), EmbeddingError);

    http.next_response = ok_response(R"({"unexpected": true})");
    REQUIRE_THROWS_AS(embedder->embed_one("hello"), EmbeddingError);
}

TEST_CASE("HttpEmbedder: blank text never reaches the server", "[http_embedder]") {
    MockHttpClient http;
    auto embedder = create_ollama_embedder(http, "", "", 30);

    REQUIRE_THROWS_AS(embedder->embed_batch({"fine", " "}), EmbeddingError);
    REQUIRE(http.call_count == 0);
}
