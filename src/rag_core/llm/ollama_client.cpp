#include "rag_core/llm/ollama_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "ollama.hpp"

namespace rag_core {

namespace {

std::vector<float> first_embedding(const nlohmann::json &embeddings) {
  if (!embeddings.is_array()) {
    throw OllamaError("Embeddings field is not an array");
  }
  if (embeddings.size() > 0 && embeddings[0].is_array()) {
    return embeddings[0].get<std::vector<float>>();
  }
  return embeddings.get<std::vector<float>>();
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  while (!ollama_url_.empty() && ollama_url_.back() == '/') {
    ollama_url_.pop_back();
  }
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!is_server_available()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }
    return first_embedding(json_response["embeddings"]);
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  if (texts.size() == 1) {
    return {get_embedding(texts.front())};
  }

  nlohmann::json request_data = {{"model", embedding_model_}, {"input", texts}};
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(post_json("/api/embed", request_data.dump()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Invalid embedding response: " + std::string(e.what()));
  }

  if (!response.contains("embeddings") || !response["embeddings"].is_array()) {
    throw OllamaError("Response does not contain embedding field");
  }
  const auto &embeddings = response["embeddings"];
  if (embeddings.size() != texts.size()) {
    throw OllamaError("Expected " + std::to_string(texts.size()) + " embeddings, got " +
                      std::to_string(embeddings.size()));
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(embeddings.size());
  for (const auto &embedding : embeddings) {
    vectors.push_back(embedding.get<std::vector<float>>());
  }
  return vectors;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

size_t OllamaClient::write_callback(void *contents, size_t size, size_t nmemb,
                                    std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OllamaClient::post_json(const std::string &endpoint, const std::string &body) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw OllamaError("Failed to initialize CURL");
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

  const std::string url = ollama_url_ + endpoint;
  std::string response_buffer;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw OllamaError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    throw OllamaError("HTTP request to " + url + " failed with status code: " +
                      std::to_string(http_code));
  }
  return response_buffer;
}

}  // namespace rag_core
