#pragma once

#include <string>
#include <vector>

namespace rag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Turns text into vectors. Everything that needs embeddings depends on this, not on Ollama.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  // One vector per text, in input order
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;
};

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws OllamaError when no server answers at ollama_url
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  // Batches go to <ollama_url>/api/embed in a single request
  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  bool is_server_available();

  const std::string &embedding_model() const { return embedding_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
  std::string post_json(const std::string &endpoint, const std::string &body);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace rag_core
