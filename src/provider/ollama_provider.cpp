#include "photolens/provider/ollama_provider.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "photolens/core/log.hpp"

namespace photolens::provider {

using json = nlohmann::json;

namespace {

constexpr const char* kComponent = "provider.ollama";

auto malformed(std::string msg) -> core::error {
  return core::error{core::error_code::provider_malformed, std::move(msg), kComponent};
}

auto failed(std::string msg) -> core::error {
  return core::error{core::error_code::provider_failed, std::move(msg), kComponent};
}

auto trim(std::string s) -> std::string {
  const auto* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

auto error_text(const json& e) -> std::string {
  return e.is_string() ? e.get<std::string>() : e.dump();
}

// Error text reported in a JSON body, if any.
auto error_field(const std::string& body) -> std::string {
  const auto j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_object() && j.contains("error")) return error_text(j["error"]);
  return {};
}

} // namespace

ollama_provider::ollama_provider(ollama_options opts, std::shared_ptr<http_transport> transport)
    : embedding_provider(opts.default_prompt), opts_(std::move(opts)), transport_(std::move(transport)) {
  while (!opts_.endpoint.empty() && opts_.endpoint.back() == '/') opts_.endpoint.pop_back();
  if (opts_.embedding_model.empty()) opts_.embedding_model = opts_.model;
}

auto ollama_provider::from_config(const config& cfg, std::shared_ptr<http_transport> transport)
    -> std::unique_ptr<ollama_provider> {
  ollama_options o;
  o.endpoint = cfg.endpoint;
  o.model = cfg.model;
  o.embedding_model = cfg.effective_embedding_model();
  o.timeout = cfg.request_timeout;
  o.default_prompt = cfg.default_prompt;
  if (!transport) transport = std::make_shared<curl_transport>();
  return std::make_unique<ollama_provider>(std::move(o), std::move(transport));
}

auto ollama_provider::call(std::string method, std::string_view path, std::string body)
    -> std::expected<std::string, core::error> {
  http_request req;
  req.method = std::move(method);
  req.url = opts_.endpoint + std::string(path);
  req.body = std::move(body);
  req.timeout = opts_.timeout;
  auto resp = transport_->perform(req);
  if (!resp) return std::unexpected(resp.error());
  if (resp->status >= 400) {
    auto detail = error_field(resp->body);
    std::string msg = std::string(path) + " returned HTTP " + std::to_string(resp->status);
    if (!detail.empty()) msg += ": " + detail;
    return std::unexpected(failed(std::move(msg)));
  }
  return std::move(resp->body);
}

auto ollama_provider::describe(const image::canonical_image& img, std::string_view prompt)
    -> std::expected<std::string, core::error> {
  json req = {{"model", opts_.model},
              {"prompt", std::string(prompt)},
              {"images", json::array({img.base64_png})},
              {"stream", true}};
  auto body = call("POST", "/api/generate", req.dump());
  if (!body) return std::unexpected(body.error());

  try {
    std::istringstream lines(*body);
    std::string line, text;
    bool any = false;
    while (std::getline(lines, line)) {
      if (trim(line).empty()) continue;
      const auto chunk = json::parse(line);
      any = true;
      if (chunk.contains("error")) return std::unexpected(failed(error_text(chunk["error"])));
      if (chunk.contains("response")) text += chunk["response"].get<std::string>();
      if (chunk.value("done", false)) break;
    }
    if (!any) return std::unexpected(malformed("empty generate response"));
    auto out = trim(std::move(text));
    core::get_logger(core::kLogProvider)->debug("generated {} chars with {}", out.size(), opts_.model);
    return out;
  } catch (const json::exception& e) {
    return std::unexpected(malformed(std::string("generate: ") + e.what()));
  }
}

auto ollama_provider::embed_text(std::string_view text) -> std::expected<std::vector<float>, core::error> {
  if (text.empty()) {
    return std::unexpected(core::error{core::error_code::invalid_argument, "empty text", kComponent});
  }
  json req = {{"model", opts_.embedding_model}, {"prompt", std::string(text)}};
  auto body = call("POST", "/api/embeddings", req.dump());
  if (!body) return std::unexpected(body.error());

  try {
    const auto j = json::parse(*body);
    if (j.contains("error")) return std::unexpected(failed(error_text(j["error"])));
    if (!j.contains("embedding") || !j["embedding"].is_array()) {
      return std::unexpected(malformed("response has no embedding"));
    }
    auto v = j["embedding"].get<std::vector<float>>();
    if (v.empty()) return std::unexpected(malformed("empty embedding"));
    return v;
  } catch (const json::exception& e) {
    return std::unexpected(malformed(std::string("embeddings: ") + e.what()));
  }
}

auto ollama_provider::list_models() -> std::expected<std::vector<std::string>, core::error> {
  auto body = call("GET", "/api/tags", {});
  if (!body) return std::unexpected(body.error());
  try {
    const auto j = json::parse(*body);
    std::vector<std::string> names;
    for (const auto& m : j.at("models")) names.push_back(m.at("name").get<std::string>());
    return names;
  } catch (const json::exception& e) {
    return std::unexpected(malformed(std::string("tags: ") + e.what()));
  }
}

} // namespace photolens::provider
