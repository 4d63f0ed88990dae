#include <catch2/catch_all.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <photolens/provider/ollama_provider.hpp>
#include <tests/support/fake_transport.hpp>

using namespace photolens;
using photolens::provider::ollama_options;
using photolens::provider::ollama_provider;
using json = nlohmann::json;

namespace {

struct fixture {
  std::shared_ptr<test_support::fake_transport> transport = std::make_shared<test_support::fake_transport>();
  ollama_provider provider{make_options(), transport};

  static ollama_options make_options() {
    ollama_options o;
    o.endpoint = "http://ollama.test:11434/";
    o.model = "llava-phi3:latest";
    o.embedding_model = "nomic-embed-text";
    o.timeout = std::chrono::milliseconds(1500);
    return o;
  }
};

image::canonical_image tiny_image() { return image::canonical_image{"iVBORw0KGgo=", 1, 1}; }

} // namespace

TEST_CASE("describe posts a streaming generate request and joins the fragments", "[provider][ollama]") {
  fixture f;
  f.transport->push_response(200,
                             "{\"response\":\"  A red \",\"done\":false}\n"
                             "{\"response\":\"car.\",\"done\":false}\n"
                             "\n"
                             "{\"response\":\"\",\"done\":true}\n");
  auto text = f.provider.describe(tiny_image(), "Describe this image in detail:");
  REQUIRE(text.has_value());
  REQUIRE(*text == "A red car.");

  const auto reqs = f.transport->requests();
  REQUIRE(reqs.size() == 1);
  REQUIRE(reqs[0].method == "POST");
  REQUIRE(reqs[0].url == "http://ollama.test:11434/api/generate");
  REQUIRE(reqs[0].timeout == std::chrono::milliseconds(1500));
  const auto body = json::parse(reqs[0].body);
  REQUIRE(body["model"] == "llava-phi3:latest");
  REQUIRE(body["prompt"] == "Describe this image in detail:");
  REQUIRE(body["images"].size() == 1);
  REQUIRE(body["images"][0] == "iVBORw0KGgo=");
  REQUIRE(body["stream"] == true);
}

TEST_CASE("generate stream errors and garbage are reported", "[provider][ollama]") {
  fixture f;
  SECTION("error chunk") {
    f.transport->push_response(200, "{\"error\":\"model not loaded\"}\n");
    auto r = f.provider.describe(tiny_image(), "p");
    REQUIRE(r.error().code == core::error_code::provider_failed);
    REQUIRE(r.error().message == "model not loaded");
  }
  SECTION("not json") {
    f.transport->push_response(200, "<html>proxy error</html>");
    REQUIRE(f.provider.describe(tiny_image(), "p").error().code == core::error_code::provider_malformed);
  }
  SECTION("empty body") {
    f.transport->push_response(200, "");
    REQUIRE(f.provider.describe(tiny_image(), "p").error().code == core::error_code::provider_malformed);
  }
}

TEST_CASE("embed_text uses the embedding model", "[provider][ollama]") {
  fixture f;
  f.transport->push_response(200, "{\"embedding\":[0.5,-0.25,1.0]}");
  auto v = f.provider.embed_text("a red car");
  REQUIRE(v.has_value());
  REQUIRE(*v == std::vector<float>{0.5f, -0.25f, 1.0f});

  const auto body = json::parse(f.transport->requests()[0].body);
  REQUIRE(f.transport->requests()[0].url == "http://ollama.test:11434/api/embeddings");
  REQUIRE(body["model"] == "nomic-embed-text");
  REQUIRE(body["prompt"] == "a red car");
}

TEST_CASE("embedding responses without vectors are malformed", "[provider][ollama]") {
  fixture f;
  f.transport->push_response(200, "{\"embedding\":[]}");
  f.transport->push_response(200, "{\"vector\":[1,2]}");
  f.transport->push_response(200, "{\"embedding\":[\"x\"]}");
  REQUIRE(f.provider.embed_text("a").error().code == core::error_code::provider_malformed);
  REQUIRE(f.provider.embed_text("a").error().code == core::error_code::provider_malformed);
  REQUIRE(f.provider.embed_text("a").error().code == core::error_code::provider_malformed);
  REQUIRE(f.provider.embed_text("").error().code == core::error_code::invalid_argument);
  REQUIRE(f.transport->requests().size() == 3);
}

TEST_CASE("HTTP error statuses become provider_failed with the server's message", "[provider][ollama]") {
  fixture f;
  f.transport->push_response(404, "{\"error\":\"model 'llava-phi3:latest' not found\"}");
  auto r = f.provider.embed_text("x");
  REQUIRE(r.error().code == core::error_code::provider_failed);
  REQUIRE(r.error().message == "/api/embeddings returned HTTP 404: model 'llava-phi3:latest' not found");

  f.transport->push_response(502, "Bad Gateway");
  REQUIRE(f.provider.list_models().error().message == "/api/tags returned HTTP 502");
}

TEST_CASE("transport failures propagate unchanged", "[provider][ollama]") {
  fixture f;
  f.transport->push_error(core::error{core::error_code::provider_timeout, "timed out", "provider.curl"});
  auto r = f.provider.describe(tiny_image(), "p");
  REQUIRE(r.error().code == core::error_code::provider_timeout);
  REQUIRE(core::kind_of(r.error()) == core::error_kind::provider);
}

TEST_CASE("list_models reads model names from tags", "[provider][ollama]") {
  fixture f;
  f.transport->push_response(200, "{\"models\":[{\"name\":\"llava-phi3:latest\",\"size\":1},{\"name\":\"nomic-embed-text\"}]}");
  auto models = f.provider.list_models();
  REQUIRE(models.has_value());
  REQUIRE(*models == std::vector<std::string>{"llava-phi3:latest", "nomic-embed-text"});
  REQUIRE(f.transport->requests()[0].method == "GET");

  f.transport->push_response(200, "{\"tags\":[]}");
  REQUIRE(f.provider.list_models().error().code == core::error_code::provider_malformed);
}

TEST_CASE("describe_and_embed chains description and embedding", "[provider]") {
  fixture f;
  f.transport->push_response(200, "{\"response\":\"a dog on a beach\",\"done\":true}\n");
  f.transport->push_response(200, "{\"embedding\":[1,0]}");
  auto de = f.provider.describe_and_embed(tiny_image());
  REQUIRE(de.has_value());
  REQUIRE(de->description == "a dog on a beach");
  REQUIRE(de->embedding == std::vector<float>{1.0f, 0.0f});

  const auto reqs = f.transport->requests();
  REQUIRE(json::parse(reqs[0].body)["prompt"] == f.provider.default_prompt());
  REQUIRE(json::parse(reqs[1].body)["prompt"] == "a dog on a beach");
}

TEST_CASE("an empty description is malformed and not embedded", "[provider]") {
  fixture f;
  f.transport->push_response(200, "{\"response\":\"   \",\"done\":true}\n");
  auto de = f.provider.describe_and_embed(tiny_image(), std::string_view("custom prompt"));
  REQUIRE(de.error().code == core::error_code::provider_malformed);
  REQUIRE(f.transport->requests().size() == 1);
  REQUIRE(json::parse(f.transport->requests()[0].body)["prompt"] == "custom prompt");
}

TEST_CASE("from_config maps endpoint, models and prompt", "[provider][ollama]") {
  config cfg;
  cfg.endpoint = "http://gpu-box:11434//";
  cfg.model = "llava:13b";
  cfg.default_prompt = "What is in this photo?";
  auto p = ollama_provider::from_config(cfg, std::make_shared<test_support::fake_transport>());
  REQUIRE(p->options().endpoint == "http://gpu-box:11434");
  REQUIRE(p->options().embedding_model == "llava:13b");
  REQUIRE(p->default_prompt() == "What is in this photo?");
}
