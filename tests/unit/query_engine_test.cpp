#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include <photolens/index/aspect_index.hpp>
#include <photolens/query/query_engine.hpp>
#include <tests/support/fake_provider.hpp>
#include <tests/support/temp_dir.hpp>
#include <tests/support/test_images.hpp>

using namespace photolens;
using test_support::fake_provider;

namespace {

struct fixture {
  index::aspect_index idx = [] {
    auto i = index::aspect_index::open(index::aspect_index_options{});
    REQUIRE(i.has_value());
    return std::move(*i);
  }();
  fake_provider provider;
  query::query_engine engine{idx, provider};

  void put(const std::string& path, const std::string& aspect, const std::string& text) {
    REQUIRE(idx.upsert(path, aspect, fake_provider::embed(text), text).has_value());
  }
};

} // namespace

TEST_CASE("text queries rank by description similarity", "[query]") {
  fixture f;
  f.put("/photos/car.jpg", "default", "a red car parked on the street");
  f.put("/photos/boat.jpg", "default", "a blue boat on the water");
  f.put("/photos/tree.jpg", "default", "a green tree under the sky");

  auto hits = f.engine.search_by_text("red car", std::nullopt, 2);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 2);
  REQUIRE((*hits)[0].photo_path == "/photos/car.jpg");
  REQUIRE((*hits)[0].description == "a red car parked on the street");
  REQUIRE((*hits)[0].distance <= (*hits)[1].distance);
  REQUIRE(f.provider.embed_calls.load() == 1);
  REQUIRE(f.provider.describe_calls.load() == 0);
}

TEST_CASE("aspect filters restrict text queries", "[query]") {
  fixture f;
  f.put("/photos/car.jpg", "default", "a red car");
  f.put("/photos/car.jpg", "color", "red and black");
  f.put("/photos/boat.jpg", "color", "blue and white");

  auto hits = f.engine.search_by_text("red", std::string_view("color"), 5);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 2);
  for (const auto& h : *hits) REQUIRE(h.aspect_name == "color");
  REQUIRE((*hits)[0].photo_path == "/photos/car.jpg");

  REQUIRE(f.engine.search_by_text("red", std::string_view("mood"), 5)->empty());
}

TEST_CASE("image queries are described then embedded", "[query]") {
  test_support::temp_dir tmp("query");
  fixture f;
  f.provider.set_description(24, "a dog on a beach at sunset");
  f.provider.set_description(16, "a city street at night");
  const std::string prefix = std::string(kDefaultPrompt) + " | ";
  f.put("/photos/dog.jpg", "default", prefix + "a dog on a beach at sunset");
  f.put("/photos/city.jpg", "default", prefix + "a city street at night");

  test_support::write_test_image(tmp / "query.png", 24, 24);
  auto by_path = f.engine.search_by_image(tmp / "query.png", std::nullopt, 1);
  REQUIRE(by_path.has_value());
  REQUIRE(by_path->size() == 1);
  REQUIRE(by_path->front().photo_path == "/photos/dog.jpg");
  REQUIRE(by_path->front().distance == Catch::Approx(0.0f).margin(1e-5));

  const auto bytes = test_support::encode_test_image(16, 12, ".jpg");
  auto by_bytes = f.engine.search_by_image(bytes, std::nullopt, 1);
  REQUIRE(by_bytes.has_value());
  REQUIRE(by_bytes->front().photo_path == "/photos/city.jpg");
  REQUIRE(f.provider.describe_calls.load() == 2);
}

TEST_CASE("search dispatches on the request and prefers the image", "[query]") {
  test_support::temp_dir tmp("query");
  fixture f;
  f.provider.set_description(20, "a yellow flower");
  const std::string prefix = std::string(kDefaultPrompt) + " | ";
  f.put("/photos/flower.jpg", "default", prefix + "a yellow flower");
  f.put("/photos/snow.jpg", "default", "snow on a mountain");
  test_support::write_test_image(tmp / "q.png", 20, 20);

  query::search_request both;
  both.image_path = tmp / "q.png";
  both.text = "snow mountain";
  both.k = 1;
  REQUIRE(f.engine.search(both)->front().photo_path == "/photos/flower.jpg");

  query::search_request text_only;
  text_only.text = "snow mountain";
  text_only.k = 1;
  REQUIRE(f.engine.search(text_only)->front().photo_path == "/photos/snow.jpg");

  query::search_request none;
  REQUIRE(f.engine.search(none).error().code == core::error_code::validation_failed);
  none.text = "";
  REQUIRE(f.engine.search(none).error().code == core::error_code::validation_failed);
}

TEST_CASE("query failures are terminal", "[query]") {
  test_support::temp_dir tmp("query");
  fixture f;
  f.put("/photos/a.jpg", "default", "a cat");

  REQUIRE(f.engine.search_by_text("", std::nullopt, 5).error().code == core::error_code::validation_failed);

  test_support::write_bytes(tmp / "broken.png", "garbage");
  REQUIRE(f.engine.search_by_image(tmp / "broken.png", std::nullopt, 5).error().code ==
          core::error_code::image_read);

  test_support::write_test_image(tmp / "refused.png", 9, 9);
  f.provider.failing_width = 9;
  auto r = f.engine.search_by_image(tmp / "refused.png", std::nullopt, 5);
  REQUIRE(core::kind_of(r.error()) == core::error_kind::provider);
}

TEST_CASE("k bounds the result count and an empty store returns nothing", "[query]") {
  fixture f;
  REQUIRE(f.engine.search_by_text("anything", std::nullopt, 5)->empty());
  for (int i = 0; i < 7; ++i) f.put("/p" + std::to_string(i) + ".jpg", "default", "photo number " + std::to_string(i));
  REQUIRE(f.engine.search_by_text("photo", std::nullopt, 3)->size() == 3);
  REQUIRE(f.engine.search_by_text("photo", std::nullopt, 0)->empty());
  REQUIRE(f.engine.search_by_text("photo", std::nullopt, 100)->size() == 7);
}
