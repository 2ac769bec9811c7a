#include "analytics_cache/key_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <set>

using namespace analytics_cache;

TEST_CASE("keys ignore object key order at every depth", "[keys]") {
  Json a = {{"a", 1}, {"b", 2}};
  Json b = {{"b", 2}, {"a", 1}};
  CHECK(generate_key("stats", a) == generate_key("stats", b));

  Json nested_a = Json::parse(R"({"filter":{"platform":"reddit","min":5},"limit":10})");
  Json nested_b = Json::parse(R"({"limit":10,"filter":{"min":5,"platform":"reddit"}})");
  CHECK(generate_key("stats", nested_a) == generate_key("stats", nested_b));
}

TEST_CASE("keys have the namespace:digest shape", "[keys]") {
  const auto key = generate_key("trend", Json{{"a", 1}});
  REQUIRE(key.size() == std::string("trend:").size() + 16);
  CHECK(key.rfind("trend:", 0) == 0);
  const auto digest = key.substr(6);
  CHECK(digest.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("namespaces and params both separate keys", "[keys]") {
  CHECK(generate_key("ns", Json{{"a", 1}}) !=
        generate_key("ns2", Json{{"a", 1}}));
  CHECK(generate_key("ns", Json{{"a", 1}}) !=
        generate_key("ns", Json{{"a", 2}}));
  CHECK(generate_key("ns", Json::array({1, 2})) !=
        generate_key("ns", Json::array({2, 1})));
  CHECK(generate_key("ns", Json{{"a", "1"}}) !=
        generate_key("ns", Json{{"a", 1}}));

  std::set<std::string> digests;
  for (int i = 0; i < 2000; ++i)
    digests.insert(params_digest(Json{{"day", i}, {"platform", "reddit"}}));
  CHECK(digests.size() == 2000);
}

TEST_CASE("time points serialize to a fixed text form", "[keys]") {
  const TimePoint start{std::chrono::milliseconds(1709294400123)};
  CHECK(format_timestamp(start) == "2024-03-01T12:00:00.123Z");

  Json with_date = {{"start", start}, {"platform", "hackernews"}};
  CHECK(with_date["start"] == "2024-03-01T12:00:00.123Z");
  Json same = {{"platform", "hackernews"},
               {"start", TimePoint{std::chrono::milliseconds(1709294400123)}}};
  CHECK(generate_key("range", with_date) == generate_key("range", same));

  Json later = {{"start", start + std::chrono::milliseconds(1)},
                {"platform", "hackernews"}};
  CHECK(generate_key("range", with_date) != generate_key("range", later));
}

TEST_CASE("canonical form is stable text", "[keys]") {
  CHECK(canonical_params(Json{{"b", Json::array({3, 1})}, {"a", nullptr}}) ==
        R"({"a":null,"b":[3,1]})");
  CHECK(fnv1a64("") == 1469598103934665603ULL);
}
