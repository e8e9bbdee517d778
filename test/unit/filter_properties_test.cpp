#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>

#include <json-filter/json-filter.hpp>

using jsonfilter::Json;

TEST_CASE("matches the reference scenarios") {
  auto flat = Json::parse(R"({"a":1,"b":2,"c":3})");
  CHECK(jsonfilter::apply_inclusion(flat, "a,b").dump() == R"({"a":1,"b":2})");
  CHECK(jsonfilter::apply_exclusion(flat, "a,b").dump() == R"({"c":3})");

  auto nested = Json::parse(R"({"x":{"y":{"z":5},"w":10},"v":20})");
  CHECK(jsonfilter::apply_inclusion(nested, "x(y)").dump() == R"({"x":{"y":{"z":5}}})");
  CHECK(jsonfilter::apply_exclusion(nested, "x(y)").dump() == R"({"x":{"w":10},"v":20})");

  auto arrays = Json::parse(R"([[[{"name":"john","type":0}]]])");
  CHECK(jsonfilter::apply_inclusion(arrays, "name").dump() == R"([[[{"name":"john"}]]])");

  auto prop = Json::parse(R"({"prop":{"key1":"value1","key2":"value2"}})");
  CHECK(jsonfilter::apply_exclusion(prop, "prop()") == prop);
}

TEST_CASE("never modifies the source") {
  auto source = Json::parse(R"({"a":{"b":[{"c":1,"d":null},2]},"e":"f","g":[true,false]})");
  auto before = source.dump();

  for (auto paths : { "", "a", "a(b(c))", "a(b(d)),e", "g,e", "x(y)" }) {
    jsonfilter::apply_inclusion(source, paths);
    jsonfilter::apply_exclusion(source, paths);
    REQUIRE(source.dump() == before);
  }
}

TEST_CASE("passes primitives through an empty inclusion expression") {
  for (auto primitive : { Json("text"), Json(42), Json(1.5), Json(false) }) {
    REQUIRE(jsonfilter::apply_inclusion(primitive, "") == primitive);
  }
}

TEST_CASE("passes containers through an empty exclusion expression") {
  for (auto text : { "{}", "[]", R"({"a":[1,{"b":null}]})", R"([{"a":1},"x",null])" }) {
    auto source = Json::parse(text);
    REQUIRE(jsonfilter::apply_exclusion(source, "") == source);
  }
}

TEST_CASE("inclusion and exclusion partition top-level keys") {
  auto source = Json::parse(R"({"id":1,"name":"n","meta":{"x":1},"tags":"t","flag":true})");
  auto paths = "name,tags,flag";

  auto kept = jsonfilter::apply_inclusion(source, paths);
  auto dropped = jsonfilter::apply_exclusion(source, paths);

  REQUIRE(kept.size() + dropped.size() == source.size());

  for (const auto &[key, value] : source.items()) {
    auto in_kept = kept.contains(key);
    auto in_dropped = dropped.contains(key);

    REQUIRE(in_kept != in_dropped);
    REQUIRE((in_kept ? kept[key] : dropped[key]) == value);
  }
}

TEST_CASE("allows concurrent use of the shared filters") {
  auto source = Json::parse(R"({"users":[{"id":1,"name":"a","secret":"x"},{"id":2,"name":"b","secret":"y"}]})");
  auto expected_inclusion = jsonfilter::apply_inclusion(source, "users(id,name)");
  auto expected_exclusion = jsonfilter::apply_exclusion(source, "users(secret)");

  std::vector<std::thread> threads;
  std::vector<int> matches(8, 0);

  for (size_t t = 0; t < matches.size(); t++) {
    threads.emplace_back([&, t] {
      bool ok = true;
      for (int i = 0; i < 100; i++) {
        ok = ok && jsonfilter::apply_inclusion(source, "users(id,name)") == expected_inclusion;
        ok = ok && jsonfilter::apply_exclusion(source, "users(secret)") == expected_exclusion;
      }
      matches[t] = ok ? 1 : 0;
    });
  }

  for (auto &thread : threads) thread.join();

  for (auto match : matches) REQUIRE(match == 1);
  REQUIRE(expected_inclusion == expected_exclusion);
}
