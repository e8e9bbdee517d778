#include <memory>
#include <string>

#include <catch2/catch_all.hpp>

#include <json-filter/filter/exclusion-filter.hpp>
#include <json-filter/filter/filter-factory.hpp>
#include <json-filter/filter/inclusion-filter.hpp>
#include <json-filter/json-filter.hpp>
#include <json-filter/error.hpp>

using jsonfilter::FilterType;
using jsonfilter::Json;

TEST_CASE("creates an inclusion filter") {
  auto filter = jsonfilter::FilterFactory().create(FilterType::Inclusion);

  REQUIRE(filter != nullptr);
  REQUIRE(dynamic_cast<jsonfilter::InclusionFilter *>(filter.get()) != nullptr);
}

TEST_CASE("creates an exclusion filter") {
  auto filter = jsonfilter::FilterFactory().create(FilterType::Exclusion);

  REQUIRE(filter != nullptr);
  REQUIRE(dynamic_cast<jsonfilter::ExclusionFilter *>(filter.get()) != nullptr);
}

TEST_CASE("rejects unknown filter types") {
  auto unknown = static_cast<FilterType>(42);

  CHECK_THROWS_AS(jsonfilter::FilterFactory().create(unknown), InvalidFilterType);
  CHECK_THROWS_AS(jsonfilter::select_filter(unknown), InvalidFilterType);
  CHECK_THROWS_AS(jsonfilter::filter_type_name(unknown), InvalidFilterType);
}

TEST_CASE("reports unknown filter types the same way everywhere") {
  auto unknown = static_cast<FilterType>(42);
  auto message = std::string("Unknown filter type: 42");

  REQUIRE(jsonfilter::make_unknown_type_error(unknown).what() == message);
  CHECK_THROWS_WITH(jsonfilter::FilterFactory().create(unknown), message);
  CHECK_THROWS_WITH(jsonfilter::select_filter(unknown), message);
  CHECK_THROWS_WITH(jsonfilter::filter_type_name(unknown), message);
}

TEST_CASE("names filter types") {
  CHECK(jsonfilter::filter_type_name(FilterType::Inclusion) == "INCLUSION");
  CHECK(jsonfilter::filter_type_name(FilterType::Exclusion) == "EXCLUSION");
}

TEST_CASE("looks up filter types by name") {
  CHECK(jsonfilter::filter_type_from_name("INCLUSION") == FilterType::Inclusion);
  CHECK(jsonfilter::filter_type_from_name("exclusion") == FilterType::Exclusion);

  CHECK_THROWS_AS(jsonfilter::filter_type_from_name("INVALID"), InvalidFilterType);
  CHECK_THROWS_AS(jsonfilter::filter_type_from_name(""), InvalidFilterType);
}

TEST_CASE("selects the shared filter for each type") {
  const auto &inclusion = jsonfilter::select_filter(FilterType::Inclusion);
  const auto &exclusion = jsonfilter::select_filter(FilterType::Exclusion);

  REQUIRE(&inclusion == &jsonfilter::select_filter(FilterType::Inclusion));
  REQUIRE(dynamic_cast<const jsonfilter::InclusionFilter *>(&inclusion) != nullptr);
  REQUIRE(dynamic_cast<const jsonfilter::ExclusionFilter *>(&exclusion) != nullptr);

  auto source = Json::parse(R"({"a":1,"b":2})");
  REQUIRE(inclusion.apply(source, std::string("a")).dump() == R"({"a":1})");
  REQUIRE(exclusion.apply(source, std::string("a")).dump() == R"({"b":2})");
}

TEST_CASE("factory filters behave like the free functions") {
  auto source = Json::parse(R"({"x":{"y":{"z":5},"w":10},"v":20})");
  auto factory = jsonfilter::FilterFactory();

  REQUIRE(factory.create(FilterType::Inclusion)->apply(source, std::string("x(y)"))
    == jsonfilter::apply_inclusion(source, "x(y)"));
  REQUIRE(factory.create(FilterType::Exclusion)->apply(source, std::string("x(y)"))
    == jsonfilter::apply_exclusion(source, "x(y)"));
}
