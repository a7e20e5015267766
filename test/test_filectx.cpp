#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "filectx/dispatcher.hpp"
#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"
#include "filectx/scanner.hpp"
#include "test_config.h"
#include "test_helpers.hpp"

struct TestFixture {
  xpto::filectx::root_context ctx;
  xpto::filectx::path_filter filter;

  TestFixture()
      : ctx{xpto::filectx::make_root_context(
            fs::path{TEST_FIXTURE_DIR} / "project")},
        filter{xpto::filectx::default_filter_rules()} {}

  std::vector<std::string> listed_names() const {
    std::vector<std::string> names;
    for (auto&& d : xpto::filectx::directory_scanner{ctx, filter}.scan())
      names.push_back(d.relative_path.generic_string());
    return names;
  }
};

// Global fixture instance
const TestFixture fixture;

TEST_CASE("fixture-project-listing") {
  std::vector<std::string> expected{
    "README.md",       "data/table.csv", "notes.TXT",
    "scripts/deploy.sh", "src/main.cpp",   "src/util.hpp"};
  CHECK(fixture.listed_names() == expected);
}

TEST_CASE("fixture-project-list-and-read") {
  xpto::filectx::dispatcher disp{fixture.ctx, fixture.filter};

  json::object list_req{};
  list_req["id"] = 1;
  list_req["method"] = "resources/list";
  auto listed = disp.dispatch(list_req);
  auto& resources = listed.at("result").as_object().at("resources").as_array();
  REQUIRE(resources.size() == 6);

  // Every listed uri can be read back
  for (auto&& r : resources) {
    json::object params{};
    params["uri"] = r.as_object().at("uri");
    json::object read_req{};
    read_req["id"] = str(r.as_object().at("name"));
    read_req["method"] = "resources/read";
    read_req["params"] = std::move(params);

    auto res = disp.dispatch(read_req);
    REQUIRE(res.contains("result"));
    CHECK(res.at("id") == r.as_object().at("name"));
    auto& contents = res.at("result").as_object().at("contents").as_array();
    REQUIRE(contents.size() == 1);
    CHECK_FALSE(str(contents[0].as_object().at("text")).empty());
  }
}
