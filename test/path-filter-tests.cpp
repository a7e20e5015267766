#include <doctest/doctest.h>

#include <filesystem>
#include <stdexcept>

#include "filectx/path_filter.hpp"
#include "test_helpers.hpp"

using xpto::filectx::path_filter;

namespace {

const path_filter& defaults() {
  static const path_filter filter{xpto::filectx::default_filter_rules()};
  return filter;
}

}  // namespace

TEST_CASE("glob-translation") {
  CHECK(xpto::filectx::glob_to_regex("*.py") == ".*\\.py");
  CHECK(xpto::filectx::glob_to_regex("file?.txt") == "file.\\.txt");
  CHECK(xpto::filectx::glob_to_regex("[!a-c]x") == "[^a-c]x");
  CHECK(xpto::filectx::glob_to_regex("[]]") == "[]]");
  CHECK(xpto::filectx::glob_to_regex("[abc") == "\\[abc");
  CHECK(xpto::filectx::glob_to_regex("venv") == "venv");
}

TEST_CASE("ignore-by-base-name") {
  auto& f = defaults();
  CHECK(f.should_ignore("/home/me/project/.git"));
  CHECK(f.should_ignore("/home/me/project/node_modules"));
  CHECK(f.should_ignore("/home/me/project/src/__pycache__"));
  CHECK(f.should_ignore("/home/me/project/.DS_Store"));
  CHECK(f.should_ignore("relative/venv"));
}

TEST_CASE("ignore-by-file-glob") {
  auto& f = defaults();
  CHECK(f.should_ignore("/p/src/app.log"));
  CHECK(f.should_ignore("/p/dist/release.tar.gz"));
  CHECK(f.should_ignore("/p/assets/logo.png"));
  CHECK(f.should_ignore("/p/lib/libfoo.so"));
  CHECK(f.should_ignore("/p/docs/manual.pdf"));
  CHECK(f.should_ignore("/p/mod.pyc"));
}

TEST_CASE("ignore-is-case-sensitive") {
  auto& f = defaults();
  CHECK_FALSE(f.should_ignore("/p/assets/LOGO.PNG"));
  CHECK_FALSE(f.should_ignore("/p/Node_Modules"));
}

TEST_CASE("not-ignored") {
  auto& f = defaults();
  CHECK_FALSE(f.should_ignore("/p/src/main.py"));
  CHECK_FALSE(f.should_ignore("/p/README.md"));
  CHECK_FALSE(f.should_ignore("/p/.gitattributes"));
  CHECK_FALSE(f.should_ignore("/p/venv2"));
  // The predicate only looks at the full path and the base name
  CHECK_FALSE(f.should_ignore("/p/node_modules/pkg/index.js"));
}

TEST_CASE("ignore-by-full-path") {
  auto rules = xpto::filectx::default_filter_rules();
  rules.ignore_patterns.push_back("*/generated/*");
  path_filter f{rules};

  CHECK(f.should_ignore("/p/generated/api.py"));
  CHECK_FALSE(f.should_ignore("/p/handwritten/api.py"));
}

TEST_CASE("invalid-pattern-throws") {
  auto rules = xpto::filectx::default_filter_rules();
  rules.ignore_patterns.push_back("[z-a]");
  CHECK_THROWS_AS((void)path_filter{rules}, std::runtime_error);
}

TEST_CASE("text-by-allowed-extension") {
  auto& f = defaults();
  CHECK(f.is_text("src/main.cpp"));
  CHECK(f.is_text("src/Main.CPP"));
  CHECK(f.is_text("README.MD"));
  CHECK(f.is_text("config.toml"));
  CHECK(f.is_text("ci/build.Dockerfile"));
}

TEST_CASE("text-by-mime-type") {
  auto& f = defaults();
  CHECK(f.is_text("data/table.csv"));
  CHECK(f.is_text("data/TABLE.CSV"));
  CHECK(f.is_text("cal/meeting.ics"));
  CHECK(f.mime_type("data/table.csv") == "text/csv");
}

TEST_CASE("not-text") {
  auto& f = defaults();
  CHECK_FALSE(f.is_text("Makefile"));
  CHECK_FALSE(f.is_text("Dockerfile"));
  CHECK_FALSE(f.is_text(".env"));
  CHECK_FALSE(f.is_text("assets/logo.png"));
  CHECK_FALSE(f.is_text("blob.unknownext"));
  CHECK_FALSE(f.mime_type("Makefile").has_value());
}

TEST_CASE("predicates-are-independent") {
  auto rules = xpto::filectx::default_filter_rules();
  rules.ignore_patterns.push_back("secret.*");
  path_filter f{rules};

  CHECK(f.should_ignore("/p/secret.txt"));
  CHECK(f.is_text("/p/secret.txt"));
}

TEST_CASE("load-mime-types") {
  tmp_tree tree;
  auto table = tree.write(
      "mime.types",
      "# comment line\n"
      "text/x-foo\tfoo fooz\n"
      "\n"
      "application/x-bar bar  # trailing comment\n"
      "text/x-lonely\n");

  auto rules = xpto::filectx::default_filter_rules();
  auto count = xpto::filectx::load_mime_types(table, rules);
  REQUIRE(count.has_value());
  CHECK(*count == 3);

  path_filter f{rules};
  CHECK(f.is_text("a.foo"));
  CHECK(f.mime_type("a.fooz") == "text/x-foo");
  CHECK_FALSE(f.is_text("a.bar"));
}

TEST_CASE("load-mime-types-missing-file") {
  tmp_tree tree;
  auto rules = xpto::filectx::default_filter_rules();
  auto before = rules.mime_types.size();
  CHECK_FALSE(xpto::filectx::load_mime_types(tree.root / "nope", rules).has_value());
  CHECK(rules.mime_types.size() == before);
}

TEST_CASE("admits") {
  auto& f = defaults();
  fs::path root{"/srv/project"};
  CHECK(f.admits(root, "src/main.cpp"));
  CHECK(f.admits(root, "README.md"));
  CHECK_FALSE(f.admits(root, "node_modules/pkg/index.js"));
  CHECK_FALSE(f.admits(root, "src/.git/hooks/pre-commit.sh"));
  CHECK_FALSE(f.admits(root, "src/app.log"));
  CHECK_FALSE(f.admits(root, "assets/logo.png"));
  CHECK_FALSE(f.admits(root, "Makefile"));
}
