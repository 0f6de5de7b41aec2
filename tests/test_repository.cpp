#include <catch2/catch_test_macros.hpp>

#include "notebook/notebook_repository.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace nbfs;
using namespace nbfs::notebook;

namespace {

constexpr std::string_view ONE_CELL = R"json({
 "nbformat": 4, "nbformat_minor": 5, "metadata": {},
 "cells": [{"cell_type": "markdown", "metadata": {}, "source": "v1"}]})json";

constexpr std::string_view TWO_CELLS = R"json({
 "nbformat": 4, "nbformat_minor": 5, "metadata": {},
 "cells": [{"cell_type": "markdown", "metadata": {}, "source": "v2"},
           {"cell_type": "raw", "metadata": {}, "source": "extra"}]})json";

bool contains(const std::vector<std::string>& names, const std::string& n) {
    return std::find(names.begin(), names.end(), n) != names.end();
}

} // namespace

TEST_CASE("Repository lists notebook files only", "[repository]") {
    test::TempDir dir;
    dir.write("a.ipynb", ONE_CELL);
    dir.write("b.ipynb", ONE_CELL);
    dir.write("notes.txt", "not a notebook");
    dir.write(".ipynb", ONE_CELL);
    std::filesystem::create_directories(dir.path() / "sub.ipynb");

    NotebookRepository repo(dir.path());
    auto names = repo.list_names();

    CHECK(names.size() == 2);
    CHECK(contains(names, "a.ipynb"));
    CHECK(contains(names, "b.ipynb"));
    CHECK_FALSE(contains(names, "notes.txt"));
    CHECK_FALSE(contains(names, "sub.ipynb"));
}

TEST_CASE("Repository parses lazily and caches", "[repository]") {
    test::TempDir dir;
    dir.write("a.ipynb", ONE_CELL);

    NotebookRepository repo(dir.path());
    CHECK(repo.cached_count() == 0);

    auto first = repo.get("a.ipynb");
    REQUIRE(first.ok());
    CHECK(repo.contains_cached("a.ipynb"));
    CHECK(first.value()->cells.at(0).source == "v1");
    CHECK(first.value()->source_path == dir.path() / "a.ipynb");

    auto second = repo.get("a.ipynb");
    REQUIRE(second.ok());
    CHECK(first.value() == second.value());
}

TEST_CASE("Repository reloads when the modification time advances",
          "[repository]") {
    test::TempDir dir;
    dir.write("a.ipynb", ONE_CELL);

    NotebookRepository repo(dir.path());
    auto before = repo.get("a.ipynb");
    REQUIRE(before.ok());

    dir.rewrite("a.ipynb", TWO_CELLS);

    auto after = repo.get("a.ipynb");
    REQUIRE(after.ok());
    CHECK(after.value() != before.value());
    CHECK(after.value()->cells.size() == 2);
    CHECK(after.value()->cells[0].source == "v2");
    CHECK(after.value()->last_loaded_mod_time >
          before.value()->last_loaded_mod_time);

    // The old snapshot is untouched
    CHECK(before.value()->cells.size() == 1);
    CHECK(before.value()->cells[0].source == "v1");
}

TEST_CASE("Repository reports missing notebooks as NotFound", "[repository]") {
    test::TempDir dir;
    dir.write("notes.txt", "x");
    NotebookRepository repo(dir.path());

    CHECK(repo.get("missing.ipynb").error().kind == ErrorKind::NotFound);
    CHECK(repo.get("notes.txt").error().kind == ErrorKind::NotFound);
    CHECK(repo.get("../a.ipynb").error().kind == ErrorKind::NotFound);
    CHECK(repo.get("").error().kind == ErrorKind::NotFound);
}

TEST_CASE("Malformed notebook does not affect others", "[repository]") {
    test::TempDir dir;
    dir.write("good.ipynb", ONE_CELL);
    dir.write("bad.ipynb", "{ this is not json");

    NotebookRepository repo(dir.path());

    auto bad = repo.get("bad.ipynb");
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().kind == ErrorKind::ParseError);
    CHECK_FALSE(repo.contains_cached("bad.ipynb"));

    // Remembered failure is reported again without a cache entry
    CHECK(repo.get("bad.ipynb").error().kind == ErrorKind::ParseError);

    auto good = repo.get("good.ipynb");
    REQUIRE(good.ok());
    CHECK(good.value()->cells.size() == 1);

    // Fixing the file makes it reachable
    dir.rewrite("bad.ipynb", ONE_CELL);
    CHECK(repo.get("bad.ipynb").ok());
}

TEST_CASE("Vanished notebooks are evicted", "[repository]") {
    test::TempDir dir;
    dir.write("a.ipynb", ONE_CELL);
    dir.write("b.ipynb", ONE_CELL);

    NotebookRepository repo(dir.path());
    REQUIRE(repo.get("a.ipynb").ok());
    REQUIRE(repo.get("b.ipynb").ok());
    CHECK(repo.cached_count() == 2);

    std::filesystem::remove(dir.path() / "a.ipynb");
    auto names = repo.list_names();
    CHECK(names == std::vector<std::string>{"b.ipynb"});
    CHECK_FALSE(repo.contains_cached("a.ipynb"));

    std::filesystem::remove(dir.path() / "b.ipynb");
    CHECK(repo.get("b.ipynb").error().kind == ErrorKind::NotFound);
    CHECK(repo.cached_count() == 0);
}

TEST_CASE("Repository honours a custom extension", "[repository]") {
    test::TempDir dir;
    dir.write("a.nb", ONE_CELL);
    dir.write("b.ipynb", ONE_CELL);

    NotebookRepository repo(dir.path(), ".nb");
    CHECK(repo.list_names() == std::vector<std::string>{"a.nb"});
    CHECK(repo.get("a.nb").ok());
    CHECK_FALSE(repo.get("b.ipynb").ok());
}
