#include <catch2/catch_test_macros.hpp>

#include "vfs/content_cache.hpp"

#include <memory>

using namespace nbfs;
using namespace nbfs::vfs;

namespace {

ContentCache::Content make(std::string s) {
    return std::make_shared<const std::string>(std::move(s));
}

} // namespace

TEST_CASE("Content cache hit and miss", "[content_cache]") {
    ContentCache cache(4, 1024);
    CHECK(cache.find("a") == nullptr);

    cache.insert("a", make("alpha"));
    auto hit = cache.find("a");
    REQUIRE(hit != nullptr);
    CHECK(*hit == "alpha");
    CHECK(cache.size() == 1);
    CHECK(cache.total_bytes() == 5);
}

TEST_CASE("Content cache evicts least recently used", "[content_cache]") {
    ContentCache cache(2, 1024);
    cache.insert("a", make("1"));
    cache.insert("b", make("2"));
    REQUIRE(cache.find("a") != nullptr); // a is now most recent
    cache.insert("c", make("3"));

    CHECK(cache.find("a") != nullptr);
    CHECK(cache.find("b") == nullptr);
    CHECK(cache.find("c") != nullptr);
    CHECK(cache.size() == 2);
}

TEST_CASE("Content cache respects the byte budget", "[content_cache]") {
    ContentCache cache(10, 10);
    cache.insert("a", make("123456"));
    cache.insert("b", make("7890"));
    CHECK(cache.total_bytes() == 10);

    cache.insert("c", make("x"));
    CHECK(cache.find("a") == nullptr);
    CHECK(cache.total_bytes() == 5);

    // Larger than the whole budget: never stored
    cache.insert("huge", make(std::string(11, 'z')));
    CHECK(cache.find("huge") == nullptr);
    CHECK(cache.find("b") != nullptr);
}

TEST_CASE("Content cache replaces an existing key", "[content_cache]") {
    ContentCache cache(4, 1024);
    cache.insert("a", make("old"));
    cache.insert("a", make("newer"));
    CHECK(*cache.find("a") == "newer");
    CHECK(cache.size() == 1);
    CHECK(cache.total_bytes() == 5);

    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(cache.total_bytes() == 0);
}

TEST_CASE("Zero-entry content cache stores nothing", "[content_cache]") {
    ContentCache cache(0, 1024);
    cache.insert("a", make("alpha"));
    CHECK(cache.find("a") == nullptr);
}

TEST_CASE("Cache keys change with the notebook version", "[content_cache]") {
    auto t0 = fs::file_time_type::clock::now();
    auto t1 = t0 + std::chrono::seconds(1);
    CHECK(ContentCache::make_key("/a.ipynb/cell0.md", t0) ==
          ContentCache::make_key("/a.ipynb/cell0.md", t0));
    CHECK(ContentCache::make_key("/a.ipynb/cell0.md", t0) !=
          ContentCache::make_key("/a.ipynb/cell0.md", t1));
}
