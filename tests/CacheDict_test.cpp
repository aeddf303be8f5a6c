#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Cache/CacheDict.hpp"

#include <algorithm>
#include <list>
#include <random>
#include <string>
#include <vector>

using testing::ElementsAre;
using testing::IsEmpty;
using Cache::CacheDict;
using Cache::KeyNotFoundError;

template <typename K, typename V>
std::vector<K> recency(const CacheDict<K, V>& cache) {
    return std::vector<K>(cache.recency().begin(), cache.recency().end());
}

TEST(CacheDict, empty_cache) {
    CacheDict<std::string, int> cache(3);
    int value = 42;

    EXPECT_FALSE(cache.try_get("a", value));
    EXPECT_EQ(42, value); // untouched
    EXPECT_FALSE(cache.get("a"));
    EXPECT_THROW(cache.at("a"), KeyNotFoundError);
    EXPECT_THROW((void)cache["a"].get(), KeyNotFoundError);
    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(3u, cache.max_size());
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, key_not_found_is_out_of_range) {
    CacheDict<int, int> cache(1);
    EXPECT_THROW(cache.at(1), std::out_of_range);
}

TEST(CacheDict, round_trip) {
    CacheDict<std::string, std::string> cache(4);
    cache.set("a", "alpha");
    cache.set("b", "beta");

    std::string value;
    ASSERT_TRUE(cache.try_get("a", value));
    EXPECT_EQ("alpha", value);
    EXPECT_EQ("beta", cache.at("b"));
    EXPECT_EQ("alpha", cache.get("a").value());
    EXPECT_EQ(2u, cache.size());
}

TEST(CacheDict, evicts_first_inserted) {
    const size_t N = 5;
    CacheDict<int, int> cache(N);
    for (int i = 0; i <= (int)N; i++) {
        cache.set(i, i * 10);
    }

    EXPECT_EQ(N, cache.size());
    EXPECT_FALSE(cache.contains(0));
    for (int i = 1; i <= (int)N; i++) {
        EXPECT_TRUE(cache.contains(i)) << i;
        EXPECT_EQ(i * 10, *cache.peek(i));
    }
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, never_exceeds_capacity) {
    CacheDict<int, int> cache(7);
    for (int i = 0; i < 100; i++) {
        cache.set(i, i);
        ASSERT_LE(cache.size(), 7u);
        ASSERT_TRUE(cache.check_invariants());
    }
    EXPECT_EQ(7u, cache.size());
    EXPECT_EQ(7u, cache.recency().count());
}

TEST(CacheDict, promotion_on_read) {
    CacheDict<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);

    int value = 0;
    ASSERT_TRUE(cache.try_get("A", value));
    cache.set("C", 3);

    EXPECT_TRUE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_THAT(recency(cache), ElementsAre("C", "A"));
}

TEST(CacheDict, indexed_read_promotes) {
    CacheDict<std::string, int> cache(2);
    cache["A"] = 1;
    cache["B"] = 2;

    int a = cache["A"];
    EXPECT_EQ(1, a);
    cache["C"] = 3;
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_THAT(recency(cache), ElementsAre("C", "A"));
}

TEST(CacheDict, peek_and_contains_dont_promote) {
    CacheDict<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);

    EXPECT_TRUE(cache.contains("A"));
    EXPECT_EQ(1, *cache.peek("A"));
    EXPECT_EQ(nullptr, cache.peek("Z"));
    cache.set("C", 3);

    EXPECT_FALSE(cache.contains("A"));
    EXPECT_THAT(recency(cache), ElementsAre("C", "B"));
}

TEST(CacheDict, replace_and_promote) {
    CacheDict<std::string, std::string> cache(3);
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");

    cache.set("a", "one");
    EXPECT_EQ(3u, cache.size());
    EXPECT_THAT(recency(cache), ElementsAre("a", "c", "b"));
    EXPECT_EQ("one", cache.at("a"));

    // b is now the coldest one
    cache.set("d", "4");
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_THAT(recency(cache), ElementsAre("d", "a", "c"));
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, replace_head_keeps_order) {
    CacheDict<int, int> cache(3);
    cache.set(1, 1);
    cache.set(2, 2);
    cache.set(2, 20);

    EXPECT_THAT(recency(cache), ElementsAre(2, 1));
    EXPECT_EQ(20, cache.at(2));
    EXPECT_EQ(2u, cache.size());
}

TEST(CacheDict, reading_head_keeps_order) {
    CacheDict<int, int> cache(3);
    cache.set(1, 1);
    cache.set(2, 2);
    EXPECT_EQ(2, cache.at(2));
    EXPECT_THAT(recency(cache), ElementsAre(2, 1));
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, zero_capacity_keeps_nothing) {
    CacheDict<std::string, int> cache(0);
    for (int i = 0; i < 5; i++) {
        cache.set(std::to_string(i), i);
        EXPECT_TRUE(cache.empty());
        EXPECT_TRUE(cache.recency().empty());
        EXPECT_TRUE(cache.check_invariants());
    }
    int value;
    EXPECT_FALSE(cache.try_get("4", value));
    EXPECT_THROW(cache.at("4"), KeyNotFoundError);
}

TEST(CacheDict, capacity_one) {
    CacheDict<int, int> cache(1);
    cache.set(1, 1);
    cache.set(2, 2);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_EQ(2, cache.at(2));
    cache.set(2, 22);
    EXPECT_EQ(22, cache.at(2));
    EXPECT_EQ(1u, cache.size());
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, remove) {
    CacheDict<std::string, int> cache(3);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);

    EXPECT_TRUE(cache.remove("b"));
    EXPECT_FALSE(cache.remove("b"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_THAT(recency(cache), ElementsAre("c", "a"));
    EXPECT_TRUE(cache.check_invariants());

    // freed room is used before evicting
    cache.set("d", 4);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_THAT(recency(cache), ElementsAre("d", "c", "a"));
}

TEST(CacheDict, clear) {
    CacheDict<int, int> cache(3);
    cache.set(1, 1);
    cache.set(2, 2);
    cache.clear();

    EXPECT_TRUE(cache.empty());
    EXPECT_THAT(recency(cache), IsEmpty());
    EXPECT_TRUE(cache.check_invariants());

    cache.set(3, 3);
    EXPECT_THAT(recency(cache), ElementsAre(3));
}

TEST(CacheDict, get_or_set_memoizes) {
    CacheDict<int, std::string> cache(2);
    int calls = 0;
    auto make = [&]() { calls++; return std::string("artifact"); };

    EXPECT_EQ("artifact", cache.get_or_set(1, make));
    EXPECT_EQ("artifact", cache.get_or_set(1, make));
    EXPECT_EQ(1, calls);

    cache.get_or_set(2, make);
    cache.get_or_set(1, make); // promote 1
    cache.get_or_set(3, make); // evicts 2
    EXPECT_EQ(3, calls);
    EXPECT_FALSE(cache.contains(2));
    EXPECT_THAT(recency(cache), ElementsAre(3, 1));
}

TEST(CacheDict, get_or_set_with_zero_capacity_returns_value) {
    CacheDict<int, int> cache(0);
    EXPECT_EQ(7, cache.get_or_set(1, []{ return 7; }));
    EXPECT_TRUE(cache.empty());
}

TEST(CacheDict, factory_exception_leaves_cache_untouched) {
    CacheDict<int, int> cache(2);
    cache.set(1, 1);
    EXPECT_THROW(cache.get_or_set(2, []() -> int { throw std::runtime_error("compile failed"); }), std::runtime_error);
    EXPECT_EQ(1u, cache.size());
    EXPECT_FALSE(cache.contains(2));
    EXPECT_TRUE(cache.check_invariants());
}

TEST(CacheDict, move_keeps_entries) {
    CacheDict<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);

    CacheDict<std::string, int> moved(std::move(cache));
    EXPECT_EQ(1, moved.at("a"));
    moved.set("c", 3);
    EXPECT_FALSE(moved.contains("b"));
    EXPECT_THAT(recency(moved), ElementsAre("c", "a"));
    EXPECT_TRUE(moved.check_invariants());
}

// random operations against a list-based model, recency order must match after every step
TEST(CacheDict, matches_reference_model) {
    const size_t capacity = 8;
    CacheDict<int, int> cache(capacity);
    std::list<std::pair<int, int>> model; // front = most recent

    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> key_dist(0, 20);
    std::uniform_int_distribution<int> op_dist(0, 9);

    for (int step = 0; step < 5000; step++) {
        int key = key_dist(rng);
        int op = op_dist(rng);
        auto it = std::find_if(model.begin(), model.end(), [&](const auto& kv) { return kv.first == key; });

        if (op < 4) {
            int value = -1;
            bool found = cache.try_get(key, value);
            ASSERT_EQ(it != model.end(), found) << "step " << step;
            if (found) {
                ASSERT_EQ(it->second, value);
                model.splice(model.begin(), model, it);
            }
        } else if (op < 9) {
            cache.set(key, step);
            if (it != model.end()) {
                model.erase(it);
            } else if (model.size() == capacity) {
                model.pop_back();
            }
            model.emplace_front(key, step);
        } else {
            ASSERT_EQ(it != model.end(), cache.remove(key));
            if (it != model.end()) {
                model.erase(it);
            }
        }

        std::vector<int> expected;
        for (const auto& kv : model) {
            expected.push_back(kv.first);
        }
        ASSERT_EQ(expected, recency(cache)) << "step " << step;
        ASSERT_TRUE(cache.check_invariants()) << "step " << step;
    }
}
