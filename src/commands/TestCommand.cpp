/**
 * @file TestCommand.cpp
 * @brief Self-test of the cache on a few small scenarios.
 *
 * Runs implicitly (and silently) before every other command, a failure aborts
 * the program since nothing built on the cache could be trusted.
 */

#include "TestCommand.hpp"
#include "Cache/CacheDict.hpp"

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

#define SELFTEST_CHECK(cond) \
    if( !(cond) ){ \
        logger->critical("selftest: {}:{}: {} failed", __FILE__, __LINE__, #cond); \
        return 1; \
    }

// A, B inserted, A read, C inserted => B evicted
static int test_promotion_on_read() {
    Cache::CacheDict<std::string, int> cache(2);
    cache.set("A", 1);
    cache.set("B", 2);

    int value = 0;
    SELFTEST_CHECK(cache.try_get("A", value) && value == 1);
    cache.set("C", 3);

    SELFTEST_CHECK(cache.contains("A"));
    SELFTEST_CHECK(!cache.contains("B"));
    SELFTEST_CHECK(cache.contains("C"));
    SELFTEST_CHECK(cache.size() == 2);
    SELFTEST_CHECK(cache.check_invariants());
    logger->trace("selftest: promotion on read OK");
    return 0;
}

static int test_replace_and_promote() {
    Cache::CacheDict<int, std::string> cache(3);
    cache.set(1, "one");
    cache.set(2, "two");
    cache.set(3, "three");
    cache.set(1, "uno");

    SELFTEST_CHECK(cache.size() == 3);
    SELFTEST_CHECK(*cache.recency().begin() == 1);
    SELFTEST_CHECK(cache.at(1) == "uno");
    SELFTEST_CHECK(cache.check_invariants());
    logger->trace("selftest: replace and promote OK");
    return 0;
}

static int test_zero_capacity() {
    Cache::CacheDict<int, int> cache(0);
    for (int i = 0; i < 3; i++) {
        cache.set(i, i);
        SELFTEST_CHECK(cache.empty());
    }
    SELFTEST_CHECK(cache.recency().empty());
    SELFTEST_CHECK(cache.check_invariants());
    logger->trace("selftest: zero capacity OK");
    return 0;
}

int TestCommand::run() {
    if( test_promotion_on_read() != 0 ) return 1;
    if( test_replace_and_promote() != 0 ) return 1;
    if( test_zero_capacity() != 0 ) return 1;

    logger->trace("selftest: OK");
    return 0;
}
