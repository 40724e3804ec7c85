#include <gtest/gtest.h>
#include <string>
#include "handle_pool.hh"

namespace unittest {

class HandlePoolTest : public testing::Test
{
protected:
    handle_pool<std::string> pool;
};

TEST_F(HandlePoolTest, default_handle_is_invalid)
{
    resource_handle h;
    ASSERT_FALSE(pool.contains(h));
    ASSERT_EQ(pool.get(h), nullptr);
    ASSERT_FALSE(pool.erase(h));
}

TEST_F(HandlePoolTest, emplace_and_get)
{
    resource_handle a = pool.emplace("a");
    resource_handle b = pool.emplace(3, 'b');

    ASSERT_NE(a, b);
    ASSERT_EQ(pool.size(), 2u);
    ASSERT_EQ(*pool.get(a), "a");
    ASSERT_EQ(*pool.get(b), "bbb");
}

TEST_F(HandlePoolTest, erased_handle_is_stale)
{
    resource_handle a = pool.emplace("a");
    ASSERT_TRUE(pool.erase(a));
    ASSERT_FALSE(pool.contains(a));
    ASSERT_FALSE(pool.erase(a));
    ASSERT_EQ(pool.size(), 0u);
}

TEST_F(HandlePoolTest, reused_slot_rejects_old_generation)
{
    resource_handle a = pool.emplace("a");
    pool.erase(a);
    resource_handle b = pool.emplace("b");

    ASSERT_EQ(a.index, b.index);
    ASSERT_NE(a.generation, b.generation);
    ASSERT_FALSE(pool.contains(a));
    ASSERT_EQ(pool.get(a), nullptr);
    ASSERT_EQ(*pool.get(b), "b");
}

TEST_F(HandlePoolTest, clear_invalidates_everything)
{
    resource_handle a = pool.emplace("a");
    resource_handle b = pool.emplace("b");
    pool.clear();

    ASSERT_EQ(pool.size(), 0u);
    ASSERT_FALSE(pool.contains(a));
    ASSERT_FALSE(pool.contains(b));

    resource_handle c = pool.emplace("c");
    ASSERT_NE(c, a);
    ASSERT_NE(c, b);
}

TEST_F(HandlePoolTest, for_each_visits_live_entries)
{
    resource_handle a = pool.emplace("a");
    resource_handle b = pool.emplace("b");
    resource_handle c = pool.emplace("c");
    pool.erase(b);

    std::string seen;
    pool.for_each([&](resource_handle h, std::string& value){
        ASSERT_TRUE(h == a || h == c);
        seen += value;
    });
    ASSERT_EQ(seen, "ac");
}

}
