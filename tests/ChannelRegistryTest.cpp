#include <gtest/gtest.h>

#include <quicsock/ChannelRegistry.hpp>

#include <memory>
#include <string>

using namespace qs;

TEST(ChannelRegistry, SlotsAreDense) {
    using Reg = ChannelRegistry<int>;

    EXPECT_EQ(Reg::slotFor(0), 0u);
    EXPECT_EQ(Reg::slotFor(1), 1u);
    EXPECT_EQ(Reg::slotFor(4), 2u);
    EXPECT_EQ(Reg::slotFor(5), 3u);
    EXPECT_EQ(Reg::slotFor(8), 4u);

    EXPECT_TRUE(Reg::isValidId(0));
    EXPECT_TRUE(Reg::isValidId(13));
    EXPECT_FALSE(Reg::isValidId(2));
    EXPECT_FALSE(Reg::isValidId(3));
    EXPECT_FALSE(Reg::isValidId(-4));
}

TEST(ChannelRegistry, InsertGetRemove) {
    ChannelRegistry<std::string> reg;

    EXPECT_TRUE(reg.insert(0, "client"));
    EXPECT_TRUE(reg.insert(1, "server"));
    EXPECT_FALSE(reg.insert(0, "again"));
    EXPECT_FALSE(reg.insert(2, "unidirectional"));
    EXPECT_EQ(reg.size(), 2u);

    ASSERT_NE(reg.get(1), nullptr);
    EXPECT_EQ(*reg.get(1), "server");
    EXPECT_EQ(reg.get(4), nullptr);
    EXPECT_FALSE(reg.contains(5));

    auto removed = reg.remove(0);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, "client");
    EXPECT_FALSE(reg.contains(0));
    EXPECT_FALSE(reg.remove(0).has_value());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(ChannelRegistry, ShrinksTrailingHoles) {
    ChannelRegistry<int> reg;

    reg.insert(0, 1);
    reg.insert(16, 2);
    EXPECT_EQ(reg.slotCount(), ChannelRegistry<int>::slotFor(16) + 1);

    reg.remove(16);
    EXPECT_EQ(reg.slotCount(), 1u);

    reg.remove(0);
    EXPECT_EQ(reg.slotCount(), 0u);
    EXPECT_TRUE(reg.empty());
}

TEST(ChannelRegistry, DrainInIdOrder) {
    ChannelRegistry<std::unique_ptr<int>> reg;

    reg.insert(9, std::make_unique<int>(9));
    reg.insert(0, std::make_unique<int>(0));
    reg.insert(4, std::make_unique<int>(4));

    int sum = 0;
    reg.forEach([&](auto& v) { sum += *v; });
    EXPECT_EQ(sum, 13);

    auto all = reg.drain();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(*all[0], 0);
    EXPECT_EQ(*all[1], 4);
    EXPECT_EQ(*all[2], 9);

    EXPECT_TRUE(reg.empty());
    EXPECT_EQ(reg.slotCount(), 0u);
}
