#include <gtest/gtest.h>
#include "bindery/core/slots.hpp"

using bindery::SlotAllocator;

TEST(SlotAllocator, GrowsUpToCapacity) {
	SlotAllocator slots;
	slots.init(2);
	auto a = slots.allocate();
	auto b = slots.allocate();
	ASSERT_TRUE(a && b);
	EXPECT_EQ(a->index, 0u);
	EXPECT_EQ(b->index, 1u);
	EXPECT_FALSE(slots.allocate());
	EXPECT_EQ(slots.live_count(), 2u);
	EXPECT_EQ(slots.high_water(), 2u);
}

TEST(SlotAllocator, PendingSlotsAreNotReused) {
	SlotAllocator slots;
	slots.init(1);
	auto a = slots.allocate();
	ASSERT_TRUE(slots.retire(a->index, a->generation));
	EXPECT_EQ(slots.state(a->index), SlotAllocator::State::ePending);
	EXPECT_FALSE(slots.allocate());

	slots.recycle(a->index);
	auto b = slots.allocate();
	ASSERT_TRUE(b);
	EXPECT_EQ(b->index, a->index);
	EXPECT_EQ(b->generation, a->generation + 1);
	EXPECT_FALSE(slots.is_live(a->index, a->generation));
	EXPECT_TRUE(slots.is_live(b->index, b->generation));
}

TEST(SlotAllocator, ReusesMostRecentlyFreedFirst) {
	SlotAllocator slots;
	slots.init();
	std::vector<SlotAllocator::Slot> live;
	for (int i = 0; i < 4; i++) live.push_back(*slots.allocate());
	for (uint32_t index: { 1u, 3u }) {
		slots.retire(index, live[index].generation);
		slots.recycle(index);
	}
	EXPECT_EQ(slots.allocate()->index, 3u);
	EXPECT_EQ(slots.allocate()->index, 1u);
	EXPECT_EQ(slots.allocate()->index, 4u);
}

TEST(SlotAllocator, RetireRejectsStaleGeneration) {
	SlotAllocator slots;
	slots.init();
	auto a = *slots.allocate();
	EXPECT_FALSE(slots.retire(a.index, a.generation + 1));
	EXPECT_TRUE(slots.retire(a.index, a.generation));
	EXPECT_FALSE(slots.retire(a.index, a.generation));
	EXPECT_EQ(slots.live_count(), 0u);
}
