#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chatlive/bounded_inbox.hpp"

TEST(BoundedInboxTest, ParksProducerWhenFullAndWakesOnTake) {
  chatlive::BoundedInbox<std::string> inbox(1);
  std::vector<std::string> woken;

  EXPECT_EQ(inbox.Offer("e1", [&]() { woken.push_back("e1"); }), chatlive::OfferResult::kAccepted);
  EXPECT_EQ(inbox.Offer("e2", [&]() { woken.push_back("e2"); }), chatlive::OfferResult::kParked);
  EXPECT_EQ(inbox.Size(), 1u);
  EXPECT_EQ(inbox.ParkedCount(), 1u);
  EXPECT_TRUE(woken.empty());

  auto first = inbox.Take();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, "e1");
  ASSERT_EQ(woken.size(), 1u);
  EXPECT_EQ(woken[0], "e2");
  EXPECT_EQ(inbox.ParkedCount(), 0u);

  auto second = inbox.Take();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, "e2");
  EXPECT_FALSE(inbox.Take().has_value());
}

TEST(BoundedInboxTest, ZeroCapacityBehavesAsOne) {
  chatlive::BoundedInbox<int> inbox(0);
  EXPECT_EQ(inbox.Capacity(), 1u);
  EXPECT_EQ(inbox.Offer(1, nullptr), chatlive::OfferResult::kAccepted);
  EXPECT_EQ(inbox.Offer(2, nullptr), chatlive::OfferResult::kParked);
}

TEST(BoundedInboxTest, CloseReleasesParkedProducersAndRejectsNewOffers) {
  chatlive::BoundedInbox<int> inbox(1);
  int released = 0;
  inbox.Offer(1, nullptr);
  inbox.Offer(2, [&]() { ++released; });
  inbox.Offer(3, [&]() { ++released; });

  inbox.Close();
  EXPECT_EQ(released, 2);
  EXPECT_TRUE(inbox.Empty());
  EXPECT_FALSE(inbox.Take().has_value());
  EXPECT_EQ(inbox.Offer(4, nullptr), chatlive::OfferResult::kClosed);
}
