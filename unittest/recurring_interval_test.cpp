#include <gtest/gtest.h>
#include "timing/recurring_interval.hpp"
#include "common/errors.hpp"

using namespace cadence;

class RecurringIntervalTest : public ::testing::Test {
protected:
    static Interval slotOn(int month, int day) {
        return Interval(Instant(2025, month, day, 9, 0, 0), Instant(2025, month, day, 10, 0, 0));
    }
};

TEST_F(RecurringIntervalTest, EveryTwoDays) {
    auto recurring = RecurringInterval::daily(slotOn(1, 1), slotOn(1, 5), 2);
    auto occurrences = recurring.occurrences();

    ASSERT_EQ(occurrences.size(), 3u);
    EXPECT_EQ(occurrences[0], slotOn(1, 1));
    EXPECT_EQ(occurrences[1], slotOn(1, 3));
    EXPECT_EQ(occurrences[2], slotOn(1, 5));
}

TEST_F(RecurringIntervalTest, DailyIncludesBoundary) {
    auto recurring = RecurringInterval::daily(slotOn(1, 1), slotOn(1, 5));
    EXPECT_EQ(recurring.countOccurrences(), 5u);

    auto everyOther = RecurringInterval::daily(slotOn(1, 1), slotOn(1, 10), 2);
    EXPECT_EQ(everyOther.countOccurrences(), 5u);
    EXPECT_EQ(everyOther.occurrences().back(), slotOn(1, 9));
}

TEST_F(RecurringIntervalTest, NaiveDurationOffsets) {
    RecurringInterval recurring(slotOn(1, 1), slotOn(1, 5), {Instant(1970, 1, 2)});
    EXPECT_EQ(recurring.countOccurrences(), 5u);
    EXPECT_EQ(recurring.getOffsetSeconds().front(), 86400);
}

TEST_F(RecurringIntervalTest, SingleOccurrenceWhenBoundaryEqualsFirst) {
    auto recurring = RecurringInterval::daily(slotOn(3, 1), slotOn(3, 1));
    auto occurrences = recurring.occurrences();
    ASSERT_EQ(occurrences.size(), 1u);
    EXPECT_EQ(occurrences[0], slotOn(3, 1));
}

TEST_F(RecurringIntervalTest, FirstOccurrenceAlwaysIncluded) {
    auto recurring = RecurringInterval::daily(slotOn(3, 10), slotOn(3, 1));
    EXPECT_EQ(recurring.countOccurrences(), 1u);
}

TEST_F(RecurringIntervalTest, OffsetsApplyInSequence) {
    auto recurring = RecurringInterval::fromOffsetSeconds(slotOn(1, 1), slotOn(1, 10),
                                                          {86400, 2 * 86400});
    auto occurrences = recurring.occurrences();

    const int expectedDays[] = {1, 2, 4, 5, 7, 8, 10};
    ASSERT_EQ(occurrences.size(), 7u);
    for (size_t i = 0; i < occurrences.size(); ++i) {
        EXPECT_EQ(occurrences[i], slotOn(1, expectedDays[i])) << "occurrence " << i;
    }
}

TEST_F(RecurringIntervalTest, Weekly) {
    auto recurring = RecurringInterval::weekly(slotOn(1, 1), slotOn(1, 29));
    auto occurrences = recurring.occurrences();
    ASSERT_EQ(occurrences.size(), 5u);
    EXPECT_EQ(occurrences[4], slotOn(1, 29));

    // 52 weeks after 2025-01-01 lands exactly on 2025-12-31
    auto yearly = RecurringInterval::weekly(slotOn(1, 1), slotOn(12, 31), 52);
    EXPECT_EQ(yearly.countOccurrences(), 2u);
}

TEST_F(RecurringIntervalTest, OccurrencesKeepLength) {
    Interval first(Instant(2024, 2, 28, 23, 0, 0), Instant(2024, 2, 29, 1, 0, 0));
    Interval until(Instant(2024, 3, 2, 23, 0, 0), Instant(2024, 3, 3, 1, 0, 0));
    auto recurring = RecurringInterval::daily(first, until);
    auto occurrences = recurring.occurrences();

    ASSERT_EQ(occurrences.size(), 4u);
    EXPECT_EQ(occurrences[1].getStart(), Instant(2024, 2, 29, 23, 0, 0));
    EXPECT_EQ(occurrences[1].getEnd(), Instant(2024, 3, 1, 1, 0, 0));
    for (const auto& occurrence : occurrences) {
        EXPECT_EQ(occurrence.duration(), 7200);
    }
}

TEST_F(RecurringIntervalTest, FromCount) {
    auto recurring = RecurringInterval::fromCount(slotOn(1, 1), Instant(1970, 1, 2), 10);
    EXPECT_EQ(recurring.getLastBoundary().getStart().day(), 10);
    EXPECT_EQ(recurring.getLastBoundary(), slotOn(1, 10));
    EXPECT_EQ(recurring.countOccurrences(), 10u);

    auto everyTwo = RecurringInterval::fromCount(slotOn(1, 1), Instant(1970, 1, 3), 10);
    EXPECT_EQ(everyTwo.getLastBoundary().getStart(), Instant(2025, 1, 19, 9, 0, 0));
    EXPECT_EQ(everyTwo.countOccurrences(), 10u);

    auto once = RecurringInterval::fromCount(slotOn(1, 1), Instant(1970, 1, 2), 1);
    EXPECT_EQ(once.countOccurrences(), 1u);

    EXPECT_THROW(RecurringInterval::fromCount(slotOn(1, 1), Instant(1970, 1, 2), 0),
                 InvalidCalendarValue);
}

TEST_F(RecurringIntervalTest, NonAdvancingOffsetsRejected) {
    EXPECT_THROW(RecurringInterval(slotOn(1, 1), slotOn(1, 5), std::vector<Instant>{}),
                 InvalidCalendarValue);
    EXPECT_THROW(RecurringInterval(slotOn(1, 1), slotOn(1, 5), {Instant(1970, 1, 1)}),
                 InvalidCalendarValue);
    EXPECT_THROW(RecurringInterval::fromOffsetSeconds(slotOn(1, 1), slotOn(1, 5), {86400, 0}),
                 InvalidCalendarValue);
    EXPECT_THROW(RecurringInterval::fromOffsetSeconds(slotOn(1, 1), slotOn(1, 5), {-3600}),
                 InvalidCalendarValue);
    EXPECT_THROW(RecurringInterval::daily(slotOn(1, 1), slotOn(1, 5), 0), InvalidCalendarValue);
    EXPECT_THROW(RecurringInterval::fromCount(slotOn(1, 1), Instant(1970, 1, 1), 3),
                 InvalidCalendarValue);
}

TEST_F(RecurringIntervalTest, EnumerationIsIdempotent) {
    auto recurring = RecurringInterval::daily(slotOn(1, 1), slotOn(2, 28), 3);
    EXPECT_EQ(recurring.occurrences(), recurring.occurrences());
    EXPECT_EQ(recurring.countOccurrences(), recurring.occurrences().size());
}

TEST_F(RecurringIntervalTest, NextOccurrence) {
    auto recurring = RecurringInterval::daily(slotOn(1, 1), slotOn(1, 5), 2);

    auto next = recurring.nextOccurrence(Instant(2025, 1, 2, 0, 0, 0));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, slotOn(1, 3));

    auto exact = recurring.nextOccurrence(Instant(2025, 1, 3, 9, 0, 0));
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(*exact, slotOn(1, 3));

    EXPECT_FALSE(recurring.nextOccurrence(Instant(2025, 1, 5, 9, 0, 1)).has_value());
}

TEST_F(RecurringIntervalTest, ToString) {
    auto recurring = RecurringInterval::daily(slotOn(1, 1), slotOn(1, 5));
    EXPECT_EQ(recurring.toString(),
              "RecurringInterval(first=2025-01-01 09:00:00 - 2025-01-01 10:00:00, "
              "until=2025-01-05 09:00:00 - 2025-01-05 10:00:00, offsets=1)");
}
