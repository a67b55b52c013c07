#include <gtest/gtest.h>
#include "config/timing_reader.hpp"

using namespace cadence;

namespace {

DocumentReader parse(const std::string& yaml) {
    return DocumentReader::fromString(yaml);
}

} // namespace

TEST(TimingReaderTest, DateFromString) {
    EXPECT_EQ(dateFromDocument(parse("date: 2025-10-24")), CalendarDate(2025, 10, 24));
    EXPECT_EQ(dateFromDocument(parse("day_str: 24/10/2025\nfmt: \"%d/%m/%Y\"")),
              CalendarDate(2025, 10, 24));
}

TEST(TimingReaderTest, DateFromComponents) {
    EXPECT_EQ(dateFromDocument(parse("year: 2024\nmonth: 2\nday: 29")), CalendarDate(2024, 2, 29));
    EXPECT_EQ(dateFromDocument(parse("y: 2025\nm: 1\nd: 7")), CalendarDate(2025, 1, 7));
}

TEST(TimingReaderTest, InvalidDates) {
    EXPECT_THROW(dateFromDocument(parse("year: 2025\nmonth: 2\nday: 29")), DocumentFormatError);
    EXPECT_THROW(dateFromDocument(parse("date: not-a-date")), DocumentFormatError);
    EXPECT_THROW(dateFromDocument(parse("year: 2025\nmonth: 2")), DocumentFormatError);
    EXPECT_THROW(dateFromDocument(parse("year: twenty\nmonth: 2\nday: 1")), DocumentTypeError);
}

TEST(TimingReaderTest, TimeOfDay) {
    EXPECT_EQ(timeOfDayFromDocument(parse("time: \"14:30:00\"")), TimeOfDay(14, 30, 0));
    EXPECT_EQ(timeOfDayFromDocument(parse("hour: 9\nminutes: 15")), TimeOfDay(9, 15, 0));
    EXPECT_EQ(timeOfDayFromDocument(parse("{}")), TimeOfDay(0, 0, 0));
    EXPECT_THROW(timeOfDayFromDocument(parse("hour: 24")), DocumentFormatError);
}

TEST(TimingReaderTest, InstantForms) {
    const Instant expected(2025, 10, 24, 14, 30, 0);

    EXPECT_EQ(instantFromDocument(parse("datetime: \"2025-10-24 14:30:00\"")), expected);
    EXPECT_EQ(instantFromDocument(parse(
        "date: {year: 2025, month: 10, day: 24}\n"
        "daytime: {hour: 14, minute: 30}")), expected);
    EXPECT_EQ(instantFromDocument(parse(
        "year: 2025\nmonth: 10\nday: 24\nhour: 14\nminute: 30")), expected);
    EXPECT_EQ(instantFromDocument(parse("year: 2025\nmonth: 10\nday: 24")),
              Instant(2025, 10, 24));
}

TEST(TimingReaderTest, InstantNeedsRecognisedFields) {
    EXPECT_THROW(instantFromDocument(parse("when: tomorrow")), DocumentFormatError);
    EXPECT_THROW(instantFromDocument(parse("datetime: \"2025-01-01\"")), DocumentFormatError);
    EXPECT_THROW(instantFromDocument(parse("datetime: \"2025-13-01 00:00:00\"")), DocumentFormatError);
}

TEST(TimingReaderTest, IntervalWithEnd) {
    Interval interval = intervalFromDocument(parse(
        "start: {datetime: \"2025-01-01 09:00:00\"}\n"
        "end: {datetime: \"2025-01-01 10:00:00\"}"));
    EXPECT_EQ(interval.getStart(), Instant(2025, 1, 1, 9, 0, 0));
    EXPECT_EQ(interval.getEnd(), Instant(2025, 1, 1, 10, 0, 0));
}

TEST(TimingReaderTest, IntervalWithDuration) {
    Interval seconds = intervalFromDocument(parse(
        "begin: {datetime: \"2025-01-01 09:00:00\"}\n"
        "duration: 5400"));
    EXPECT_EQ(seconds.getEnd(), Instant(2025, 1, 1, 10, 30, 0));

    // A duration mapping is read in the naive calendar form: two hours
    Interval naive = intervalFromDocument(parse(
        "from: {datetime: \"2025-01-01 09:00:00\"}\n"
        "length: {datetime: \"1970-01-01 02:00:00\"}"));
    EXPECT_EQ(naive.getEnd(), Instant(2025, 1, 1, 11, 0, 0));
}

TEST(TimingReaderTest, IntervalErrors) {
    EXPECT_THROW(intervalFromDocument(parse("end: {datetime: \"2025-01-01 10:00:00\"}")),
                 DocumentFormatError);
    EXPECT_THROW(intervalFromDocument(parse("start: {datetime: \"2025-01-01 09:00:00\"}")),
                 DocumentFormatError);
    EXPECT_THROW(intervalFromDocument(parse(
        "start: {datetime: \"2025-01-01 09:00:00\"}\nduration: soon")), DocumentTypeError);
}

TEST(TimingReaderTest, RecurringIntervalDaily) {
    RecurringInterval recurring = recurringFromDocument(parse(
        "first:\n"
        "  start: {datetime: \"2025-01-01 09:00:00\"}\n"
        "  end: {datetime: \"2025-01-01 10:00:00\"}\n"
        "until:\n"
        "  start: {datetime: \"2025-01-05 09:00:00\"}\n"
        "  end: {datetime: \"2025-01-05 10:00:00\"}\n"
        "every: 86400\n"));

    auto occurrences = recurring.occurrences();
    ASSERT_EQ(occurrences.size(), 5u);
    EXPECT_EQ(occurrences.back().getStart(), Instant(2025, 1, 5, 9, 0, 0));
}

TEST(TimingReaderTest, RecurringIntervalWithOffsetList) {
    RecurringInterval recurring = recurringFromDocument(parse(
        "first:\n"
        "  start: {datetime: \"2025-01-01 09:00:00\"}\n"
        "  duration: 3600\n"
        "until:\n"
        "  start: {datetime: \"2025-01-10 09:00:00\"}\n"
        "  duration: 3600\n"
        "every:\n"
        "  - {datetime: \"1970-01-02 00:00:00\"}\n"
        "  - 172800\n"));

    std::vector<Instant> starts;
    for (const auto& occurrence : recurring.occurrences()) {
        starts.push_back(occurrence.getStart());
    }
    std::vector<Instant> expected = {
        Instant(2025, 1, 1, 9, 0, 0), Instant(2025, 1, 2, 9, 0, 0),
        Instant(2025, 1, 4, 9, 0, 0), Instant(2025, 1, 5, 9, 0, 0),
        Instant(2025, 1, 7, 9, 0, 0), Instant(2025, 1, 8, 9, 0, 0),
        Instant(2025, 1, 10, 9, 0, 0)
    };
    EXPECT_EQ(starts, expected);
}

TEST(TimingReaderTest, RecurringIntervalErrors) {
    const std::string first =
        "first:\n"
        "  start: {datetime: \"2025-01-01 09:00:00\"}\n"
        "  duration: 3600\n"
        "until:\n"
        "  start: {datetime: \"2025-01-10 09:00:00\"}\n"
        "  duration: 3600\n";

    EXPECT_THROW(recurringFromDocument(parse(first)), DocumentKeyError);
    EXPECT_THROW(recurringFromDocument(parse(first + "every: 0\n")), DocumentFormatError);
    EXPECT_THROW(recurringFromDocument(parse(first + "every: []\n")), DocumentFormatError);
    EXPECT_THROW(recurringFromDocument(parse("every: 60\n")), DocumentKeyError);
}
