// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "staffing/scheduling/eligibility.h"

#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/base/gmock.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/roster_test_util.h"
#include "staffing/scheduling/run_ledger.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

ShiftSlot MakeSlot(absl::CivilDay date, ShiftType type,
                   absl::string_view project_id = "p1") {
  return {date, type, std::string(project_id), 1};
}

class EligibilityTest : public ::testing::Test {
 protected:
  EligibilityTest()
      : alice_(AvailableEmployee("alice", {ShiftType::kMorning})),
        ledger_(&catalog_, 1) {}

  bool IsEligible(const ShiftSlot& slot) const {
    const EligibilityEvaluator evaluator(&catalog_, params_);
    return evaluator.IsEligible(alice_, 0, slot, ledger_);
  }

  std::string FirstViolation(const ShiftSlot& slot) const {
    const EligibilityEvaluator evaluator(&catalog_, params_);
    return std::string(evaluator.FirstViolation(alice_, 0, slot, ledger_));
  }

  int Score(const ShiftSlot& slot) const {
    const EligibilityEvaluator evaluator(&catalog_, params_);
    return evaluator.PreferenceScore(alice_, 0, slot, ledger_);
  }

  const ShiftCatalog catalog_;
  ShiftSchedulerParameters params_;
  Employee alice_;
  RunLedger ledger_;
};

TEST_F(EligibilityTest, AvailableEmployeeIsEligible) {
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(3), ShiftType::kMorning)));
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kMorning)), "");
}

TEST_F(EligibilityTest, AvailabilityIsPerShiftTypeAndWeekday) {
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kAfternoon)),
            "unavailable");

  Employee weekdays_only = MakeEmployee("bob");
  for (const absl::Weekday weekday : MondayToFriday()) {
    weekdays_only.SetAvailable(ShiftType::kMorning, weekday);
  }
  EXPECT_TRUE(IsAvailableFor(weekdays_only, ShiftType::kMorning, Nov(7)));
  EXPECT_FALSE(IsAvailableFor(weekdays_only, ShiftType::kMorning, Nov(8)));
}

TEST_F(EligibilityTest, BlockedDateOverridesAvailabilityAndPreference) {
  alice_.blocked_dates.insert(Nov(5));
  alice_.preferred_dates.insert(ShiftOnDate(ShiftType::kMorning, Nov(5)));
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(5), ShiftType::kMorning)),
            "blocked_date");
  EXPECT_FALSE(Prefers(alice_, ShiftType::kMorning, Nov(5)));
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(6), ShiftType::kMorning)));
}

TEST_F(EligibilityTest, InactiveEmployeeIsNeverEligible) {
  alice_.active = false;
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kMorning)), "inactive");
}

TEST_F(EligibilityTest, AllowedDatesRestrictTheDates) {
  alice_.allowed_dates.insert(Nov(4));
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kMorning)),
            "outside_allowed_dates");
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(4), ShiftType::kMorning)));
}

TEST_F(EligibilityTest, OverlapWithHeldShiftMakesIneligible) {
  ledger_.Book(0, Nov(3), ShiftType::kMorning);
  // Same shift on another project.
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kMorning, "p2")),
            "overlap");
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(4), ShiftType::kMorning)));
}

TEST_F(EligibilityTest, MaxShiftsPerDayIsHardWhenSet) {
  alice_.SetAvailableAllWeek(ShiftType::kAfternoon);
  ledger_.Book(0, Nov(3), ShiftType::kMorning);
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(3), ShiftType::kAfternoon)));
  params_.set_max_shifts_per_day(1);
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(3), ShiftType::kAfternoon)),
            "max_shifts_per_day");
}

TEST_F(EligibilityTest, PreferredShiftsScoreTheBonus) {
  const ShiftSlot monday = MakeSlot(Nov(3), ShiftType::kMorning);
  EXPECT_EQ(Score(monday), 0);
  alice_.preferred_weekdays.insert(
      ShiftOnWeekday(ShiftType::kMorning, absl::Weekday::monday));
  EXPECT_EQ(Score(monday), 2);
  alice_.preferred_dates.insert(ShiftOnDate(ShiftType::kMorning, Nov(4)));
  EXPECT_EQ(Score(MakeSlot(Nov(4), ShiftType::kMorning)), 2);
  params_.set_preferred_shift_bonus(5);
  EXPECT_EQ(Score(monday), 5);
}

TEST_F(EligibilityTest, AvoidedShiftsScoreThePenalty) {
  alice_.avoided_weekdays.insert(
      ShiftOnWeekday(ShiftType::kMorning, absl::Weekday::tuesday));
  alice_.avoided_dates.insert(ShiftOnDate(ShiftType::kMorning, Nov(6)));
  EXPECT_EQ(Score(MakeSlot(Nov(4), ShiftType::kMorning)), -2);
  EXPECT_EQ(Score(MakeSlot(Nov(6), ShiftType::kMorning)), -2);
  EXPECT_EQ(Score(MakeSlot(Nov(5), ShiftType::kMorning)), 0);
  EXPECT_TRUE(Avoids(alice_, ShiftType::kMorning, Nov(11)));
}

TEST_F(EligibilityTest, AvoidedShiftIsIneligibleUnlessAlsoPreferred) {
  alice_.avoided_weekdays.insert(
      ShiftOnWeekday(ShiftType::kMorning, absl::Weekday::tuesday));
  EXPECT_EQ(FirstViolation(MakeSlot(Nov(4), ShiftType::kMorning)), "avoided");
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(5), ShiftType::kMorning)));

  alice_.preferred_dates.insert(ShiftOnDate(ShiftType::kMorning, Nov(4)));
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(4), ShiftType::kMorning)));
  // Preferred and avoided at once: both weights apply.
  EXPECT_EQ(Score(MakeSlot(Nov(4), ShiftType::kMorning)), 0);
}

TEST_F(EligibilityTest, SoftAvoidanceKeepsTheEmployeeEligible) {
  params_.set_avoided_shifts_are_hard(false);
  alice_.avoided_dates.insert(ShiftOnDate(ShiftType::kMorning, Nov(4)));
  EXPECT_TRUE(IsEligible(MakeSlot(Nov(4), ShiftType::kMorning)));
  EXPECT_EQ(Score(MakeSlot(Nov(4), ShiftType::kMorning)), -2);
}

TEST_F(EligibilityTest, NearWeeklyCapLowersTheScore) {
  for (int day = 3; day <= 6; ++day) {
    ledger_.Book(0, Nov(day), ShiftType::kMorning);
  }
  // 32 hours held: one more shift reaches the 40 hour cap exactly.
  EXPECT_EQ(Score(MakeSlot(Nov(7), ShiftType::kMorning)), 0);
  ledger_.Book(0, Nov(7), ShiftType::kMorning);
  EXPECT_EQ(Score(MakeSlot(Nov(8), ShiftType::kMorning)), -1);
  // The next week starts afresh.
  EXPECT_EQ(Score(MakeSlot(Nov(10), ShiftType::kMorning)), 0);

  params_.set_soft_max_weekly_hours(0.0);
  EXPECT_EQ(Score(MakeSlot(Nov(8), ShiftType::kMorning)), 0);
}

TEST(OverlapsTest, ComparesAbsoluteTimeWindows) {
  const ShiftCatalog catalog;
  EXPECT_TRUE(Overlaps(MakeSlot(Nov(3), ShiftType::kMorning, "p1"),
                       MakeSlot(Nov(3), ShiftType::kMorning, "p2"), catalog));
  EXPECT_FALSE(Overlaps(MakeSlot(Nov(3), ShiftType::kMorning),
                        MakeSlot(Nov(3), ShiftType::kAfternoon), catalog));
  EXPECT_FALSE(Overlaps(MakeSlot(Nov(3), ShiftType::kNight),
                        MakeSlot(Nov(4), ShiftType::kMorning), catalog));
}

TEST(RunLedgerTest, TracksLoadWeeksAndDays) {
  const ShiftCatalog catalog;
  RunLedger ledger(&catalog, 2);
  ledger.AddExisting(0, Nov(2), ShiftType::kNight, /*counts_toward_load=*/false);
  ledger.AddExisting(1, Nov(3), ShiftType::kMorning,
                     /*counts_toward_load=*/true);
  EXPECT_DOUBLE_EQ(ledger.load_hours(0), 0.0);
  EXPECT_DOUBLE_EQ(ledger.load_hours(1), 8.0);
  EXPECT_EQ(ledger.num_booked(), 0);

  ledger.Book(0, Nov(3), ShiftType::kMorning);
  ledger.Book(0, Nov(3), ShiftType::kAfternoon);
  EXPECT_DOUBLE_EQ(ledger.load_hours(0), 16.0);
  EXPECT_EQ(ledger.ShiftsOn(0, Nov(3)), 2);
  EXPECT_EQ(ledger.ShiftsOn(0, Nov(4)), 0);
  // Sunday 2025-11-02 belongs to the previous week.
  EXPECT_DOUBLE_EQ(ledger.HoursInWeekOf(0, Nov(2)), 8.0);
  EXPECT_DOUBLE_EQ(ledger.HoursInWeekOf(0, Nov(9)), 16.0);
  EXPECT_EQ(ledger.num_booked(), 2);

  EXPECT_TRUE(ledger.HasOverlap(
      0, catalog.IntervalOn(Nov(3), ShiftType::kMorning)));
  EXPECT_FALSE(ledger.HasOverlap(
      1, catalog.IntervalOn(Nov(3), ShiftType::kAfternoon)));
}

TEST(RunLedgerDeathTest, BookingAnOverlappingShiftIsFatal) {
  const ShiftCatalog catalog;
  RunLedger ledger(&catalog, 1);
  ledger.Book(0, Nov(3), ShiftType::kMorning);
  EXPECT_DEATH(ledger.Book(0, Nov(3), ShiftType::kMorning),
               "Overlap conflict");
}

}  // namespace
}  // namespace staffing
