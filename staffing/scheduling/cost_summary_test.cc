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


#include "staffing/scheduling/cost_summary.h"

#include <cstdint>
#include <cstdlib>
#include <vector>

#include "absl/status/status.h"
#include "staffing/base/gmock.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/roster_test_util.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsNull;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

class CostSummaryTest : public ::testing::Test {
 protected:
  CostSummaryTest()
      : projects_({MakeProject("p1", 2000), MakeProject("p2", 3050)}) {}

  const ShiftCatalog catalog_;
  const std::vector<Project> projects_;
};

TEST_F(CostSummaryTest, EmptyInputGivesZeroTotals) {
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary summary,
                       Summarize(std::vector<Assignment>(), projects_,
                                 catalog_));
  EXPECT_THAT(summary.employees, IsEmpty());
  EXPECT_THAT(summary.projects, IsEmpty());
  EXPECT_EQ(summary.total_hours, 0.0);
  EXPECT_EQ(summary.total_cost_minor, 0);
}

TEST_F(CostSummaryTest, CancelledAreSkippedAndReportedCount) {
  const std::vector<Assignment> assignments = {
      MakeAssignment("alice", "p1", Nov(3), ShiftType::kMorning),
      MakeAssignment("alice", "p1", Nov(4), ShiftType::kMorning,
                     AssignmentStatus::kReported),
      MakeAssignment("alice", "p1", Nov(5), ShiftType::kMorning,
                     AssignmentStatus::kCancelled)};
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary summary,
                       Summarize(assignments, projects_, catalog_));
  ASSERT_THAT(summary.employees, SizeIs(1));
  EXPECT_EQ(summary.employees[0].employee_id, "alice");
  EXPECT_DOUBLE_EQ(summary.employees[0].hours, 16.0);
  EXPECT_EQ(summary.employees[0].cost_minor, 16 * 2000);
  EXPECT_EQ(summary.employees[0].num_assignments, 2);
  EXPECT_EQ(summary.num_assignments, 2);
}

TEST_F(CostSummaryTest, RoundsOnlyTheAggregates) {
  // 8.5 hours at 19.99 per hour.
  ShiftSchedulerParameters params;
  ShiftWindowProto* const morning = params.add_shift_windows();
  morning->set_shift_type(MORNING);
  morning->set_start_minute(6 * 60);
  morning->set_end_minute(14 * 60 + 30);
  ASSERT_OK_AND_ASSIGN(const ShiftCatalog catalog,
                       ShiftCatalog::FromParameters(params));
  const std::vector<Project> projects = {MakeProject("p1", 1999)};
  const std::vector<Assignment> assignments = {
      MakeAssignment("alice", "p1", Nov(3), ShiftType::kMorning),
      MakeAssignment("alice", "p1", Nov(4), ShiftType::kMorning),
      MakeAssignment("alice", "p1", Nov(5), ShiftType::kMorning)};
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary summary,
                       Summarize(assignments, projects, catalog));
  // 3 x 8.5 x 1999 = 50974.5. Rounding each assignment first would give
  // 3 x 16992 = 50976.
  EXPECT_EQ(summary.total_cost_minor, 50975);
  EXPECT_EQ(summary.employees[0].cost_minor, 50975);
  EXPECT_EQ(summary.projects[0].cost_minor, 50975);
  EXPECT_DOUBLE_EQ(summary.total_hours, 25.5);
}

TEST_F(CostSummaryTest, EmployeeAndProjectCostsAddUp) {
  std::vector<Assignment> assignments;
  const char* const employees[] = {"alice", "bob", "carol"};
  for (int day = 3; day <= 16; ++day) {
    for (int e = 0; e < 3; ++e) {
      const ShiftType type = kAllShiftTypes[(day + e) % kNumShiftTypes];
      assignments.push_back(MakeAssignment(employees[e],
                                           (day + e) % 2 == 0 ? "p1" : "p2",
                                           Nov(day), type));
    }
  }
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary summary,
                       Summarize(assignments, projects_, catalog_));
  int64_t employee_sum = 0;
  for (const EmployeeTotals& totals : summary.employees) {
    employee_sum += totals.cost_minor;
  }
  int64_t project_sum = 0;
  for (const ProjectTotals& totals : summary.projects) {
    project_sum += totals.cost_minor;
  }
  EXPECT_LE(std::llabs(employee_sum - summary.total_cost_minor),
            static_cast<int64_t>(summary.employees.size()));
  EXPECT_LE(std::llabs(project_sum - summary.total_cost_minor),
            static_cast<int64_t>(summary.projects.size()));
  EXPECT_EQ(summary.num_assignments, static_cast<int>(assignments.size()));
}

TEST_F(CostSummaryTest, SortsByHoursThenId) {
  const std::vector<Assignment> assignments = {
      MakeAssignment("carol", "p1", Nov(3), ShiftType::kMorning),
      MakeAssignment("bob", "p2", Nov(3), ShiftType::kMorning),
      MakeAssignment("bob", "p2", Nov(4), ShiftType::kMorning),
      MakeAssignment("alice", "p1", Nov(4), ShiftType::kMorning)};
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary summary,
                       Summarize(assignments, projects_, catalog_));
  EXPECT_THAT(summary.employees,
              ElementsAre(Field(&EmployeeTotals::employee_id, "bob"),
                          Field(&EmployeeTotals::employee_id, "alice"),
                          Field(&EmployeeTotals::employee_id, "carol")));
  // Equal hours: by id.
  EXPECT_THAT(summary.projects,
              ElementsAre(Field(&ProjectTotals::project_id, "p1"),
                          Field(&ProjectTotals::project_id, "p2")));
  const ProjectTotals* const p1 = summary.FindProject("p1");
  ASSERT_NE(p1, nullptr);
  EXPECT_EQ(p1->num_employees, 2);
  EXPECT_EQ(p1->num_assignments, 2);
  EXPECT_EQ(p1->project_name, "Project p1");
  EXPECT_EQ(summary.FindProject("p2")->num_employees, 1);
  EXPECT_EQ(summary.FindEmployee("bob")->cost_minor, 16 * 3050);
  EXPECT_THAT(summary.FindEmployee("dave"), IsNull());
}

TEST_F(CostSummaryTest, FiltersByWindowAndProject) {
  const std::vector<Assignment> assignments = {
      MakeAssignment("alice", "p1", Nov(3), ShiftType::kMorning),
      MakeAssignment("alice", "p2", Nov(10), ShiftType::kMorning),
      MakeAssignment("bob", "p2", Nov(4), ShiftType::kNight)};
  SummaryFilter first_week;
  first_week.window = FirstWeek();
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary week,
                       Summarize(assignments, projects_, catalog_, first_week));
  EXPECT_EQ(week.num_assignments, 2);
  EXPECT_DOUBLE_EQ(week.FindEmployee("alice")->hours, 8.0);

  SummaryFilter only_p2;
  only_p2.project_ids = {"p2"};
  ASSERT_OK_AND_ASSIGN(const ScheduleSummary p2,
                       Summarize(assignments, projects_, catalog_, only_p2));
  EXPECT_THAT(p2.projects,
              ElementsAre(Field(&ProjectTotals::project_id, "p2")));
  EXPECT_EQ(p2.total_cost_minor, 16 * 3050);
}

TEST_F(CostSummaryTest, UnknownProjectFails) {
  const std::vector<Assignment> assignments = {
      MakeAssignment("alice", "p9", Nov(3), ShiftType::kMorning)};
  EXPECT_THAT(Summarize(assignments, projects_, catalog_),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("p9")));
}

TEST(RoundingTest, RoundsToTwoDecimals) {
  EXPECT_EQ(RoundToMinorUnits(1234.5), 1235);
  EXPECT_EQ(RoundToMinorUnits(1234.49), 1234);
  EXPECT_DOUBLE_EQ(RoundHours(8.333333), 8.33);
  EXPECT_DOUBLE_EQ(RoundHours(8.5), 8.5);
}

}  // namespace
}  // namespace staffing
