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


// Hour and cost aggregates of a set of assignments.
//
// An assignment lasts the duration of its shift type in the catalog and costs
// hours x hourly rate of its project. Amounts are accumulated unrounded, in
// minor currency units, and rounded once per reported aggregate.

#ifndef STAFFING_SCHEDULING_COST_SUMMARY_H_
#define STAFFING_SCHEDULING_COST_SUMMARY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

struct EmployeeTotals {
  std::string employee_id;
  double hours = 0.0;
  int64_t cost_minor = 0;
  int num_assignments = 0;
};

struct ProjectTotals {
  std::string project_id;
  std::string project_name;
  double hours = 0.0;
  int64_t cost_minor = 0;
  int num_assignments = 0;
  // Number of distinct employees.
  int num_employees = 0;
};

// Entries are sorted by hours, descending, then by id.
struct ScheduleSummary {
  std::vector<EmployeeTotals> employees;
  std::vector<ProjectTotals> projects;
  double total_hours = 0.0;
  int64_t total_cost_minor = 0;
  int num_assignments = 0;

  // nullptr when the id has no entry.
  const EmployeeTotals* FindEmployee(absl::string_view employee_id) const;
  const ProjectTotals* FindProject(absl::string_view project_id) const;
};

// Restricts a summary to some dates and projects. An unset window or an empty
// set of project ids keeps everything.
struct SummaryFilter {
  std::optional<PlanningWindow> window;
  absl::btree_set<std::string> project_ids;
};

// Nearest whole minor unit, i.e. two decimal places of the major unit.
int64_t RoundToMinorUnits(double amount_minor);

// Hours rounded to two decimal places.
double RoundHours(double hours);

// Cancelled assignments are skipped; assigned and reported ones count alike.
// Fails with InvalidArgumentError if an assignment refers to a project that
// is not in `projects`.
absl::StatusOr<ScheduleSummary> Summarize(
    absl::Span<const Assignment> assignments,
    absl::Span<const Project> projects, const ShiftCatalog& catalog,
    const SummaryFilter& filter = SummaryFilter());

absl::StatusOr<ScheduleSummary> Summarize(const CoveragePlan& plan,
                                          absl::Span<const Project> projects,
                                          const ShiftCatalog& catalog);

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_COST_SUMMARY_H_
