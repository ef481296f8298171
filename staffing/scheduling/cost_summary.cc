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

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "staffing/base/status_builder.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

// Unrounded running sums.
struct Accumulator {
  double hours = 0.0;
  double cost_minor = 0.0;
  int num_assignments = 0;
  absl::btree_set<absl::string_view> employee_ids;

  void Add(double assignment_hours, double assignment_cost_minor) {
    hours += assignment_hours;
    cost_minor += assignment_cost_minor;
    ++num_assignments;
  }
};

bool KeepAssignment(const Assignment& assignment, const SummaryFilter& filter) {
  if (assignment.status == AssignmentStatus::kCancelled) return false;
  if (filter.window.has_value() && !filter.window->Contains(assignment.date)) {
    return false;
  }
  return filter.project_ids.empty() ||
         filter.project_ids.contains(assignment.project_id);
}

template <typename Totals>
void SortByHours(std::vector<Totals>& totals,
                 std::string Totals::*id_member) {
  std::sort(totals.begin(), totals.end(),
            [id_member](const Totals& a, const Totals& b) {
              if (a.hours != b.hours) return a.hours > b.hours;
              return a.*id_member < b.*id_member;
            });
}

}  // namespace

const EmployeeTotals* ScheduleSummary::FindEmployee(
    absl::string_view employee_id) const {
  for (const EmployeeTotals& totals : employees) {
    if (totals.employee_id == employee_id) return &totals;
  }
  return nullptr;
}

const ProjectTotals* ScheduleSummary::FindProject(
    absl::string_view project_id) const {
  for (const ProjectTotals& totals : projects) {
    if (totals.project_id == project_id) return &totals;
  }
  return nullptr;
}

int64_t RoundToMinorUnits(double amount_minor) {
  return std::llround(amount_minor);
}

double RoundHours(double hours) { return std::round(hours * 100.0) / 100.0; }

absl::StatusOr<ScheduleSummary> Summarize(
    absl::Span<const Assignment> assignments,
    absl::Span<const Project> projects, const ShiftCatalog& catalog,
    const SummaryFilter& filter) {
  absl::flat_hash_map<absl::string_view, const Project*> project_by_id;
  for (const Project& project : projects) {
    project_by_id[project.id] = &project;
  }

  absl::btree_map<absl::string_view, Accumulator> by_employee;
  absl::btree_map<absl::string_view, Accumulator> by_project;
  Accumulator overall;
  for (const Assignment& assignment : assignments) {
    const auto it = project_by_id.find(assignment.project_id);
    if (it == project_by_id.end()) {
      return InvalidArgumentErrorBuilder()
             << assignment << " refers to unknown project '"
             << assignment.project_id << "'";
    }
    if (!KeepAssignment(assignment, filter)) continue;
    const double hours = catalog.Hours(assignment.shift_type);
    const double cost_minor =
        hours * static_cast<double>(it->second->hourly_rate_minor);
    by_employee[assignment.employee_id].Add(hours, cost_minor);
    Accumulator& project = by_project[assignment.project_id];
    project.Add(hours, cost_minor);
    project.employee_ids.insert(assignment.employee_id);
    overall.Add(hours, cost_minor);
  }

  ScheduleSummary summary;
  for (const auto& [employee_id, sums] : by_employee) {
    summary.employees.push_back({std::string(employee_id),
                                 RoundHours(sums.hours),
                                 RoundToMinorUnits(sums.cost_minor),
                                 sums.num_assignments});
  }
  for (const auto& [project_id, sums] : by_project) {
    summary.projects.push_back(
        {std::string(project_id), project_by_id.at(project_id)->name,
         RoundHours(sums.hours), RoundToMinorUnits(sums.cost_minor),
         sums.num_assignments, static_cast<int>(sums.employee_ids.size())});
  }
  SortByHours(summary.employees, &EmployeeTotals::employee_id);
  SortByHours(summary.projects, &ProjectTotals::project_id);
  summary.total_hours = RoundHours(overall.hours);
  summary.total_cost_minor = RoundToMinorUnits(overall.cost_minor);
  summary.num_assignments = overall.num_assignments;
  return summary;
}

absl::StatusOr<ScheduleSummary> Summarize(const CoveragePlan& plan,
                                          absl::Span<const Project> projects,
                                          const ShiftCatalog& catalog) {
  return Summarize(plan.assignments, projects, catalog);
}

}  // namespace staffing
