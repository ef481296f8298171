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


#ifndef STAFFING_SCHEDULING_REQUIREMENT_EXPANDER_H_
#define STAFFING_SCHEDULING_REQUIREMENT_EXPANDER_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "staffing/scheduling/roster_model.h"

namespace staffing {

// Fails if the headcount is below 1 or the recurrence is malformed: a weekly
// rule without weekdays, or bounds whose end precedes their start.
absl::Status ValidateShiftRequirement(const ShiftRequirement& requirement);

bool RecurrenceMatches(const Recurrence& recurrence, absl::CivilDay day);

// Flattens the requirements of all projects, active or not, filling in the
// project id of requirements that leave it empty. A nested requirement that
// names another project is an error.
absl::StatusOr<std::vector<ShiftRequirement>> CollectRequirements(
    absl::Span<const Project> projects);

// Turns shift requirements into the ordered list of slots to cover.
//
// Slots are sorted by (date, shift type in canonical order, project id); this
// order drives the engine and its tie-breaks. A requirement yields one slot
// per matching date with required_count = headcount, and requirements that
// land on the same (date, shift type, project) merge into one slot whose
// required_count is the sum of their headcounts.
class RequirementExpander {
 public:
  // The projects are only used to resolve references and read the active
  // flag; they are copied as needed.
  explicit RequirementExpander(absl::Span<const Project> projects);

  // All requirements are validated before any slot is produced: an invalid
  // window, an invalid requirement or an unknown project reference fails the
  // whole expansion. Requirements of inactive projects produce no slots, and
  // neither does a recurrence without a matching date in the window.
  absl::StatusOr<std::vector<ShiftSlot>> Expand(
      absl::Span<const ShiftRequirement> requirements,
      const PlanningWindow& window) const;

 private:
  // Active flag by project id.
  absl::flat_hash_map<std::string, bool> is_active_;
};

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_REQUIREMENT_EXPANDER_H_
