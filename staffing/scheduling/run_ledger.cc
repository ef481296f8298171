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


#include "staffing/scheduling/run_ledger.h"

#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

RunLedger::RunLedger(const ShiftCatalog* catalog, int num_employees)
    : catalog_(catalog),
      intervals_(num_employees),
      load_hours_(num_employees, 0.0),
      week_hours_(num_employees),
      shifts_per_day_(num_employees) {
  CHECK(catalog != nullptr);
}

void RunLedger::AddExisting(int employee, absl::CivilDay date, ShiftType type,
                            bool counts_toward_load) {
  Record(employee, date, type);
  if (counts_toward_load) {
    load_hours_[employee] += catalog_->Hours(type);
  }
}

void RunLedger::Book(int employee, absl::CivilDay date, ShiftType type) {
  CHECK(!HasOverlap(employee, catalog_->IntervalOn(date, type)))
      << "Overlap conflict: employee #" << employee << " already holds a shift"
      << " overlapping " << FormatDate(date) << " " << type;
  Record(employee, date, type);
  load_hours_[employee] += catalog_->Hours(type);
  ++num_booked_;
}

void RunLedger::Record(int employee, absl::CivilDay date, ShiftType type) {
  DCHECK_GE(employee, 0);
  DCHECK_LT(employee, intervals_.size());
  intervals_[employee].push_back(catalog_->IntervalOn(date, type));
  week_hours_[employee][WeekStart(date)] += catalog_->Hours(type);
  ++shifts_per_day_[employee][date];
}

bool RunLedger::HasOverlap(int employee, const TimeInterval& interval) const {
  for (const TimeInterval& taken : intervals_[employee]) {
    if (taken.Overlaps(interval)) return true;
  }
  return false;
}

double RunLedger::HoursInWeekOf(int employee, absl::CivilDay day) const {
  const auto it = week_hours_[employee].find(WeekStart(day));
  return it == week_hours_[employee].end() ? 0.0 : it->second;
}

int RunLedger::ShiftsOn(int employee, absl::CivilDay day) const {
  const auto it = shifts_per_day_[employee].find(day);
  return it == shifts_per_day_[employee].end() ? 0 : it->second;
}

}  // namespace staffing
