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


#ifndef STAFFING_SCHEDULING_RUN_LEDGER_H_
#define STAFFING_SCHEDULING_RUN_LEDGER_H_

#include <vector>

#include "absl/container/btree_map.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

// RunLedger does the bookkeeping of one run of the engine: for each employee,
// the time intervals already taken, the hours used for load balancing, the
// hours per week and the number of shifts per date.
//
// Employees are designated by their index in the snapshot. The ledger starts
// with the existing assignments of the snapshot and grows by one Book() per
// assignment of the run, so that later slots see the choices made for earlier
// ones.
class RunLedger {
 public:
  // The catalog must outlive the ledger.
  RunLedger(const ShiftCatalog* catalog, int num_employees);

  // Records a non-cancelled assignment that exists before the run. Existing
  // assignments are not checked against each other.
  void AddExisting(int employee, absl::CivilDay date, ShiftType type,
                   bool counts_toward_load);

  // Records an assignment made by the run. CHECK-fails if the shift overlaps
  // a shift the employee already holds: callers must have checked
  // HasOverlap() first.
  void Book(int employee, absl::CivilDay date, ShiftType type);

  bool HasOverlap(int employee, const TimeInterval& interval) const;

  // Hours assigned during the run, plus the existing hours that count toward
  // the load.
  double load_hours(int employee) const { return load_hours_[employee]; }

  // Hours held in the Monday-to-Sunday week containing `day`, existing
  // assignments included.
  double HoursInWeekOf(int employee, absl::CivilDay day) const;

  int ShiftsOn(int employee, absl::CivilDay day) const;

  // Number of Book() calls so far.
  int num_booked() const { return num_booked_; }

  const ShiftCatalog& catalog() const { return *catalog_; }

 private:
  void Record(int employee, absl::CivilDay date, ShiftType type);

  const ShiftCatalog* catalog_;
  std::vector<std::vector<TimeInterval>> intervals_;
  std::vector<double> load_hours_;
  // Keyed by the Monday of the week.
  std::vector<absl::btree_map<absl::CivilDay, double>> week_hours_;
  std::vector<absl::btree_map<absl::CivilDay, int>> shifts_per_day_;
  int num_booked_ = 0;
};

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_RUN_LEDGER_H_
