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


// Conversions between the in-memory roster model and scheduling.proto.
//
// The *FromProto() functions check the shape of each message (dates,
// enums, recurrence set) and fail with InvalidArgumentError naming the
// offending entity. Cross-entity checks are left to ValidateRosterSnapshot()
// and the engine.

#ifndef STAFFING_SCHEDULING_SCHEDULING_PROTO_IO_H_
#define STAFFING_SCHEDULING_SCHEDULING_PROTO_IO_H_

#include "absl/status/statusor.h"
#include "staffing/scheduling/cost_summary.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"

namespace staffing {

absl::StatusOr<Employee> EmployeeFromProto(const EmployeeProto& proto);
absl::StatusOr<ShiftRequirement> ShiftRequirementFromProto(
    const ShiftRequirementProto& proto);
absl::StatusOr<Project> ProjectFromProto(const ProjectProto& proto);

absl::StatusOr<AssignmentStatus> AssignmentStatusFromProto(
    AssignmentStatusProto proto);
AssignmentStatusProto AssignmentStatusToProto(AssignmentStatus status);

// An unset status reads as ASSIGNED.
absl::StatusOr<Assignment> AssignmentFromProto(const AssignmentProto& proto);
AssignmentProto AssignmentToProto(const Assignment& assignment);

absl::StatusOr<RosterSnapshot> RosterSnapshotFromProto(
    const ScheduleRequest& request);
absl::StatusOr<PlanningWindow> PlanningWindowFromProto(
    const ScheduleRequest& request);

CoveragePlanProto CoveragePlanToProto(const CoveragePlan& plan);
ScheduleSummaryProto ScheduleSummaryToProto(const ScheduleSummary& summary);

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_SCHEDULING_PROTO_IO_H_
