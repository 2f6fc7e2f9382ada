/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef APPOINTMENT_PLANNER__YAMLSERIALIZATION_HPP
#define APPOINTMENT_PLANNER__YAMLSERIALIZATION_HPP

#include <appointment_planner/LocalDay.hpp>
#include <appointment_planner/Priority.hpp>
#include <appointment_planner/TimeSlot.hpp>

#include <yaml-cpp/yaml.h>

namespace appointment_planner {

// Every parsing function here throws YAML::ParserException, marked with the
// position of the offending node, when its input is malformed.

//==============================================================================
YAML::Node serialize(Priority priority);

//==============================================================================
Priority priority(YAML::Node node);

//==============================================================================
/// Serialize a date as a "YYYY-MM-DD" scalar.
YAML::Node serialize(const LocalDate& date);

//==============================================================================
LocalDate local_date(YAML::Node node);

//==============================================================================
/// Serialize a time of day as an "HH:MM" or "HH:MM:SS" scalar. Fractions of a
/// second are dropped.
YAML::Node serialize(const LocalTime& time);

//==============================================================================
/// Parse an "HH:MM" or "HH:MM:SS" scalar.
LocalTime local_time(YAML::Node node);

//==============================================================================
/// Serialize a day as {date: "YYYY-MM-DD", utc_offset: <minutes>}.
YAML::Node serialize(const FixedOffsetDay& day);

//==============================================================================
/// Parse a day. The utc_offset field may be omitted, in which case UTC is
/// used.
FixedOffsetDay local_day(YAML::Node node);

//==============================================================================
/// Serialize a slot as {start: <ns>, end: <ns>}, counting nanoseconds since
/// the Unix Epoch.
YAML::Node serialize(const TimeSlot& slot);

//==============================================================================
/// Parse a slot that was written by serialize(const TimeSlot&).
///
/// \throws invalid_interval_error if the slot ends before it starts.
BasicTimeSlot time_slot(YAML::Node node);

//==============================================================================
/// Parse a slot given as wall-clock times on a day, e.g.
/// {start: "09:00", end: "10:30"}.
///
/// \throws invalid_interval_error if the slot ends before it starts.
BasicTimeSlot local_slot(YAML::Node node, const FixedOffsetDay& day);

} // namespace appointment_planner

#endif // APPOINTMENT_PLANNER__YAMLSERIALIZATION_HPP
