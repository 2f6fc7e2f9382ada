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

#ifndef APPOINTMENT_PLANNER__TIME_HPP
#define APPOINTMENT_PLANNER__TIME_HPP

#include <chrono>
#include <string>

namespace appointment_planner {

/// Specifies a specific point in time, with nanosecond precision.
///
/// This is always counted relative to the Unix Epoch, so that an instant can
/// be projected onto a calendar date by a LocalDay.
using Time = std::chrono::time_point<
  std::chrono::system_clock, std::chrono::nanoseconds>;

/// Specifies a change in time, with nanosecond precision.
using Duration = std::chrono::nanoseconds;

namespace time {

/// Render an instant as an ISO-8601 UTC timestamp, e.g.
/// 2020-01-06T09:00:00Z. Fractional seconds are only printed when they are
/// not zero, and then with all nine digits.
std::string to_string(Time instant);

/// Render a duration in ISO-8601 form, e.g. PT1H30M. A zero duration is
/// rendered as PT0S, and negative durations get a leading '-'.
std::string to_string(Duration delta_t);

} // namespace time

} // namespace appointment_planner

#endif // APPOINTMENT_PLANNER__TIME_HPP
