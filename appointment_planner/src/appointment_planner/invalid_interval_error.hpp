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

#ifndef SRC__APPOINTMENT_PLANNER__INVALID_INTERVAL_ERROR_HPP
#define SRC__APPOINTMENT_PLANNER__INVALID_INTERVAL_ERROR_HPP

#include <appointment_planner/TimeSlot.hpp>

namespace appointment_planner {

//==============================================================================
class invalid_interval_error::Implementation
{
public:

  std::string what;

  static std::string describe(const Time instant)
  {
    return time::to_string(instant) + " ("
      + std::to_string(instant.time_since_epoch().count()) + "ns)";
  }

  static invalid_interval_error make_reversed_error(
    const Time start,
    const Time end)
  {
    invalid_interval_error error;
    error._pimpl->what = std::string()
      + "[appointment_planner::invalid_interval_error] Attempted to create a "
      + "TimeSlot whose end [" + describe(end) + "] is before its start ["
      + describe(start) + "]. The end of a TimeSlot may not be earlier than "
      + "its start.";
    return error;
  }

  static invalid_interval_error make_unrepresentable_error(
    const Time start,
    const Time end)
  {
    invalid_interval_error error;
    error._pimpl->what = std::string()
      + "[appointment_planner::invalid_interval_error] Attempted to create a "
      + "TimeSlot from [" + describe(start) + "] to [" + describe(end)
      + "] whose duration cannot be represented in nanoseconds.";
    return error;
  }

  static invalid_interval_error make_negative_duration_error(
    const Time start,
    const Duration duration)
  {
    invalid_interval_error error;
    error._pimpl->what = std::string()
      + "[appointment_planner::invalid_interval_error] Attempted to create a "
      + "TimeSlot starting at [" + describe(start)
      + "] with a negative duration [" + time::to_string(duration) + "].";
    return error;
  }

  static invalid_interval_error make_end_overflow_error(
    const Time start,
    const Duration duration)
  {
    invalid_interval_error error;
    error._pimpl->what = std::string()
      + "[appointment_planner::invalid_interval_error] Attempted to create a "
      + "TimeSlot starting at [" + describe(start) + "] with a duration ["
      + time::to_string(duration) + "] that ends beyond the last "
      + "representable instant.";
    return error;
  }
};

} // namespace appointment_planner

#endif // SRC__APPOINTMENT_PLANNER__INVALID_INTERVAL_ERROR_HPP
