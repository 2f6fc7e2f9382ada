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

#include "internal_time.hpp"
#include "invalid_interval_error.hpp"

#include <stdexcept>

namespace appointment_planner {

//==============================================================================
const char* invalid_interval_error::what() const noexcept
{
  return _pimpl->what.c_str();
}

//==============================================================================
invalid_interval_error::invalid_interval_error()
: _pimpl(appointment_planner_utils::make_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
Duration TimeSlot::duration() const
{
  const int64_t end_nanos = end().time_since_epoch().count();
  const int64_t start_nanos = start().time_since_epoch().count();
  if (internal::subtraction_overflows(end_nanos, start_nanos))
  {
    throw std::overflow_error(
      "[appointment_planner::TimeSlot::duration] The duration from ["
      + time::to_string(start()) + "] to [" + time::to_string(end())
      + "] cannot be represented in nanoseconds");
  }

  return Duration(end_nanos - start_nanos);
}

//==============================================================================
int TimeSlot::compare(const TimeSlot& other) const
{
  const Duration mine = duration();
  const Duration theirs = other.duration();
  if (mine < theirs)
    return -1;

  if (theirs < mine)
    return 1;

  return 0;
}

//==============================================================================
bool TimeSlot::fits_duration(const Duration duration) const
{
  return this->duration() >= duration;
}

//==============================================================================
bool TimeSlot::contains_slot(const TimeSlot& other) const
{
  return start() <= other.start() && end() >= other.end();
}

//==============================================================================
LocalTime TimeSlot::start_time(const LocalDay& day) const
{
  return day.time_of_instant(start());
}

//==============================================================================
LocalTime TimeSlot::end_time(const LocalDay& day) const
{
  return day.time_of_instant(end());
}

//==============================================================================
LocalDate TimeSlot::start_date(const LocalDay& day) const
{
  return day.date_of_instant(start());
}

//==============================================================================
LocalDate TimeSlot::end_date(const LocalDay& day) const
{
  return day.date_of_instant(end());
}

//==============================================================================
std::string to_string(const TimeSlot& slot)
{
  return "[" + time::to_string(slot.start()) + ", "
    + time::to_string(slot.end()) + ") "
    + time::to_string(slot.duration());
}

//==============================================================================
std::ostream& operator<<(std::ostream& out, const TimeSlot& slot)
{
  return out << to_string(slot);
}

//==============================================================================
class BasicTimeSlot::Implementation
{
public:

  Time start;
  Time end;

};

//==============================================================================
BasicTimeSlot::BasicTimeSlot(const Time start, const Time end)
: _pimpl(appointment_planner_utils::make_impl<Implementation>(
      Implementation{start, end}))
{
  if (end < start)
    throw invalid_interval_error::Implementation::make_reversed_error(
            start, end);

  if (internal::subtraction_overflows(
      end.time_since_epoch().count(), start.time_since_epoch().count()))
  {
    throw invalid_interval_error::Implementation::make_unrepresentable_error(
            start, end);
  }
}

//==============================================================================
BasicTimeSlot BasicTimeSlot::starting_at(
  const Time start,
  const Duration duration)
{
  if (duration < Duration::zero())
    throw invalid_interval_error::Implementation::make_negative_duration_error(
            start, duration);

  if (internal::addition_overflows(
      start.time_since_epoch().count(), duration.count()))
  {
    throw invalid_interval_error::Implementation::make_end_overflow_error(
            start, duration);
  }

  return BasicTimeSlot(start, start + duration);
}

//==============================================================================
BasicTimeSlot BasicTimeSlot::sentinel(const Time at)
{
  return BasicTimeSlot(at, at);
}

//==============================================================================
Time BasicTimeSlot::start() const
{
  return _pimpl->start;
}

//==============================================================================
Time BasicTimeSlot::end() const
{
  return _pimpl->end;
}

} // namespace appointment_planner
