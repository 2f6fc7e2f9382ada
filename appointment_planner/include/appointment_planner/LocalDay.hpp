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

#ifndef APPOINTMENT_PLANNER__LOCALDAY_HPP
#define APPOINTMENT_PLANNER__LOCALDAY_HPP

#include <appointment_planner/Time.hpp>

#include <appointment_planner_utils/impl_ptr.hpp>

#include <string>
#include <tuple>

namespace appointment_planner {

//==============================================================================
/// A calendar date in the proleptic Gregorian calendar.
struct LocalDate
{
  int year = 1970;
  unsigned month = 1;
  unsigned day = 1;
};

inline bool operator==(const LocalDate& a, const LocalDate& b)
{
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const LocalDate& a, const LocalDate& b)
{
  return !(a == b);
}

inline bool operator<(const LocalDate& a, const LocalDate& b)
{
  return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

/// Render a date as YYYY-MM-DD
std::string to_string(const LocalDate& date);

//==============================================================================
/// A wall-clock time of day.
struct LocalTime
{
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  unsigned nanosecond = 0;
};

inline bool operator==(const LocalTime& a, const LocalTime& b)
{
  return a.hour == b.hour && a.minute == b.minute
    && a.second == b.second && a.nanosecond == b.nanosecond;
}

inline bool operator!=(const LocalTime& a, const LocalTime& b)
{
  return !(a == b);
}

inline bool operator<(const LocalTime& a, const LocalTime& b)
{
  return std::tie(a.hour, a.minute, a.second, a.nanosecond)
    < std::tie(b.hour, b.minute, b.second, b.nanosecond);
}

/// Render a time as HH:MM, with :SS and a fraction appended only when they
/// are not zero.
std::string to_string(const LocalTime& time);

//==============================================================================
/// The time zone context that a TimeSlot is projected through to get local
/// wall-clock times and calendar dates.
class LocalDay
{
public:

  /// Get the local wall-clock time of an instant.
  virtual LocalTime time_of_instant(Time instant) const = 0;

  /// Get the local calendar date of an instant.
  virtual LocalDate date_of_instant(Time instant) const = 0;

  virtual ~LocalDay() = default;
};

//==============================================================================
/// A LocalDay anchored to one calendar date in a zone with a constant UTC
/// offset. Instants outside of the anchor date are still projected correctly
/// onto their own dates.
class FixedOffsetDay : public LocalDay
{
public:

  /// Constructor
  ///
  /// \param[in] date
  ///   The calendar date that this day is anchored to.
  ///
  /// \param[in] utc_offset
  ///   How far local time is ahead of UTC. Positive values are east of
  ///   Greenwich. This must be a whole number of minutes within +/-18 hours.
  ///
  /// \throws std::invalid_argument if the date does not exist or the offset
  /// is out of range or not a whole number of minutes.
  FixedOffsetDay(LocalDate date, Duration utc_offset = Duration::zero());

  /// Get the date that this day is anchored to.
  const LocalDate& date() const;

  /// Get the offset of local time from UTC.
  Duration utc_offset() const;

  /// Get the instant of a wall-clock time on the anchor date.
  ///
  /// \throws std::invalid_argument if any field of the time is out of range.
  Time at(const LocalTime& time) const;

  /// Local midnight at the beginning of the anchor date.
  Time start() const;

  /// Local midnight at the end of the anchor date.
  Time end() const;

  // Documentation inherited
  LocalTime time_of_instant(Time instant) const final;

  // Documentation inherited
  LocalDate date_of_instant(Time instant) const final;

  class Implementation;
private:
  appointment_planner_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace appointment_planner

#endif // APPOINTMENT_PLANNER__LOCALDAY_HPP
