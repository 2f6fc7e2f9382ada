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

#include <appointment_planner/LocalDay.hpp>

#include "internal_time.hpp"

#include <stdexcept>

namespace appointment_planner {

namespace {
//==============================================================================
// Years whose midnights can be counted in int64 nanoseconds from the epoch.
constexpr int MinYear = 1678;
constexpr int MaxYear = 2261;

//==============================================================================
const Duration MaxUtcOffset = std::chrono::hours(18);

//==============================================================================
boost::gregorian::date to_gregorian(const LocalDate& date)
{
  if (date.year < MinYear || MaxYear < date.year)
  {
    throw std::invalid_argument(
      "[appointment_planner::FixedOffsetDay] Year ["
      + std::to_string(date.year) + "] is outside of the supported range ["
      + std::to_string(MinYear) + ", " + std::to_string(MaxYear) + "]");
  }

  const std::string description = "[" + std::to_string(date.year) + "-"
    + std::to_string(date.month) + "-" + std::to_string(date.day) + "]";

  // Reject anything that would wrap when narrowed to the gregorian field types
  if (date.month < 1 || 12 < date.month || date.day < 1 || 31 < date.day)
  {
    throw std::invalid_argument(
      "[appointment_planner::FixedOffsetDay] The date " + description
      + " does not exist");
  }

  try
  {
    return boost::gregorian::date(
      static_cast<unsigned short>(date.year),
      static_cast<unsigned short>(date.month),
      static_cast<unsigned short>(date.day));
  }
  catch (const std::out_of_range& e)
  {
    throw std::invalid_argument(
      "[appointment_planner::FixedOffsetDay] The date " + description
      + " does not exist: " + e.what());
  }
}

//==============================================================================
void validate(const LocalTime& time)
{
  if (time.hour < 24 && time.minute < 60 && time.second < 60
    && time.nanosecond < 1000000000u)
    return;

  throw std::invalid_argument(
    "[appointment_planner::FixedOffsetDay] Invalid time of day ["
    + std::to_string(time.hour) + ":" + std::to_string(time.minute) + ":"
    + std::to_string(time.second) + "." + std::to_string(time.nanosecond)
    + "]");
}

} // anonymous namespace

//==============================================================================
std::string to_string(const LocalDate& date)
{
  // Fields that do not form a supported date are rendered without padding
  try
  {
    return boost::gregorian::to_iso_extended_string(to_gregorian(date));
  }
  catch (const std::invalid_argument&)
  {
    return std::to_string(date.year) + "-" + std::to_string(date.month)
      + "-" + std::to_string(date.day);
  }
}

//==============================================================================
std::string to_string(const LocalTime& time)
{
  const auto time_of_day =
    boost::posix_time::hours(time.hour)
    + boost::posix_time::minutes(time.minute)
    + boost::posix_time::seconds(time.second)
    + boost::posix_time::nanoseconds(time.nanosecond);

  // to_simple_string gives HH:MM:SS[.fffffffff]
  std::string text = boost::posix_time::to_simple_string(time_of_day);
  if (time.nanosecond == 0 && time.second == 0)
    text.erase(5);

  return text;
}

//==============================================================================
class FixedOffsetDay::Implementation
{
public:

  LocalDate date;
  Duration utc_offset;

  // Local midnight of the anchor date, as a UTC instant
  Time start;

  boost::posix_time::ptime local(const Time instant) const
  {
    return internal::to_ptime(instant)
      + internal::to_time_duration(utc_offset);
  }
};

//==============================================================================
FixedOffsetDay::FixedOffsetDay(LocalDate date, const Duration utc_offset)
{
  const auto gregorian = to_gregorian(date);

  if (utc_offset < -MaxUtcOffset || MaxUtcOffset < utc_offset)
  {
    throw std::invalid_argument(
      "[appointment_planner::FixedOffsetDay] UTC offset ["
      + time::to_string(utc_offset) + "] is outside of the supported range "
      + "[-PT18H, PT18H]");
  }

  if (utc_offset % std::chrono::minutes(1) != Duration::zero())
  {
    throw std::invalid_argument(
      "[appointment_planner::FixedOffsetDay] UTC offset ["
      + time::to_string(utc_offset) + "] must be a whole number of minutes");
  }

  const Time local_midnight =
    internal::from_ptime(boost::posix_time::ptime(gregorian));

  _pimpl = appointment_planner_utils::make_impl<Implementation>(
    Implementation{date, utc_offset, local_midnight - utc_offset});
}

//==============================================================================
const LocalDate& FixedOffsetDay::date() const
{
  return _pimpl->date;
}

//==============================================================================
Duration FixedOffsetDay::utc_offset() const
{
  return _pimpl->utc_offset;
}

//==============================================================================
Time FixedOffsetDay::at(const LocalTime& time) const
{
  validate(time);

  return _pimpl->start
    + std::chrono::hours(time.hour)
    + std::chrono::minutes(time.minute)
    + std::chrono::seconds(time.second)
    + Duration(time.nanosecond);
}

//==============================================================================
Time FixedOffsetDay::start() const
{
  return _pimpl->start;
}

//==============================================================================
Time FixedOffsetDay::end() const
{
  return _pimpl->start + Duration(internal::NanosPerDay);
}

//==============================================================================
LocalTime FixedOffsetDay::time_of_instant(const Time instant) const
{
  const auto time_of_day = _pimpl->local(instant).time_of_day();

  LocalTime time;
  time.hour = static_cast<unsigned>(time_of_day.hours());
  time.minute = static_cast<unsigned>(time_of_day.minutes());
  time.second = static_cast<unsigned>(time_of_day.seconds());
  time.nanosecond = static_cast<unsigned>(time_of_day.fractional_seconds());
  return time;
}

//==============================================================================
LocalDate FixedOffsetDay::date_of_instant(const Time instant) const
{
  return internal::to_local_date(_pimpl->local(instant).date());
}

} // namespace appointment_planner
