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

#ifndef APPOINTMENT_PLANNER__TIMESLOT_HPP
#define APPOINTMENT_PLANNER__TIMESLOT_HPP

#include <appointment_planner/LocalDay.hpp>
#include <appointment_planner/Time.hpp>

#include <appointment_planner_utils/impl_ptr.hpp>

#include <exception>
#include <ostream>
#include <string>

namespace appointment_planner {

//==============================================================================
/// Thrown when a time slot would end before it starts.
class invalid_interval_error : public std::exception
{
public:

  const char* what() const noexcept override;

  class Implementation;
private:
  invalid_interval_error();
  appointment_planner_utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// A time slot represents an (un)allocated range of time [start, end). The
/// start is part of the slot, while the end belongs to whatever follows it.
///
/// Implementations only provide start() and end(). Every other query is
/// derived from those two.
///
/// The end should never be before the start. A slot whose start and end are
/// equal has a duration of zero and can be used as a sentinel value.
/// Implementations that do return an end before their start will report a
/// negative duration, and the results of the other queries are unspecified.
class TimeSlot
{
public:

  /// Get the start of the slot. The start is included in the range.
  virtual Time start() const = 0;

  /// Get the end of the slot. The end is NOT included in the range.
  virtual Time end() const = 0;

  /// Get the duration of this slot. This may be zero.
  ///
  /// \throws std::overflow_error if the distance between start() and end()
  /// cannot be represented, which BasicTimeSlot never allows.
  Duration duration() const;

  /// Compare two slots by duration only. Slots of equal length compare as
  /// equal no matter where they are placed in time.
  ///
  /// \return a negative value if this slot is shorter than other, zero if
  /// they are equally long, or a positive value if this slot is longer.
  int compare(const TimeSlot& other) const;

  /// Check if this slot is long enough to accommodate the given duration.
  bool fits_duration(Duration duration) const;

  /// Check if the other slot lies entirely within this one, i.e. it does not
  /// start earlier nor end later than this slot.
  bool contains_slot(const TimeSlot& other) const;

  /// Get the local wall-clock time at the start of this slot.
  LocalTime start_time(const LocalDay& day) const;

  /// Get the local wall-clock time at the end of this slot.
  LocalTime end_time(const LocalDay& day) const;

  /// Get the local date on which this slot starts.
  LocalDate start_date(const LocalDay& day) const;

  /// Get the local date on which this slot ends.
  LocalDate end_date(const LocalDay& day) const;

  virtual ~TimeSlot() = default;
};

//==============================================================================
/// Orders time slots by their duration. Slots with the same duration are
/// equivalent under this ordering.
struct DurationOrder
{
  bool operator()(const TimeSlot& a, const TimeSlot& b) const
  {
    return a.compare(b) < 0;
  }
};

//==============================================================================
/// Render a slot as "[<start>, <end>) <duration>".
std::string to_string(const TimeSlot& slot);

//==============================================================================
std::ostream& operator<<(std::ostream& out, const TimeSlot& slot);

//==============================================================================
/// An immutable time slot with validated bounds.
class BasicTimeSlot : public TimeSlot
{
public:

  /// Constructor
  ///
  /// \param[in] start
  ///   The first instant that belongs to the slot.
  ///
  /// \param[in] end
  ///   The first instant after the slot. This may be equal to start.
  ///
  /// \throws invalid_interval_error if end is before start, or if the
  /// duration between them cannot be represented.
  BasicTimeSlot(Time start, Time end);

  /// Make a slot that begins at start and lasts for duration.
  ///
  /// \throws invalid_interval_error if duration is negative or the slot would
  /// end after the last representable instant.
  static BasicTimeSlot starting_at(Time start, Duration duration);

  /// Make a zero-length slot at the given instant.
  static BasicTimeSlot sentinel(Time at);

  // Documentation inherited
  Time start() const final;

  // Documentation inherited
  Time end() const final;

  class Implementation;
private:
  appointment_planner_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace appointment_planner

#endif // APPOINTMENT_PLANNER__TIMESLOT_HPP
