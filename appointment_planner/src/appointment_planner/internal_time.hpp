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

#ifndef SRC__APPOINTMENT_PLANNER__INTERNAL_TIME_HPP
#define SRC__APPOINTMENT_PLANNER__INTERNAL_TIME_HPP

#include <appointment_planner/LocalDay.hpp>
#include <appointment_planner/Time.hpp>

// Every translation unit of this library is built with
// BOOST_DATE_TIME_POSIX_TIME_STD_CONFIG so that posix_time keeps the full
// nanosecond resolution of Time.
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <cstdint>
#include <limits>

namespace appointment_planner {
namespace internal {

//==============================================================================
constexpr int64_t NanosPerDay = int64_t(86400) * 1000000000;

//==============================================================================
/// Convert an instant to a posix_time ptime in UTC. Every representable Time
/// maps onto a regular (non-special) ptime.
boost::posix_time::ptime to_ptime(Time instant);

//==============================================================================
/// Convert a ptime back to an instant. The ptime must lie within the range
/// that Time can represent.
Time from_ptime(const boost::posix_time::ptime& moment);

//==============================================================================
/// Convert a duration that is far away from the limits of Duration into a
/// posix_time time_duration.
boost::posix_time::time_duration to_time_duration(Duration delta_t);

//==============================================================================
LocalDate to_local_date(const boost::gregorian::date& date);

//==============================================================================
inline bool addition_overflows(const int64_t a, const int64_t b)
{
  if (b > 0)
    return a > std::numeric_limits<int64_t>::max() - b;

  return a < std::numeric_limits<int64_t>::min() - b;
}

//==============================================================================
inline bool subtraction_overflows(const int64_t a, const int64_t b)
{
  if (b < 0)
    return a > std::numeric_limits<int64_t>::max() + b;

  return a < std::numeric_limits<int64_t>::min() + b;
}

} // namespace internal
} // namespace appointment_planner

#endif // SRC__APPOINTMENT_PLANNER__INTERNAL_TIME_HPP
