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

namespace appointment_planner {
namespace internal {

namespace {
const boost::gregorian::date Epoch(1970, 1, 1);
} // anonymous namespace

//==============================================================================
boost::posix_time::ptime to_ptime(const Time instant)
{
  // Split off whole days first. A single time_duration spanning the whole
  // int64 range would collide with the special values that posix_time keeps
  // at the limits of its tick count.
  const int64_t nanos = instant.time_since_epoch().count();
  int64_t days = nanos / NanosPerDay;
  int64_t nanos_of_day = nanos % NanosPerDay;
  if (nanos_of_day < 0)
  {
    nanos_of_day += NanosPerDay;
    --days;
  }

  return boost::posix_time::ptime(
    Epoch + boost::gregorian::days(static_cast<long>(days)),
    boost::posix_time::nanoseconds(nanos_of_day));
}

//==============================================================================
Time from_ptime(const boost::posix_time::ptime& moment)
{
  const auto since_epoch = moment - boost::posix_time::ptime(Epoch);
  return Time(Duration(since_epoch.total_nanoseconds()));
}

//==============================================================================
boost::posix_time::time_duration to_time_duration(const Duration delta_t)
{
  return boost::posix_time::nanoseconds(delta_t.count());
}

//==============================================================================
LocalDate to_local_date(const boost::gregorian::date& date)
{
  return LocalDate{
    static_cast<int>(date.year()),
    static_cast<unsigned>(date.month()),
    static_cast<unsigned>(date.day())};
}

} // namespace internal
} // namespace appointment_planner
