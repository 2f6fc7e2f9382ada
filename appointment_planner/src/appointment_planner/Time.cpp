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

#include <appointment_planner/Time.hpp>

#include "internal_time.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace appointment_planner {
namespace time {

//==============================================================================
std::string to_string(const Time instant)
{
  return boost::posix_time::to_iso_extended_string(
    internal::to_ptime(instant)) + "Z";
}

//==============================================================================
std::string to_string(const Duration delta_t)
{
  const int64_t nanos = delta_t.count();
  if (nanos == 0)
    return "PT0S";

  // Work on the magnitude as an unsigned value so that Duration::min() does
  // not overflow when its sign is flipped.
  const uint64_t magnitude = nanos < 0 ?
    static_cast<uint64_t>(-(nanos + 1)) + 1 : static_cast<uint64_t>(nanos);

  const uint64_t total_seconds = magnitude / 1000000000u;
  const uint64_t hours = total_seconds / 3600;
  const uint64_t minutes = (total_seconds / 60) % 60;
  const uint64_t seconds = total_seconds % 60;
  const uint64_t fraction = magnitude % 1000000000u;

  std::ostringstream out;
  if (nanos < 0)
    out << "-";

  out << "PT";
  if (hours > 0)
    out << hours << "H";

  if (minutes > 0)
    out << minutes << "M";

  if (seconds > 0 || fraction > 0)
  {
    out << seconds;
    if (fraction > 0)
    {
      std::ostringstream digits;
      digits << std::setw(9) << std::setfill('0') << fraction;
      std::string trimmed = digits.str();
      trimmed.erase(trimmed.find_last_not_of('0') + 1);
      out << "." << trimmed;
    }
    out << "S";
  }

  return out.str();
}

} // namespace time
} // namespace appointment_planner
