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

#ifndef APPOINTMENT_PLANNER__PRIORITY_HPP
#define APPOINTMENT_PLANNER__PRIORITY_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace appointment_planner {

//==============================================================================
/// Priority of appointments. The levels are ordered by declaration, so
/// Low < Medium < High.
enum class Priority : uint8_t
{
  Low = 0,
  Medium,
  High
};

//==============================================================================
/// Get the name of a priority level: "Low", "Medium" or "High".
std::string to_string(Priority priority);

//==============================================================================
/// Get the priority level with the given name. The match is case-sensitive.
/// Returns a nullopt if the name is not recognized.
std::optional<Priority> priority_from_string(const std::string& name);

//==============================================================================
std::ostream& operator<<(std::ostream& out, Priority priority);

} // namespace appointment_planner

#endif // APPOINTMENT_PLANNER__PRIORITY_HPP
