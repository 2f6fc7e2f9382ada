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

#include <appointment_planner/Priority.hpp>

namespace appointment_planner {

namespace {
const std::string LowKey = "Low";
const std::string MediumKey = "Medium";
const std::string HighKey = "High";
} // anonymous namespace

//==============================================================================
std::string to_string(const Priority priority)
{
  switch (priority)
  {
    case Priority::Low: return LowKey;
    case Priority::Medium: return MediumKey;
    case Priority::High: return HighKey;
  }

  return "Priority(" + std::to_string(static_cast<int>(priority)) + ")";
}

//==============================================================================
std::optional<Priority> priority_from_string(const std::string& name)
{
  if (name == LowKey)
    return Priority::Low;

  if (name == MediumKey)
    return Priority::Medium;

  if (name == HighKey)
    return Priority::High;

  return std::nullopt;
}

//==============================================================================
std::ostream& operator<<(std::ostream& out, const Priority priority)
{
  return out << to_string(priority);
}

} // namespace appointment_planner
