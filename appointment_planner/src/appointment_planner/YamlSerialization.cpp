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

#include <appointment_planner/YamlSerialization.hpp>

#include "internal_time.hpp"

#include <algorithm>
#include <stdexcept>

namespace appointment_planner {

namespace {
const std::string PriorityKey = "priority";
const std::string DateKey = "date";
const std::string UtcOffsetKey = "utc_offset";
const std::string StartKey = "start";
const std::string EndKey = "end";

//==============================================================================
void require_map(const YAML::Node& node, const std::string& what)
{
  if (!node.IsMap())
    throw YAML::ParserException(node.Mark(), what + " should be a map");
}

//==============================================================================
void require_key(
  const YAML::Node& node,
  const std::string& key,
  const std::string& what)
{
  if (!node[key])
    throw YAML::ParserException(node.Mark(),
      what + " missing [" + key + "]");
}
} // anonymous namespace

//==============================================================================
YAML::Node serialize(const Priority priority)
{
  return YAML::Node(to_string(priority));
}

//==============================================================================
Priority priority(YAML::Node node)
{
  const auto name = node.as<std::string>();
  const auto result = priority_from_string(name);
  if (!result)
  {
    throw YAML::ParserException(node.Mark(),
      "[" + PriorityKey + "] field contains unknown identifier: " + name
      + ". Must be one of [Low], [Medium], [High]");
  }

  return *result;
}

//==============================================================================
YAML::Node serialize(const LocalDate& date)
{
  return YAML::Node(to_string(date));
}

//==============================================================================
LocalDate local_date(YAML::Node node)
{
  const auto text = node.as<std::string>();

  boost::gregorian::date date;
  try
  {
    date = boost::gregorian::from_simple_string(text);
  }
  catch (const std::exception& e)
  {
    throw YAML::ParserException(node.Mark(),
      "The date [" + text + "] could not be parsed as YYYY-MM-DD: "
      + e.what());
  }

  if (date.is_special() || boost::gregorian::to_iso_extended_string(date) != text)
  {
    throw YAML::ParserException(node.Mark(),
      "Date must be formatted as YYYY-MM-DD, but got [" + text + "]");
  }

  return internal::to_local_date(date);
}

//==============================================================================
YAML::Node serialize(const LocalTime& time)
{
  LocalTime whole_seconds = time;
  whole_seconds.nanosecond = 0;
  return YAML::Node(to_string(whole_seconds));
}

//==============================================================================
LocalTime local_time(YAML::Node node)
{
  const auto text = node.as<std::string>();
  const auto colons = std::count(text.begin(), text.end(), ':');
  if ((colons != 1 || text.size() != 5) && (colons != 2 || text.size() != 8))
  {
    throw YAML::ParserException(node.Mark(),
      "Time must be formatted as HH:MM or HH:MM:SS, but got [" + text + "]");
  }

  boost::posix_time::time_duration time_of_day;
  try
  {
    time_of_day = boost::posix_time::duration_from_string(text);
  }
  catch (const std::exception& e)
  {
    throw YAML::ParserException(node.Mark(),
      "The time [" + text + "] could not be parsed: " + e.what());
  }

  // Out of range fields like 12:61 are carried over by the parser, so they
  // show up as a mismatch with the canonical rendering.
  const auto canonical = boost::posix_time::to_simple_string(time_of_day);
  if (time_of_day.is_special() || time_of_day.is_negative()
    || time_of_day.hours() >= 24 || canonical.compare(0, text.size(), text) != 0)
  {
    throw YAML::ParserException(node.Mark(),
      "The time [" + text + "] is not a valid time of day");
  }

  LocalTime time;
  time.hour = static_cast<unsigned>(time_of_day.hours());
  time.minute = static_cast<unsigned>(time_of_day.minutes());
  time.second = static_cast<unsigned>(time_of_day.seconds());
  return time;
}

//==============================================================================
YAML::Node serialize(const FixedOffsetDay& day)
{
  YAML::Node node;
  node[DateKey] = serialize(day.date());
  node[UtcOffsetKey] = static_cast<int>(
    std::chrono::duration_cast<std::chrono::minutes>(
      day.utc_offset()).count());
  return node;
}

//==============================================================================
FixedOffsetDay local_day(YAML::Node node)
{
  require_map(node, "Day information");
  require_key(node, DateKey, "Day information");

  const LocalDate date = local_date(node[DateKey]);

  Duration utc_offset = Duration::zero();
  if (node[UtcOffsetKey])
    utc_offset = std::chrono::minutes(node[UtcOffsetKey].as<int>());

  try
  {
    return FixedOffsetDay(date, utc_offset);
  }
  catch (const std::invalid_argument& e)
  {
    throw YAML::ParserException(node.Mark(), e.what());
  }
}

//==============================================================================
YAML::Node serialize(const TimeSlot& slot)
{
  YAML::Node node;
  node[StartKey] =
    static_cast<int64_t>(slot.start().time_since_epoch().count());
  node[EndKey] =
    static_cast<int64_t>(slot.end().time_since_epoch().count());
  return node;
}

//==============================================================================
BasicTimeSlot time_slot(YAML::Node node)
{
  require_map(node, "Time slot information");
  require_key(node, StartKey, "Time slot information");
  require_key(node, EndKey, "Time slot information");

  const Time start{Duration(node[StartKey].as<int64_t>())};
  const Time end{Duration(node[EndKey].as<int64_t>())};
  return BasicTimeSlot(start, end);
}

//==============================================================================
BasicTimeSlot local_slot(YAML::Node node, const FixedOffsetDay& day)
{
  require_map(node, "Time slot information");
  require_key(node, StartKey, "Time slot information");
  require_key(node, EndKey, "Time slot information");

  const Time start = day.at(local_time(node[StartKey]));
  const Time end = day.at(local_time(node[EndKey]));
  return BasicTimeSlot(start, end);
}

} // namespace appointment_planner
