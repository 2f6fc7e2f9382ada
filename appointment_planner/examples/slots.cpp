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

#include <boost/log/core/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <vector>

namespace logging = boost::log;
namespace po = boost::program_options;

using appointment_planner::BasicTimeSlot;
using appointment_planner::FixedOffsetDay;
using appointment_planner::Priority;

namespace {

//==============================================================================
struct Entry
{
  BasicTimeSlot slot;
  Priority priority;
};

//==============================================================================
std::vector<Entry> load_entries(
  const YAML::Node& slots,
  const FixedOffsetDay& day)
{
  if (!slots.IsSequence())
    throw YAML::ParserException(slots.Mark(), "[slots] should be a list");

  std::vector<Entry> entries;
  for (const auto& item : slots)
  {
    Priority priority = Priority::Medium;
    if (item.IsMap() && item["priority"])
      priority = appointment_planner::priority(item["priority"]);

    entries.push_back({appointment_planner::local_slot(item, day), priority});
    BOOST_LOG_TRIVIAL(debug) << "Loaded slot " << entries.back().slot;
  }

  return entries;
}

//==============================================================================
void print_entry(
  const Entry& entry,
  const FixedOffsetDay& day,
  const std::optional<appointment_planner::Duration>& request)
{
  using appointment_planner::to_string;
  const auto& slot = entry.slot;

  std::cout << slot << "\n"
            << "    local:    " << to_string(slot.start_date(day)) << " "
            << to_string(slot.start_time(day)) << " -> "
            << to_string(slot.end_date(day)) << " "
            << to_string(slot.end_time(day)) << "\n"
            << "    priority: " << entry.priority << "\n";

  if (request)
  {
    std::cout << "    fits " << appointment_planner::time::to_string(*request)
              << ": " << (slot.fits_duration(*request) ? "yes" : "no") << "\n";
  }
}

} // anonymous namespace

//==============================================================================
int main(int argc, char* argv[])
{
  po::options_description options("Allowed options");
  options.add_options()
    ("help,h", "produce this help message")
    ("config,c", po::value<std::string>(),
    "YAML file with a [day] and a list of [slots]")
    ("minutes,m", po::value<unsigned int>(),
    "check which slots can accommodate an appointment of this many minutes")
    ("debug-verbose,d",
    po::value<unsigned int>()->default_value(logging::trivial::warning),
    "minimal severity level displayed for the Boost.Log filter");

  po::positional_options_description positional;
  positional.add("config", 1).add("minutes", 1);

  po::variables_map vm;
  try
  {
    po::store(po::command_line_parser(argc, argv)
      .options(options).positional(positional).run(), vm);
    po::notify(vm);
  }
  catch (const po::error& e)
  {
    std::cerr << e.what() << "\n" << options << std::endl;
    return 1;
  }

  if (vm.count("help") || !vm.count("config"))
  {
    std::cout << "Usage: appointment_planner_slots <config.yaml> [minutes]\n"
              << options << std::endl;
    return vm.count("help") ? 0 : 1;
  }

  logging::core::get()->set_filter(
    logging::trivial::severity >=
    static_cast<logging::trivial::severity_level>(
      vm["debug-verbose"].as<unsigned int>()));

  std::optional<appointment_planner::Duration> request;
  if (vm.count("minutes"))
    request = std::chrono::minutes(vm["minutes"].as<unsigned int>());

  const auto config_path = vm["config"].as<std::string>();
  try
  {
    BOOST_LOG_TRIVIAL(info) << "Loading slots from " << config_path;
    const YAML::Node config = YAML::LoadFile(config_path);
    if (!config.IsMap() || !config["day"] || !config["slots"])
    {
      throw YAML::ParserException(config.Mark(),
        "Config must be a map with [day] and [slots]");
    }

    const auto day = appointment_planner::local_day(config["day"]);
    auto entries = load_entries(config["slots"], day);
    BOOST_LOG_TRIVIAL(info) << "Loaded " << entries.size() << " slots on "
                            << appointment_planner::to_string(day.date());

    for (const auto& entry : entries)
      print_entry(entry, day, request);

    std::stable_sort(entries.begin(), entries.end(),
      [](const Entry& a, const Entry& b)
      {
        return appointment_planner::DurationOrder()(a.slot, b.slot);
      });

    std::cout << "\nBy duration:\n";
    for (const auto& entry : entries)
      std::cout << "  " << entry.slot << "\n";
  }
  catch (const YAML::Exception& e)
  {
    BOOST_LOG_TRIVIAL(error) << "Malformed config [" << config_path << "]: "
                             << e.what();
    return 2;
  }
  catch (const appointment_planner::invalid_interval_error& e)
  {
    BOOST_LOG_TRIVIAL(error) << "Invalid slot in [" << config_path << "]: "
                             << e.what();
    return 2;
  }

  return 0;
}
