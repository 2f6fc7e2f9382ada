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
#include <appointment_planner/TimeSlot.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace std::chrono_literals;

//==============================================================================
SCENARIO("Fixed offset day in UTC")
{
  using appointment_planner::FixedOffsetDay;
  using appointment_planner::LocalDate;
  using appointment_planner::LocalTime;
  using appointment_planner::Time;

  const FixedOffsetDay day({2020, 1, 6});

  CHECK(day.date() == LocalDate{2020, 1, 6});
  CHECK(day.utc_offset() == 0s);
  CHECK(day.start().time_since_epoch() == 1578268800s);
  CHECK(day.end() - day.start() == 24h);

  CHECK(day.at({0, 0}) == day.start());
  CHECK(day.at({10, 30}) == day.start() + 10h + 30min);
  CHECK(day.at({23, 59, 59, 999999999}) == day.end() - 1ns);

  CHECK(day.time_of_instant(day.at({10, 30})) == LocalTime{10, 30});
  CHECK(day.time_of_instant(day.at({7, 5, 3, 250})) == LocalTime{7, 5, 3, 250});
  CHECK(day.date_of_instant(day.at({10, 30})) == LocalDate{2020, 1, 6});

  WHEN("Instants lie outside of the anchor date")
  {
    CHECK(day.date_of_instant(day.end()) == LocalDate{2020, 1, 7});
    CHECK(day.time_of_instant(day.end()) == LocalTime{0, 0});
    CHECK(day.date_of_instant(day.start() - 1ns) == LocalDate{2020, 1, 5});
    CHECK(day.time_of_instant(day.start() - 1ns)
      == LocalTime{23, 59, 59, 999999999});
  }

  WHEN("Instants are before the Unix Epoch")
  {
    const Time before_epoch{-1s};
    CHECK(day.date_of_instant(before_epoch) == LocalDate{1969, 12, 31});
    CHECK(day.time_of_instant(before_epoch) == LocalTime{23, 59, 59});
  }
}

//==============================================================================
SCENARIO("Fixed offset day east and west of UTC")
{
  using appointment_planner::FixedOffsetDay;
  using appointment_planner::LocalDate;
  using appointment_planner::LocalTime;

  GIVEN("A day one hour ahead of UTC")
  {
    const FixedOffsetDay cet({2020, 1, 6}, 1h);
    const FixedOffsetDay utc({2020, 1, 6});

    CHECK(cet.start() == utc.start() - 1h);
    CHECK(cet.at({10, 0}) == utc.at({9, 0}));

    THEN("Late UTC instants of the previous day land on the anchor date")
    {
      const FixedOffsetDay previous_utc({2020, 1, 5});
      const auto instant = previous_utc.at({23, 30});
      CHECK(cet.date_of_instant(instant) == LocalDate{2020, 1, 6});
      CHECK(cet.time_of_instant(instant) == LocalTime{0, 30});
    }
  }

  GIVEN("A day five and a half hours behind UTC")
  {
    const FixedOffsetDay west({2020, 3, 1}, -5h - 30min);
    const FixedOffsetDay utc({2020, 3, 1});

    CHECK(west.at({0, 0}) == utc.at({5, 30}));
    CHECK(west.date_of_instant(utc.at({2, 0})) == LocalDate{2020, 2, 29});
    CHECK(west.time_of_instant(utc.at({2, 0})) == LocalTime{20, 30});
  }
}

//==============================================================================
SCENARIO("Projecting a slot through a day")
{
  using appointment_planner::BasicTimeSlot;
  using appointment_planner::FixedOffsetDay;
  using appointment_planner::LocalDate;
  using appointment_planner::LocalTime;

  const FixedOffsetDay day({2021, 12, 31}, 2h);

  GIVEN("A slot within the day")
  {
    const BasicTimeSlot slot(day.at({8, 15}), day.at({9, 45}));
    CHECK(slot.start_time(day) == LocalTime{8, 15});
    CHECK(slot.end_time(day) == LocalTime{9, 45});
    CHECK(slot.start_date(day) == LocalDate{2021, 12, 31});
    CHECK(slot.end_date(day) == LocalDate{2021, 12, 31});
  }

  GIVEN("A slot running past midnight into the new year")
  {
    const BasicTimeSlot slot(day.at({23, 0}), day.end() + 1h);
    CHECK(slot.start_date(day) == LocalDate{2021, 12, 31});
    CHECK(slot.end_date(day) == LocalDate{2022, 1, 1});
    CHECK(slot.end_time(day) == LocalTime{1, 0});
  }
}

//==============================================================================
SCENARIO("Invalid days and times are rejected")
{
  using appointment_planner::FixedOffsetDay;

  CHECK_THROWS_AS(FixedOffsetDay({2021, 2, 29}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 13, 1}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 0, 1}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 4, 31}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 1, 0}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({3000, 1, 1}), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 1, 1}, 19h), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 1, 1}, -19h), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 1, 1}, 1h + 30s), std::invalid_argument);
  CHECK_THROWS_AS(FixedOffsetDay({2020, 1, 1}, -1ns), std::invalid_argument);

  CHECK_NOTHROW(FixedOffsetDay({2020, 2, 29}));
  CHECK_NOTHROW(FixedOffsetDay({2000, 2, 29}));
  CHECK_NOTHROW(FixedOffsetDay({2020, 1, 1}, 18h));
  CHECK_NOTHROW(FixedOffsetDay({2020, 1, 1}, 5h + 45min));

  const FixedOffsetDay day({2020, 1, 6});
  CHECK_THROWS_AS(day.at({24, 0}), std::invalid_argument);
  CHECK_THROWS_AS(day.at({12, 60}), std::invalid_argument);
  CHECK_THROWS_AS(day.at({12, 0, 60}), std::invalid_argument);
  CHECK_THROWS_AS(day.at({12, 0, 0, 1000000000}), std::invalid_argument);
}

//==============================================================================
SCENARIO("Rendering dates and times")
{
  using appointment_planner::LocalDate;
  using appointment_planner::LocalTime;
  using appointment_planner::to_string;

  CHECK(to_string(LocalDate{2020, 1, 6}) == "2020-01-06");
  CHECK(to_string(LocalTime{9, 5}) == "09:05");
  CHECK(to_string(LocalTime{9, 5, 7}) == "09:05:07");
  CHECK(to_string(LocalTime{9, 5, 0, 500000000}) == "09:05:00.500000000");

  CHECK(LocalDate{2020, 1, 6} < LocalDate{2020, 2, 1});
  CHECK(LocalTime{9, 59} < LocalTime{10, 0});
  CHECK(LocalTime{9, 0} != LocalTime{9, 0, 1});
}
