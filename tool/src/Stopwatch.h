// ----------------------------------------------------------------------------
// Copyright (c) 2013-2014 by Graz University of Technology and
//                            Johannes Kepler University Linz
//
// This is free software; you can redistribute it and/or
// modify it under the terms of the GNU Lesser General Public
// License as published by the Free Software Foundation; either
// version 3 of the License, or (at your option) any later version.
//
// This software is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public
// License along with this library; if not, see
// <http://www.gnu.org/licenses/>.
//
// For more information about this software see
//   <http://www.iaik.tugraz.at/content/research/design_verification/demiurge/>
// or email the authors directly.
//
// ----------------------------------------------------------------------------

// -------------------------------------------------------------------------------------------
/// @file Stopwatch.h
/// @brief Contains the declaration of the class Stopwatch and the struct PointInTime.
// -------------------------------------------------------------------------------------------

#ifndef Stopwatch_H__
#define Stopwatch_H__

#include "defines.h"

#include <chrono>
#include <ctime>

// -------------------------------------------------------------------------------------------
///
/// @struct PointInTime
/// @brief A point in time, both in terms of CPU time and real (wall-clock) time.
struct PointInTime
{
// -------------------------------------------------------------------------------------------
///
/// @brief The CPU time consumed by the process so far.
  clock_t cpu_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief The real time (monotonic clock).
  chrono::steady_clock::time_point real_time_;
};

// -------------------------------------------------------------------------------------------
///
/// @class Stopwatch
/// @brief Measures execution times.
///
/// Usage: PointInTime start = Stopwatch::start(); ... then ask for the time that passed
/// since start. Note that the CPU time is the CPU time of the whole process (summed over
/// all threads), so it is only meaningful for sequential phases.
class Stopwatch
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the current point in time.
///
/// @return The current point in time.
  static PointInTime start();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CPU time that passed since a certain point in time.
///
/// @param start The point in time where the measurement started.
/// @return The CPU time in seconds that passed since start.
  static double getCPUTimeSec(const PointInTime &start);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the real time that passed since a certain point in time (rounded).
///
/// @param start The point in time where the measurement started.
/// @return The real time in whole seconds that passed since start.
  static size_t getRealTimeSec(const PointInTime &start);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the real time that passed since a certain point in time (exact).
///
/// @param start The point in time where the measurement started.
/// @return The real time in seconds (with fractions) that passed since start.
  static double getRealTimeSecExact(const PointInTime &start);

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if more than a given number of seconds passed since a point in time.
///
/// @param start The point in time where the measurement started.
/// @param timeout_sec The limit in seconds. A limit of zero or less means 'no limit'.
/// @return True if the limit is exceeded, false otherwise.
  static bool isExpired(const PointInTime &start, double timeout_sec);

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// The constructor is disabled (set private) as this class only has static methods.
  Stopwatch();

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  Stopwatch(const Stopwatch &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  Stopwatch& operator=(const Stopwatch &other);
};

#endif // Stopwatch_H__
