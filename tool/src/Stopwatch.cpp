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
/// @file Stopwatch.cpp
/// @brief Contains the definition of the class Stopwatch.
// -------------------------------------------------------------------------------------------

#include "Stopwatch.h"

// -------------------------------------------------------------------------------------------
PointInTime Stopwatch::start()
{
  PointInTime now;
  now.cpu_time_ = clock();
  now.real_time_ = chrono::steady_clock::now();
  return now;
}

// -------------------------------------------------------------------------------------------
double Stopwatch::getCPUTimeSec(const PointInTime &start)
{
  clock_t now = clock();
  return static_cast<double>(now - start.cpu_time_) / CLOCKS_PER_SEC;
}

// -------------------------------------------------------------------------------------------
size_t Stopwatch::getRealTimeSec(const PointInTime &start)
{
  double exact = getRealTimeSecExact(start);
  return static_cast<size_t>(exact + 0.5);
}

// -------------------------------------------------------------------------------------------
double Stopwatch::getRealTimeSecExact(const PointInTime &start)
{
  chrono::duration<double> passed = chrono::steady_clock::now() - start.real_time_;
  return passed.count();
}

// -------------------------------------------------------------------------------------------
bool Stopwatch::isExpired(const PointInTime &start, double timeout_sec)
{
  if(timeout_sec <= 0.0)
    return false;
  return getRealTimeSecExact(start) > timeout_sec;
}
