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
/// @file CnCStatistics.h
/// @brief Contains the declaration of the class CnCStatistics.
// -------------------------------------------------------------------------------------------

#ifndef CnCStatistics_H__
#define CnCStatistics_H__

#include "defines.h"
#include "Stopwatch.h"

struct FinalResult;

// -------------------------------------------------------------------------------------------
///
/// @class CnCStatistics
/// @brief Collects statistics and performance data for the CubeAndConquer back-end.
///
/// The data is split into the cube phase (lookahead cube generation) and the conquer phase
/// (solving the cubes).
class CnCStatistics
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
  CnCStatistics();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CnCStatistics();

// -------------------------------------------------------------------------------------------
///
/// @brief Called before the cubes are generated.
///
/// This method just starts a Stopwatch.
  void notifyCubeStart();

// -------------------------------------------------------------------------------------------
///
/// @brief Called after the cubes have been generated.
///
/// This method reads out the Stopwatch and stores the execution time together with the
/// numbers reported by the CubeGenerator.
///
/// @param nr_of_cubes The number of generated cubes.
/// @param nr_of_probes The number of lookahead probes.
/// @param nr_of_forced The number of forced literals.
/// @param nr_of_refuted The number of refuted branches.
  void notifyCubeEnd(size_t nr_of_cubes, size_t nr_of_probes, size_t nr_of_forced,
                     size_t nr_of_refuted);

// -------------------------------------------------------------------------------------------
///
/// @brief Called before the cubes are solved.
///
/// This method just starts a Stopwatch.
  void notifyConquerStart();

// -------------------------------------------------------------------------------------------
///
/// @brief Called after all cubes have been solved.
///
/// @param result The aggregated result of the run.
  void notifyConquerEnd(const FinalResult &result);

// -------------------------------------------------------------------------------------------
///
/// @brief Writes the statistics to stdout as messages of type #Logger::LOG.
///
/// If messages of type Logger::LOG are disabled (see Logger), then nothing happens.
  void logStatistics() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The time when the cube generation was started.
  PointInTime cube_start_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief The cube generation time in CPU-seconds.
  double cube_cpu_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief Like #cube_cpu_time_ but real-time.
  double cube_real_time_;

  size_t nr_of_cubes_;
  size_t nr_of_probes_;
  size_t nr_of_forced_;
  size_t nr_of_refuted_;

// -------------------------------------------------------------------------------------------
///
/// @brief The time when solving the cubes was started.
  PointInTime conquer_start_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief The conquer time in CPU-seconds (of all threads of the process).
  double conquer_cpu_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief Like #conquer_cpu_time_ but real-time.
  double conquer_real_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief The sum of the per-cube solving times.
  double sum_cube_time_;

// -------------------------------------------------------------------------------------------
///
/// @brief The maximum per-cube solving time.
  double max_cube_time_;

  size_t nr_of_sat_;
  size_t nr_of_unsat_;
  size_t nr_of_unknown_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  CnCStatistics(const CnCStatistics &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  CnCStatistics& operator=(const CnCStatistics &other);

};

#endif // CnCStatistics_H__
