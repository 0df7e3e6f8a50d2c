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
/// @file Utils.h
/// @brief Contains the declaration of the class Utils.
// -------------------------------------------------------------------------------------------

#ifndef Utils_H__
#define Utils_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class Utils
/// @brief Contains some small utility functions for literals and diagnostics.
class Utils
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Restricts a (possibly partial) model to a list of variables.
///
/// @param model A list of literals, e.g., the model returned by a SAT solver.
/// @param vars The variables of interest.
/// @return One literal per variable in vars, in the order of vars. Variables that do not
///         occur in the model are set to FALSE.
  static vector<int> restrictModel(const vector<int> &model, const vector<int> &vars);

// -------------------------------------------------------------------------------------------
///
/// @brief Prints a vector of literals (if debug messages are enabled).
///
/// @param vec The vector to print.
/// @param prefix A text to print before the vector.
  static void debugPrint(const vector<int> &vec, string prefix = "");

// -------------------------------------------------------------------------------------------
///
/// @brief Prints the current memory usage of the process (if debug messages are enabled).
  static void debugPrintCurrentMemUsage();

private:

// -------------------------------------------------------------------------------------------
  Utils();

// -------------------------------------------------------------------------------------------
  virtual ~Utils();

// -------------------------------------------------------------------------------------------
  Utils(const Utils &other);

// -------------------------------------------------------------------------------------------
  Utils& operator=(const Utils &other);
};

#endif // Utils_H__
