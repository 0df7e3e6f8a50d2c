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
/// @file StringUtils.h
/// @brief Contains the declaration of the class StringUtils.
// -------------------------------------------------------------------------------------------

#ifndef StringUtils_H__
#define StringUtils_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class StringUtils
/// @brief Contains some utility functions for string manipulation.
class StringUtils
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a lower-case copy of a string.
///
/// @param str The string to convert.
/// @return A copy of str where all upper-case characters are converted to lower case.
  static string toLowerCase(const string &str);

// -------------------------------------------------------------------------------------------
///
/// @brief Converts a string to lower case (in-place).
///
/// @param str The string to convert.
  static void toLowerCaseIn(string &str);

// -------------------------------------------------------------------------------------------
///
/// @brief Splits a string into lines.
///
/// @param str The string to split.
/// @param lines The resulting lines are appended to this vector.
/// @param keep_empty True if empty lines should be kept, false otherwise.
  static void splitLines(const string &str, vector<string> &lines, bool keep_empty);

// -------------------------------------------------------------------------------------------
///
/// @brief Splits a string into words separated by white-space.
///
/// @param str The string to split.
/// @param words The resulting words are appended to this vector.
  static void splitWords(const string &str, vector<string> &words);

// -------------------------------------------------------------------------------------------
///
/// @brief Parses a non-negative integer number.
///
/// @param str The string to parse.
/// @param result The parsed number is stored here.
/// @return True if str is a non-negative integer number without trailing garbage.
  static bool parseSize(const string &str, size_t &result);

// -------------------------------------------------------------------------------------------
///
/// @brief Parses a non-negative floating-point number.
///
/// @param str The string to parse.
/// @param result The parsed number is stored here.
/// @return True if str is a non-negative number without trailing garbage.
  static bool parseSeconds(const string &str, double &result);

private:

// -------------------------------------------------------------------------------------------
  StringUtils();

// -------------------------------------------------------------------------------------------
  StringUtils(const StringUtils &other);

// -------------------------------------------------------------------------------------------
  StringUtils& operator=(const StringUtils &other);
};

#endif // StringUtils_H__
