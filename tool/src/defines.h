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
/// @file defines.h
/// @brief Common includes, macros and the exception hierarchy used by all other files.
// -------------------------------------------------------------------------------------------

#ifndef DEFINES_H__
#define DEFINES_H__

#include <string>
#include <vector>
#include <list>
#include <map>
#include <set>
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <exception>
#include <cstdlib>
#include <cstdio>

using namespace std;

// -------------------------------------------------------------------------------------------
///
/// @class AigCubeException
/// @brief The base class of all exceptions thrown by this tool.
class AigCubeException : public exception
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param message A description of what went wrong.
  explicit AigCubeException(const string &message) : message_(message) {}

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~AigCubeException() throw() {}

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the description of what went wrong.
///
/// @return The description of what went wrong.
  virtual const char* what() const throw()
  {
    return message_.c_str();
  }

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The description of what went wrong.
  string message_;
};

// -------------------------------------------------------------------------------------------
///
/// @class FormatError
/// @brief Signals a malformed circuit description.
///
/// This error is fatal: it is raised while loading, before any cube has been generated.
class FormatError : public AigCubeException
{
public:
  explicit FormatError(const string &message) : AigCubeException(message) {}
};

// -------------------------------------------------------------------------------------------
///
/// @class EncodingError
/// @brief Signals the violation of an internal invariant (a bug).
///
/// Thrown by @link MASSERT MASSERT @endlink. This error is fatal.
class EncodingError : public AigCubeException
{
public:
  explicit EncodingError(const string &message) : AigCubeException(message) {}
};

// -------------------------------------------------------------------------------------------
///
/// @class SolverFailure
/// @brief Signals that a SAT solver crashed or produced an answer we cannot interpret.
///
/// This error only affects the cube that was being solved. The cube is reported as unknown
/// and all other cubes are processed normally.
class SolverFailure : public AigCubeException
{
public:
  explicit SolverFailure(const string &message) : AigCubeException(message) {}
};

// -------------------------------------------------------------------------------------------
///
/// @class ConcurrencyError
/// @brief Signals that the pool of worker threads could not be set up. This error is fatal.
class ConcurrencyError : public AigCubeException
{
public:
  explicit ConcurrencyError(const string &message) : AigCubeException(message) {}
};

// -------------------------------------------------------------------------------------------
///
/// @def MASSERT(condition, message)
/// @brief Checks an invariant and throws an EncodingError if it does not hold.
///
/// The message can be composed with the stream operator, e.g.,
/// MASSERT(x > 0, "x is " << x).
///
/// @param condition The condition that must hold.
/// @param message The message to put into the exception if the condition does not hold.
#define MASSERT(condition, message)                                                \
{                                                                                  \
  if(!(condition))                                                                 \
  {                                                                                \
    ostringstream massert_oss__;                                                   \
    massert_oss__ << __FILE__ << " (" << __LINE__ << "): " << message;             \
    throw EncodingError(massert_oss__.str());                                      \
  }                                                                                \
}

// -------------------------------------------------------------------------------------------
///
/// @def DASSERT(condition, message)
/// @brief Like @link MASSERT MASSERT @endlink, but only active in debug builds.
///
/// @param condition The condition that must hold.
/// @param message The message to put into the exception if the condition does not hold.
#ifdef NDEBUG
  #define DASSERT(condition, message)
#else
  #define DASSERT(condition, message) MASSERT(condition, message)
#endif

#endif // DEFINES_H__
