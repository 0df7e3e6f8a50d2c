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
/// @file Logger.h
/// @brief Contains the declaration of the class Logger and the logging macros.
// -------------------------------------------------------------------------------------------

#ifndef Logger_H__
#define Logger_H__

#include "defines.h"

#include <mutex>

// -------------------------------------------------------------------------------------------
///
/// @def L_ERR(message)
/// @brief Prints an error message (if error messages are enabled).
///
/// The message can be composed with the stream operator, e.g.,
/// L_ERR("Cube " << index << " failed.").
///
/// @param message The message to print.
#define L_ERR(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::ERR))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::ERR, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @def L_WRN(message)
/// @brief Prints a warning (if warnings are enabled).
///
/// @param message The message to print.
#define L_WRN(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::WRN))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::WRN, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @def L_RES(message)
/// @brief Prints a result (if results are enabled).
///
/// @param message The message to print.
#define L_RES(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::RES))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::RES, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @def L_INF(message)
/// @brief Prints an informative message (if informative messages are enabled).
///
/// @param message The message to print.
#define L_INF(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::INF))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::INF, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @def L_DBG(message)
/// @brief Prints a debugging message (if debugging messages are enabled).
///
/// @param message The message to print.
#define L_DBG(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::DBG))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::DBG, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @def L_LOG(message)
/// @brief Prints a statistics message (if statistics messages are enabled).
///
/// @param message The message to print.
#define L_LOG(message)                                                           \
{                                                                                \
  if(Logger::instance().isEnabled(Logger::LOG))                                  \
  {                                                                              \
    ostringstream logger_oss__;                                                  \
    logger_oss__ << message;                                                     \
    Logger::instance().print(Logger::LOG, logger_oss__.str());                   \
  }                                                                              \
}

// -------------------------------------------------------------------------------------------
///
/// @class Logger
/// @brief Prints messages of different classes, each class can be enabled and disabled.
///
/// Messages are printed with a prefix indicating their class, e.g., '[INF] '. Errors and
/// warnings go to stderr, everything else to stdout. Printing is protected by a lock, so
/// the worker threads of the conquer stage can log concurrently without garbling lines.
///
/// This class is implemented as a Singleton. Use the method @link #instance instance()
/// @endlink to obtain the one and only instance of this class. You will usually not call
/// the methods of this class directly but use the macros L_ERR, L_WRN, L_RES, L_INF, L_DBG,
/// and L_LOG instead.
class Logger
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The different classes of messages.
  enum MessageType
  {
    ERR = 0,
    WRN = 1,
    RES = 2,
    INF = 3,
    DBG = 4,
    LOG = 5
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the one and only instance of this class.
///
/// @return The one and only instance of this class.
  static Logger& instance();

// -------------------------------------------------------------------------------------------
///
/// @brief Enables the printing of a certain class of messages.
///
/// @param type The class of messages to enable.
  void enable(MessageType type);

// -------------------------------------------------------------------------------------------
///
/// @brief Disables the printing of a certain class of messages.
///
/// @param type The class of messages to disable.
  void disable(MessageType type);

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if a certain class of messages is enabled.
///
/// @param type The class of messages to check.
/// @return True if messages of this class are printed, false otherwise.
  bool isEnabled(MessageType type) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Prints a message unconditionally.
///
/// @param type The class of the message (determines the prefix and the stream).
/// @param message The message to print.
  void print(MessageType type, const string &message);

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Which classes of messages are enabled (indexed by MessageType).
  bool enabled_[6];

// -------------------------------------------------------------------------------------------
///
/// @brief Serializes the printing of messages.
  mutex print_lock_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// Errors, warnings, results, and informative messages are enabled by default.
  Logger();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~Logger();

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  Logger(const Logger &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  Logger& operator=(const Logger &other);

// -------------------------------------------------------------------------------------------
///
/// @brief The one and only instance of this class.
  static Logger *instance_;
};

#endif // Logger_H__
