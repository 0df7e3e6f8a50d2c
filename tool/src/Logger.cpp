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
/// @file Logger.cpp
/// @brief Contains the definition of the class Logger.
// -------------------------------------------------------------------------------------------

#include "Logger.h"

// -------------------------------------------------------------------------------------------
Logger *Logger::instance_ = NULL;

// -------------------------------------------------------------------------------------------
Logger& Logger::instance()
{
  static mutex creation_lock;
  creation_lock.lock();
  if(instance_ == NULL)
    instance_ = new Logger;
  creation_lock.unlock();
  return *instance_;
}

// -------------------------------------------------------------------------------------------
void Logger::enable(MessageType type)
{
  enabled_[type] = true;
}

// -------------------------------------------------------------------------------------------
void Logger::disable(MessageType type)
{
  enabled_[type] = false;
}

// -------------------------------------------------------------------------------------------
bool Logger::isEnabled(MessageType type) const
{
  return enabled_[type];
}

// -------------------------------------------------------------------------------------------
void Logger::print(MessageType type, const string &message)
{
  static const char* prefixes[] = {"[ERR] ", "[WRN] ", "[RES] ", "[INF] ", "[DBG] ", "[LOG] "};
  print_lock_.lock();
  if(type == ERR || type == WRN)
    cerr << prefixes[type] << message << endl;
  else
    cout << prefixes[type] << message << endl;
  print_lock_.unlock();
}

// -------------------------------------------------------------------------------------------
Logger::Logger()
{
  enabled_[ERR] = true;
  enabled_[WRN] = true;
  enabled_[RES] = true;
  enabled_[INF] = true;
  enabled_[DBG] = false;
  enabled_[LOG] = false;
}

// -------------------------------------------------------------------------------------------
Logger::~Logger()
{
  // nothing to be done
}
