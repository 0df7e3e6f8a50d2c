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
/// @file Utils.cpp
/// @brief Contains the definition of the class Utils.
// -------------------------------------------------------------------------------------------

#include "Utils.h"
#include "Logger.h"
#include <unistd.h>

// -------------------------------------------------------------------------------------------
vector<int> Utils::restrictModel(const vector<int> &model, const vector<int> &vars)
{
  set<int> true_vars;
  for(size_t cnt = 0; cnt < model.size(); ++cnt)
  {
    if(model[cnt] > 0)
      true_vars.insert(model[cnt]);
  }
  vector<int> res;
  res.reserve(vars.size());
  for(size_t cnt = 0; cnt < vars.size(); ++cnt)
    res.push_back(true_vars.count(vars[cnt]) ? vars[cnt] : -vars[cnt]);
  return res;
}

// -------------------------------------------------------------------------------------------
void Utils::debugPrint(const vector<int> &vec, string prefix)
{
  if(!Logger::instance().isEnabled(Logger::DBG))
    return;
  ostringstream oss;
  oss << prefix;
  for(size_t cnt = 0; cnt < vec.size(); ++cnt)
    oss << " " << vec[cnt];
  L_DBG(oss.str());
}

// -------------------------------------------------------------------------------------------
void Utils::debugPrintCurrentMemUsage()
{
  if(!Logger::instance().isEnabled(Logger::DBG))
    return;

  // 'stat' seems to give the most reliable results:
  ifstream stat_stream("/proc/self/stat", ios_base::in);
  if(stat_stream.fail())
    return;

  // dummy vars for leading entries in stat that we don't care about:
  string pid, comm, state, ppid, pgrp, session, tty_nr;
  string tpgid, flags, minflt, cminflt, majflt, cmajflt;
  string utime, stime, cutime, cstime, priority, nice;
  string O, itrealvalue, starttime;

  // the two fields we want:
  unsigned long vsize = 0;
  long rss = 0;

  stat_stream >> pid >> comm >> state >> ppid >> pgrp >> session >> tty_nr
              >> tpgid >> flags >> minflt >> cminflt >> majflt >> cmajflt
              >> utime >> stime >> cutime >> cstime >> priority >> nice
              >> O >> itrealvalue >> starttime >> vsize >> rss;
  stat_stream.close();

  long page_size_kb = sysconf(_SC_PAGE_SIZE) / 1024;
  L_DBG("Resident set: " << rss * page_size_kb << " kB.");
  L_DBG("Virtual Memory: " << vsize / 1024.0 << " kB.");
}
