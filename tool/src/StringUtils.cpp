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
/// @file StringUtils.cpp
/// @brief Contains the definition of the class StringUtils.
// -------------------------------------------------------------------------------------------

#include "StringUtils.h"

#include <cctype>

// -------------------------------------------------------------------------------------------
string StringUtils::toLowerCase(const string &str)
{
  string res(str);
  toLowerCaseIn(res);
  return res;
}

// -------------------------------------------------------------------------------------------
void StringUtils::toLowerCaseIn(string &str)
{
  for(size_t cnt = 0; cnt < str.size(); ++cnt)
    str[cnt] = static_cast<char>(tolower(static_cast<unsigned char>(str[cnt])));
}

// -------------------------------------------------------------------------------------------
void StringUtils::splitLines(const string &str, vector<string> &lines, bool keep_empty)
{
  istringstream iss(str);
  string line;
  while(getline(iss, line))
  {
    if(!line.empty() && line[line.size() - 1] == '\r')
      line.erase(line.size() - 1);
    if(keep_empty || !line.empty())
      lines.push_back(line);
  }
}

// -------------------------------------------------------------------------------------------
void StringUtils::splitWords(const string &str, vector<string> &words)
{
  istringstream iss(str);
  string word;
  while(iss >> word)
    words.push_back(word);
}

// -------------------------------------------------------------------------------------------
bool StringUtils::parseSize(const string &str, size_t &result)
{
  if(str.empty() || str.find_first_not_of("0123456789") != string::npos)
    return false;
  istringstream iss(str);
  iss >> result;
  return !iss.fail();
}

// -------------------------------------------------------------------------------------------
bool StringUtils::parseSeconds(const string &str, double &result)
{
  istringstream iss(str);
  double value = 0.0;
  iss >> value;
  if(iss.fail() || !iss.eof() || value < 0.0)
    return false;
  result = value;
  return true;
}
