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
/// @file FileUtils.cpp
/// @brief Contains the definition of the classes FileUtils and ScopedFile.
// -------------------------------------------------------------------------------------------

#include "FileUtils.h"

#include <sys/stat.h>
#include <errno.h>

// -------------------------------------------------------------------------------------------
bool FileUtils::fileExists(const string &file_name)
{
  ifstream inp(file_name.c_str());
  bool exists = !inp.fail();
  inp.close();
  return exists;
}

// -------------------------------------------------------------------------------------------
bool FileUtils::readFile(const string &file_name, string &file_content)
{
  ifstream is(file_name.c_str(), std::ios::in | std::ios::binary);
  if(is.fail())
    return false;
  ostringstream buffer;
  buffer << is.rdbuf();
  if(is.bad())
    return false;
  file_content.append(buffer.str());
  return true;
}

// -------------------------------------------------------------------------------------------
bool FileUtils::writeFile(const string &file_name, const string &file_content)
{
  ofstream out(file_name.c_str(), std::ios::out | std::ios::trunc);
  if(out.fail())
    return false;
  out << file_content;
  out.close();
  if(out.fail() || out.bad())
    return false;
  return true;
}

// -------------------------------------------------------------------------------------------
bool FileUtils::createDir(const string &dir_name)
{
  struct stat st;
  if(stat(dir_name.c_str(), &st) == 0)
    return S_ISDIR(st.st_mode);
  int fail = mkdir(dir_name.c_str(), 0777);
  // another thread may have been faster:
  return fail == 0 || errno == EEXIST;
}

// -------------------------------------------------------------------------------------------
string FileUtils::join(const string &dir_name, const string &file_name)
{
  if(dir_name.empty())
    return file_name;
  if(dir_name[dir_name.size() - 1] == '/')
    return dir_name + file_name;
  return dir_name + "/" + file_name;
}

// -------------------------------------------------------------------------------------------
FileUtils::~FileUtils()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ScopedFile::ScopedFile(const string &file_name, bool keep) :
    file_name_(file_name),
    keep_(keep)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ScopedFile::~ScopedFile()
{
  if(!keep_)
    remove(file_name_.c_str());
}

// -------------------------------------------------------------------------------------------
const string& ScopedFile::getName() const
{
  return file_name_;
}
