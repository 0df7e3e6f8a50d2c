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
/// @file FileUtils.h
/// @brief Contains the declaration of the classes FileUtils and ScopedFile.
// -------------------------------------------------------------------------------------------

#ifndef FileUtils_H__
#define FileUtils_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class FileUtils
/// @brief Contains some utility functions for working with files and directories.
class FileUtils
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if a certain file exists.
///
/// @param file_name The name of the file to check.
/// @return True if the file exists (and can be read), false otherwise.
  static bool fileExists(const string &file_name);

// -------------------------------------------------------------------------------------------
///
/// @brief Reads the content of a file into a string.
///
/// @param file_name The name of the file to read.
/// @param file_content The content of the file will be appended to this string.
/// @return True on success, false otherwise.
  static bool readFile(const string &file_name, string &file_content);

// -------------------------------------------------------------------------------------------
///
/// @brief Writes a string into a file (overwriting the file if it exists).
///
/// @param file_name The name of the file to write.
/// @param file_content The content to write.
/// @return True on success, false otherwise.
  static bool writeFile(const string &file_name, const string &file_content);

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a directory unless it exists already.
///
/// @param dir_name The name of the directory.
/// @return True if the directory exists after the call, false otherwise.
  static bool createDir(const string &dir_name);

// -------------------------------------------------------------------------------------------
///
/// @brief Concatenates a directory name and a file name.
///
/// @param dir_name The name of the directory (with or without trailing slash).
/// @param file_name The name of the file within that directory.
/// @return The path dir_name/file_name.
  static string join(const string &dir_name, const string &file_name);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~FileUtils();

private:

// -------------------------------------------------------------------------------------------
  FileUtils();

// -------------------------------------------------------------------------------------------
  FileUtils(const FileUtils &other);

// -------------------------------------------------------------------------------------------
  FileUtils& operator=(const FileUtils &other);
};

// -------------------------------------------------------------------------------------------
///
/// @class ScopedFile
/// @brief Owns a (temporary) file and removes it when going out of scope.
///
/// The file is removed on every path out of the scope, including exceptions. If the file
/// should survive (e.g., because the user wants to inspect the generated CNFs), construct
/// the object with keep = true.
class ScopedFile
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// The file itself is not created by the constructor.
///
/// @param file_name The name of the file.
/// @param keep True if the file should not be removed by the destructor.
  ScopedFile(const string &file_name, bool keep);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor. Removes the file unless it is to be kept.
  virtual ~ScopedFile();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the file.
///
/// @return The name of the file.
  const string& getName() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The name of the file.
  string file_name_;

// -------------------------------------------------------------------------------------------
///
/// @brief True if the file should not be removed by the destructor.
  bool keep_;

private:

// -------------------------------------------------------------------------------------------
  ScopedFile(const ScopedFile &other);

// -------------------------------------------------------------------------------------------
  ScopedFile& operator=(const ScopedFile &other);
};

#endif // FileUtils_H__
