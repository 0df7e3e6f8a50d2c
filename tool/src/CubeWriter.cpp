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
/// @file CubeWriter.cpp
/// @brief Contains the definition of the class CubeWriter.
// -------------------------------------------------------------------------------------------

#include "CubeWriter.h"
#include "AigCircuit.h"
#include "AIG2CNF.h"
#include "CubeGenerator.h"
#include "LookaheadScorer.h"
#include "FileUtils.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
CubeWriter::CubeWriter(const AigCircuit &circuit,
                       LookaheadScorer *scorer,
                       size_t depth,
                       size_t candidates_limit,
                       const string &out_dir) :
             BackEnd(circuit),
             scorer_(scorer),
             depth_(depth),
             candidates_limit_(candidates_limit),
             out_dir_(out_dir)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CubeWriter::~CubeWriter()
{
  delete scorer_;
  scorer_ = NULL;
}

// -------------------------------------------------------------------------------------------
int CubeWriter::run()
{
  if(out_dir_.empty())
    throw AigCubeException("The back-end 'cubes' needs an output directory (--keep-cnfs).");
  if(!FileUtils::createDir(out_dir_))
    throw AigCubeException("Could not create the directory '" + out_dir_ + "'.");

  AIG2CNF encoder(circuit_);
  CubeGenerator generator(circuit_, encoder.getVarManager(), *scorer_, candidates_limit_);
  vector<Cube> cubes = generator.generate(depth_);
  L_INF("Writing " << cubes.size() << " cubes to '" << out_dir_ << "' ...");

  written_files_.clear();
  for(size_t cnt = 0; cnt < cubes.size(); ++cnt)
  {
    CubeQuery query = encoder.encodeWithAssumptions(cubes[cnt], cnt);
    string file_name = FileUtils::join(out_dir_, query.getName() + ".cnf");
    ofstream out(file_name.c_str());
    if(out)
      query.toDimacs(out);
    out.close();
    if(!out)
      throw AigCubeException("Could not write the file '" + file_name + "'.");
    L_DBG("Wrote " << file_name << ": " << cubes[cnt].toString());
    written_files_.push_back(file_name);
  }
  L_RES("Wrote " << written_files_.size() << " cube files to '" << out_dir_ << "'.");
  return 0;
}

// -------------------------------------------------------------------------------------------
const vector<string>& CubeWriter::getWrittenFiles() const
{
  return written_files_;
}
