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
/// @file CubeAndConquer.cpp
/// @brief Contains the definition of the class CubeAndConquer.
// -------------------------------------------------------------------------------------------

#include "CubeAndConquer.h"
#include "AigCircuit.h"
#include "AIG2CNF.h"
#include "CubeGenerator.h"
#include "ConquerScheduler.h"
#include "LookaheadScorer.h"
#include "SatSolverFactory.h"
#include "ResultReporter.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
CubeAndConquer::CubeAndConquer(const AigCircuit &circuit,
                               LookaheadScorer *scorer,
                               SatSolverFactory *factory,
                               ResultReporter *reporter,
                               size_t depth,
                               size_t candidates_limit,
                               double timeout_sec,
                               size_t nr_of_threads) :
                 BackEnd(circuit),
                 scorer_(scorer),
                 factory_(factory),
                 reporter_(reporter),
                 depth_(depth),
                 candidates_limit_(candidates_limit),
                 timeout_sec_(timeout_sec),
                 nr_of_threads_(nr_of_threads)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CubeAndConquer::~CubeAndConquer()
{
  delete scorer_;
  scorer_ = NULL;
  delete factory_;
  factory_ = NULL;
  delete reporter_;
  reporter_ = NULL;
}

// -------------------------------------------------------------------------------------------
int CubeAndConquer::run()
{
  L_INF("Encoding the circuit into CNF ...");
  AIG2CNF encoder(circuit_);
  L_INF("The base CNF has " << encoder.getBase().getNrOfClauses() << " clauses over "
        << encoder.getMaxCNFVar() << " variables.");

  L_INF("Generating cubes with depth " << depth_ << " using the '" << scorer_->getName()
        << "' lookahead score ...");
  statistics_.notifyCubeStart();
  CubeGenerator generator(circuit_, encoder.getVarManager(), *scorer_, candidates_limit_);
  vector<Cube> cubes = generator.generate(depth_);
  statistics_.notifyCubeEnd(cubes.size(), generator.getNrOfProbes(),
                            generator.getNrOfForced(), generator.getNrOfRefuted());

  statistics_.notifyConquerStart();
  ConquerScheduler scheduler(encoder, *factory_, timeout_sec_, nr_of_threads_);
  vector<Verdict> verdicts = scheduler.runAll(cubes);
  result_ = ResultAggregator::aggregate(verdicts);
  statistics_.notifyConquerEnd(result_);

  reporter_->report(result_);
  statistics_.logStatistics();
  return toExitCode(result_.answer_);
}

// -------------------------------------------------------------------------------------------
const FinalResult& CubeAndConquer::getResult() const
{
  return result_;
}

// -------------------------------------------------------------------------------------------
int CubeAndConquer::toExitCode(Verdict::Kind answer)
{
  if(answer == Verdict::SAT)
    return 10;
  if(answer == Verdict::UNSAT)
    return 20;
  return 0;
}
