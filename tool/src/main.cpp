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
/// @mainpage Overview
///
/// @section intro_sec Introduction
///
/// aigcube decides if the single output of a combinational And-Inverter Graph (AIG) can
/// become true. A typical input is a miter: two implementations of the same function whose
/// outputs are XOR-ed. The miter output is unsatisfiable exactly if the two implementations
/// are equivalent, and every satisfying input assignment is a counterexample.
///
/// Hard miters are solved with cube-and-conquer. The circuit is encoded into CNF with the
/// Tseitin encoding and the output asserted to be true. A lookahead procedure on the circuit
/// then splits the input space into cubes (partial assignments). Every cube is a separate,
/// much easier, SAT problem. The cubes are solved in parallel by a pool of worker threads,
/// and the verdicts are combined into the answer for the whole circuit: SAT if any cube is
/// SAT, UNSAT if all cubes are UNSAT, and UNKNOWN otherwise (e.g., if a cube exceeded the
/// time limit).
///
/// @subsection input_sec Input of the Tool
/// The input is a circuit in <a href="http://fmv.jku.at/aiger/">AIGER</a> format (binary or
/// ASCII, optionally compressed) without latches and with exactly one output.
///
/// @subsection output_sec Output of the Tool
///
/// The tool prints the verdict of every cube (SAT, UNSAT, or UNKNOWN together with the
/// reason and the solving time) and the final answer. For SAT, the input values of a
/// counterexample are printed as well. The exit code is 10 for SAT, 20 for UNSAT, 0 for
/// UNKNOWN, and 1 in case of an error.
///
/// \section install_sec Installation and Usage
///
/// <ol>
///  <li> Install the third-party libraries AIGER, MiniSat, PicoSAT, and Lingeling (and
///       GoogleTest for the tests). If they are not installed in the standard locations,
///       install them into one directory and set the environment variable AIGCUBETP to
///       point to this directory:
///         @verbatim bash> export AIGCUBETP=<third_party_install>  @endverbatim
///  <li> Open a shell in the root directory of the project and type
///         @verbatim shell> cmake -S . -B build && cmake --build build @endverbatim
///  <li> Execute the program (@c build/aigcube-bin) with the option '--help' to get a list
///       of command-line options and their meaning.
/// </ol>
///
/// \section archit_sec Architecture
///
/// Different ways of processing the circuit are implemented in different @link BackEnd
/// BackEnds @endlink. The back-end CubeAndConquer implements the complete procedure, the
/// back-end CubeWriter only writes the cubes as DIMACS files. The main building blocks are:
/// <ul>
///  <li> AigCircuit: the immutable circuit, loaded and validated from an AIGER file.
///  <li> AIG2CNF: the Tseitin encoding of the circuit and the CNF of a single cube.
///  <li> CubeGenerator: the lookahead procedure on the circuit (using CircuitState for
///       propagation and a LookaheadScorer to rate decisions).
///  <li> ConquerScheduler: solves the cubes with a pool of worker threads, using solvers
///       created by a SatSolverFactory (MiniSat, PicoSAT, Lingeling, or an external
///       solver).
///  <li> ResultAggregator and ResultReporter: combine and print the verdicts.
/// </ul>
/// The class Options is a singleton that gives you access to the command-line parameters.
/// The Logger allows you to print messages (which can be enabled and disabled with
/// command-line options), the Stopwatch measures execution times.
// -------------------------------------------------------------------------------------------

#include "defines.h"
#include "Options.h"
#include "AigCircuit.h"
#include "Logger.h"
#include "Stopwatch.h"
#include "BackEnd.h"
#include "Utils.h"

#include <new>
#include <sys/resource.h>


// -------------------------------------------------------------------------------------------
///
/// @brief The entry point of the program.
///
/// @param argc The number of command line arguments.
/// @param argv The command line arguments. argv_[0] is the name of the process, so the
///        real arguments start with argv_[1].
/// @return 10 if the output of the circuit can be true, 20 if it cannot, 0 if the answer is
///         unknown (or nothing was solved), and 1 in case of an error.
int main (int argc, char **argv)
{
  PointInTime start_time = Stopwatch::start();
  bool quit = Options::instance().parse(argc, argv);
  if(quit)
    return Options::instance().hasParseError() ? 1 : 0;

  int exit_code = 0;
  AigCircuit *circuit = NULL;
  BackEnd *back_end = NULL;
  try
  {
    L_INF("Parsing the input file ...");
    circuit = AigCircuit::loadFromFile(Options::instance().getAigInFileName());
    back_end = Options::instance().getBackEnd(*circuit);
    L_INF("Starting the back-end '" << Options::instance().getBackEndName() << "' on "
          << back_end->describeCircuit() << " ...");
    exit_code = back_end->run();
  }
  catch(AigCubeException &e)
  {
    L_ERR(e.what());
    exit_code = 1;
  }
  catch(bad_alloc &e)
  {
    L_ERR("Out of memory (" << e.what() << ").");
    exit_code = 1;
  }
  delete back_end;
  delete circuit;

  double cpu_time = Stopwatch::getCPUTimeSec(start_time);
  size_t real_time = Stopwatch::getRealTimeSec(start_time);
  L_LOG("Overall execution time: " << cpu_time << " sec CPU time.");
  L_LOG("Overall execution time: " << real_time << " sec real time.");

  Utils::debugPrintCurrentMemUsage();
  struct rusage rusage;
  getrusage( RUSAGE_SELF, &rusage );
  L_DBG("Max memory usage: "<< rusage.ru_maxrss << " kB.");

  return exit_code;
}
