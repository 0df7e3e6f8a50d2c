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


#include "Options.h"
#include "gtest/gtest.h"

// Options is a singleton, so every test passes all the options it depends on.
static bool parseArgs(const vector<string> &args) {
  vector<char*> argv;
  argv.push_back(const_cast<char*>("aigcube"));
  for(size_t cnt = 0; cnt < args.size(); ++cnt)
    argv.push_back(const_cast<char*>(args[cnt].c_str()));
  return Options::instance().parse(static_cast<int>(argv.size()), &argv[0]);
}

TEST(OptionsTest, DefaultsAreAccepted) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--print=E");
  args.push_back("--backend=cnc");
  args.push_back("--sat_sv=min_api");
  args.push_back("--keep-cnfs=");
  EXPECT_FALSE(parseArgs(args));
  EXPECT_FALSE(Options::instance().hasParseError());
  EXPECT_EQ(Options::instance().getAigInFileName(), "circuit.aag");
}

TEST(OptionsTest, KeptCnfsNeedExternalSolverOrCubesBackEnd) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--print=E");
  args.push_back("--backend=cnc");
  args.push_back("--sat_sv=pic_api");
  args.push_back("--keep-cnfs=/tmp/aigcube_kept");
  EXPECT_TRUE(parseArgs(args));
  EXPECT_TRUE(Options::instance().hasParseError());
}

TEST(OptionsTest, KeptCnfsWithExternalSolver) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--print=E");
  args.push_back("--backend=cnc");
  args.push_back("--sat_sv=ext");
  args.push_back("--ext_solver=kissat -q");
  args.push_back("--keep-cnfs=/tmp/aigcube_kept");
  EXPECT_FALSE(parseArgs(args));
  EXPECT_FALSE(Options::instance().hasParseError());
  EXPECT_EQ(Options::instance().getKeepDir(), "/tmp/aigcube_kept");
}

TEST(OptionsTest, KeptCnfsWithCubesBackEnd) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--print=E");
  args.push_back("--backend=cubes");
  args.push_back("--sat_sv=min_api");
  args.push_back("--keep-cnfs=/tmp/aigcube_cubes");
  EXPECT_FALSE(parseArgs(args));
  EXPECT_EQ(Options::instance().getBackEndName(), "cubes");
}

TEST(OptionsTest, CubesBackEndNeedsDirectory) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--print=E");
  args.push_back("--backend=cubes");
  args.push_back("--sat_sv=min_api");
  args.push_back("--keep-cnfs=");
  EXPECT_TRUE(parseArgs(args));
  EXPECT_TRUE(Options::instance().hasParseError());
}

TEST(OptionsTest, UnknownOptionIsRejected) {
  vector<string> args;
  args.push_back("--in=circuit.aag");
  args.push_back("--frobnicate");
  EXPECT_TRUE(parseArgs(args));
  EXPECT_TRUE(Options::instance().hasParseError());
}
