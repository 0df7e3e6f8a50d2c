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


#include "CubeGenerator.h"
#include "AigCircuit.h"
#include "VarManager.h"
#include "LookaheadScorer.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

#include <cmath>

static vector<Cube> generateCubes(const AigCircuit &circuit, size_t depth,
                                  LookaheadScorer::Policy policy = LookaheadScorer::PRODUCT,
                                  size_t candidates_limit = 10) {
  VarManager var_manager(circuit);
  LookaheadScorer *scorer = LookaheadScorer::create(policy);
  CubeGenerator generator(circuit, var_manager, *scorer, candidates_limit);
  vector<Cube> cubes = generator.generate(depth);
  delete scorer;
  return cubes;
}

// Two cubes are disjoint if one decides a variable the other one decides differently.
static bool areDisjoint(const Cube &a, const Cube &b) {
  vector<int> dec_a = a.getDecisions();
  vector<int> dec_b = b.getDecisions();
  for(size_t i = 0; i < dec_a.size(); ++i)
    for(size_t j = 0; j < dec_b.size(); ++j)
      if(dec_a[i] == -dec_b[j])
        return true;
  return false;
}

static void expectPartition(const vector<Cube> &cubes) {
  // the decisions form a complete binary tree, so the leaves cover the whole space:
  double kraft_sum = 0.0;
  for(size_t cnt = 0; cnt < cubes.size(); ++cnt)
    kraft_sum += ldexp(1.0, -static_cast<int>(cubes[cnt].getNrOfDecisions()));
  EXPECT_DOUBLE_EQ(kraft_sum, 1.0);
  for(size_t i = 0; i < cubes.size(); ++i)
    for(size_t j = i + 1; j < cubes.size(); ++j)
      EXPECT_TRUE(areDisjoint(cubes[i], cubes[j]))
        << cubes[i].toString() << " and " << cubes[j].toString();
}

// -------------------------------------------------------------------------------------------
// LookaheadScorer
// -------------------------------------------------------------------------------------------

TEST(LookaheadScorerTest, ProductAndFraction) {
  LookaheadScorer *product = LookaheadScorer::create(LookaheadScorer::PRODUCT);
  LookaheadScorer *fraction = LookaheadScorer::create(LookaheadScorer::FRACTION);
  EXPECT_DOUBLE_EQ(product->score(10, 2, 3), 6.0);
  EXPECT_DOUBLE_EQ(fraction->score(10, 2, 3), 0.25);
  // a balanced split beats an unbalanced one with the same sum:
  EXPECT_GT(product->score(10, 3, 3), product->score(10, 5, 1));
  EXPECT_EQ(product->getName(), "product");
  EXPECT_EQ(fraction->getName(), "fraction");
  delete product;
  delete fraction;
}

TEST(LookaheadScorerTest, ParsePolicy) {
  LookaheadScorer::Policy policy = LookaheadScorer::PRODUCT;
  EXPECT_TRUE(LookaheadScorer::parsePolicy("fraction", policy));
  EXPECT_EQ(policy, LookaheadScorer::FRACTION);
  EXPECT_TRUE(LookaheadScorer::parsePolicy("product", policy));
  EXPECT_EQ(policy, LookaheadScorer::PRODUCT);
  EXPECT_FALSE(LookaheadScorer::parsePolicy("balance", policy));
}

// -------------------------------------------------------------------------------------------
// CubeGenerator
// -------------------------------------------------------------------------------------------

TEST(CubeGeneratorTest, DepthZeroGivesOneEmptyCube) {
  AigCircuit *circuit = TestCircuits::parityMiter(8, false);
  vector<Cube> cubes = generateCubes(*circuit, 0);
  ASSERT_EQ(cubes.size(), 1u);
  EXPECT_EQ(cubes[0].size(), 0u);
  delete circuit;
}

TEST(CubeGeneratorTest, MiterDepthThreeGivesEightCubes) {
  AigCircuit *circuit = TestCircuits::parityMiter(16, false);
  vector<Cube> cubes = generateCubes(*circuit, 3);
  ASSERT_EQ(cubes.size(), 8u);
  for(size_t cnt = 0; cnt < cubes.size(); ++cnt)
    EXPECT_EQ(cubes[cnt].getNrOfDecisions(), 3u);
  expectPartition(cubes);
  delete circuit;
}

TEST(CubeGeneratorTest, PartitionForAllDepths) {
  AigCircuit *circuit = TestCircuits::parityMiter(6, true);
  for(size_t depth = 0; depth <= 5; ++depth) {
    vector<Cube> cubes = generateCubes(*circuit, depth);
    EXPECT_LE(cubes.size(), static_cast<size_t>(1) << depth);
    expectPartition(cubes);
  }
  delete circuit;
}

TEST(CubeGeneratorTest, PartitionWithFractionScore) {
  AigCircuit *circuit = TestCircuits::parityMiter(10, false);
  vector<Cube> cubes = generateCubes(*circuit, 4, LookaheadScorer::FRACTION, 0);
  EXPECT_FALSE(cubes.empty());
  expectPartition(cubes);
  delete circuit;
}

TEST(CubeGeneratorTest, Idempotence) {
  AigCircuit *circuit = TestCircuits::parityMiter(12, false);
  vector<Cube> first = generateCubes(*circuit, 4);
  vector<Cube> second = generateCubes(*circuit, 4);
  ASSERT_EQ(first.size(), second.size());
  for(size_t cnt = 0; cnt < first.size(); ++cnt)
    EXPECT_TRUE(first[cnt] == second[cnt]) << "cube " << cnt;
  delete circuit;
}

TEST(CubeGeneratorTest, GeneratorCanBeReused) {
  AigCircuit *circuit = TestCircuits::parityMiter(8, false);
  VarManager var_manager(*circuit);
  LookaheadScorer *scorer = LookaheadScorer::create(LookaheadScorer::PRODUCT);
  CubeGenerator generator(*circuit, var_manager, *scorer, 10);
  vector<Cube> first = generator.generate(2);
  vector<Cube> second = generator.generate(2);
  ASSERT_EQ(first.size(), second.size());
  for(size_t cnt = 0; cnt < first.size(); ++cnt)
    EXPECT_TRUE(first[cnt] == second[cnt]);
  EXPECT_GT(generator.getNrOfProbes(), 0u);
  delete scorer;
  delete circuit;
}

TEST(CubeGeneratorTest, UnsatisfiableOutputGivesOneEmptyCube) {
  AigCircuit *circuit = TestCircuits::contradiction();
  vector<Cube> cubes = generateCubes(*circuit, 3);
  ASSERT_EQ(cubes.size(), 1u);
  EXPECT_EQ(cubes[0].size(), 0u);
  delete circuit;
}

TEST(CubeGeneratorTest, RunsOutOfCandidates) {
  // after asserting the output, the AND gate has nothing left to split on:
  AigCircuit *circuit = TestCircuits::andGate();
  vector<Cube> cubes = generateCubes(*circuit, 4);
  ASSERT_EQ(cubes.size(), 1u);
  EXPECT_EQ(cubes[0].getNrOfDecisions(), 0u);
  delete circuit;
}

TEST(CubeGeneratorTest, LiteralsAreCnfVariablesOfNodes) {
  AigCircuit *circuit = TestCircuits::parityMiter(8, false);
  VarManager var_manager(*circuit);
  vector<Cube> cubes = generateCubes(*circuit, 3);
  for(size_t cnt = 0; cnt < cubes.size(); ++cnt) {
    const vector<int> &lits = cubes[cnt].getLiterals();
    for(size_t l = 0; l < lits.size(); ++l) {
      int var = lits[l] < 0 ? -lits[l] : lits[l];
      EXPECT_GT(var, 0);
      EXPECT_LT(var, var_manager.getConstVar());
    }
  }
  delete circuit;
}
