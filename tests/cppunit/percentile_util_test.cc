/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "percentile_util.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

TEST(PercentileUtil, Interpolates) {
  std::vector<double> values = {3, 1, 2, 5, 4};
  EXPECT_DOUBLE_EQ(util::Percentile(values, 0), 1);
  EXPECT_DOUBLE_EQ(util::Percentile(values, 0.25), 2);
  EXPECT_DOUBLE_EQ(util::Percentile(values, 0.5), 3);
  EXPECT_NEAR(util::Percentile(values, 0.9), 4.6, 1e-9);
  EXPECT_DOUBLE_EQ(util::Percentile(values, 1), 5);

  EXPECT_DOUBLE_EQ(util::PercentileOfSorted({10, 20}, 0.5), 15);
  EXPECT_DOUBLE_EQ(util::PercentileOfSorted({42}, 0.7), 42);
}

TEST(PercentileUtil, OutOfRange) {
  EXPECT_TRUE(std::isnan(util::Percentile({}, 0.5)));
  EXPECT_TRUE(std::isnan(util::Percentile({1, 2}, -0.1)));
  EXPECT_TRUE(std::isnan(util::Percentile({1, 2}, 1.1)));
  EXPECT_TRUE(std::isnan(util::Percentile({1, 2}, NAN)));
}
