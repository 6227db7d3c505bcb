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

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "status.h"

namespace gksketch {

struct Entry {
  double value = 0;
  int64_t g = 1;      // ranks between the previous entry and this one, this one included
  int64_t delta = 0;  // max error of the rank covered by g

  std::string ToString() const { return fmt::format("entry<value: {}, g: {}, delta: {}>", value, g, delta); }

  explicit Entry() = default;
  explicit Entry(double value, int64_t g, int64_t delta) : value(value), g(g), delta(delta) {}
};

struct GKArrayCreateOptions {
  double epsilon = 0.01;
};

// Greenwald-Khanna summary kept as a sorted array of entries plus a buffer of raw values.
//
// The buffer is folded into the entries every floor(1 / epsilon) + 1 values, and before any query.
// Two summaries with the same epsilon can be merged, the merged summary answers quantiles over
// the union of both streams. count/sum/mean/min/max are exact and do not depend on compression.
//
// Not thread safe: the caller serializes access, queries included since they may compact.
class GKArray {
 public:
  static StatusOr<GKArray> Create(const GKArrayCreateOptions& options);

  void Add(double value);

  // fold the pending buffer into the entries
  void Compact() { compact({}); }

  // Merge `other` into this summary. `other` is compacted but otherwise left untouched.
  // Nothing is modified if the precisions differ.
  Status Merge(GKArray* other);

  // Returns NaN for an empty summary or q outside [0, 1].
  double Quantile(double q);
  // Same length and order as `qs`. Sorted input is answered with a single scan of the entries.
  std::vector<double> Quantiles(const std::vector<double>& qs);

  // number of entries once the buffer is folded in
  uint64_t Size();

  bool Empty() const { return count_ == 0; }
  uint64_t Count() const { return count_; }
  double Sum() const { return sum_; }
  double Mean() const { return mean_; }
  double Min() const { return min_; }
  double Max() const { return max_; }
  double Epsilon() const { return epsilon_; }
  const std::vector<Entry>& Entries() const { return entries_; }

  std::string ToString() const;

 private:
  explicit GKArray(double epsilon) : epsilon_(epsilon) {}

  void compact(std::vector<Entry> extra_entries);
  std::vector<Entry> reconstructEntries() const;
  std::vector<double> expandedValues() const;
  bool isSmallSample() const { return static_cast<double>(count_) < 1.0 / epsilon_; }
  int64_t rankOf(double q) const;
  int64_t spread() const;

  double epsilon_;
  std::vector<Entry> entries_;
  std::vector<double> incoming_;

  uint64_t count_ = 0;
  double sum_ = 0;
  double mean_ = 0;
  double min_ = std::numeric_limits<double>::infinity();
  double max_ = -std::numeric_limits<double>::infinity();
};

// Merge all sketches into a new one, built with the epsilon of the first sketch.
StatusOr<GKArray> GKArrayMerge(const std::vector<GKArray*>& sketches);

}  // namespace gksketch
