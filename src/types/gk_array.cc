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

#include "gk_array.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/repeat_n.hpp>
#include <range/v3/view/transform.hpp>
#include <utility>

#include "percentile_util.h"

namespace gksketch {

namespace {

constexpr uint64_t kMaxCompactionPeriod = uint64_t{1} << 62;

// floor(1 / epsilon) + 1, saturated for vanishing epsilon
uint64_t CompactionPeriod(double epsilon) {
  const double period = std::floor(1.0 / epsilon) + 1;
  if (period >= static_cast<double>(kMaxCompactionPeriod)) {
    return kMaxCompactionPeriod;
  }
  return static_cast<uint64_t>(period);
}

bool IsValidQuantile(double q) { return q >= 0 && q <= 1; }

}  // namespace

StatusOr<GKArray> GKArray::Create(const GKArrayCreateOptions& options) {
  if (!std::isfinite(options.epsilon) || options.epsilon <= 0) {
    return {Status::InvalidArgument, fmt::format("epsilon must be a positive number, got {}", options.epsilon)};
  }
  return GKArray(options.epsilon);
}

void GKArray::Add(double value) {
  DCHECK(std::isfinite(value)) << "cannot add a non-finite value: " << value;

  count_++;
  sum_ += value;
  mean_ += (value - mean_) / static_cast<double>(count_);
  min_ = std::min(min_, value);
  max_ = std::max(max_, value);
  incoming_.push_back(value);

  if (count_ % CompactionPeriod(epsilon_) == 0) {
    Compact();
  }
}

uint64_t GKArray::Size() {
  if (!incoming_.empty()) {
    Compact();
  }
  return entries_.size();
}

void GKArray::compact(std::vector<Entry> extra_entries) {
  const auto removal_threshold = static_cast<int64_t>(std::floor(2 * epsilon_ * (static_cast<double>(count_) - 1)));

  auto incoming = incoming_ | ranges::views::transform([](double value) { return Entry(value, 1, 0); }) |
                  ranges::to<std::vector<Entry>>();
  incoming.insert(incoming.end(), std::make_move_iterator(extra_entries.begin()),
                  std::make_move_iterator(extra_entries.end()));
  std::stable_sort(incoming.begin(), incoming.end(),
                   [](const Entry& lhs, const Entry& rhs) { return lhs.value < rhs.value; });

  auto absorbable = [removal_threshold](const Entry& left, const Entry& right) {
    return left.g + right.g + right.delta <= removal_threshold;
  };

  // sweep both sorted lists, on equal values the existing entry goes first.
  // an absorbed entry hands its g over to the next entry and is not emitted.
  std::vector<Entry> current = std::move(entries_);
  std::vector<Entry> merged;
  merged.reserve(current.size() + incoming.size());
  size_t i = 0, j = 0;
  while (i < incoming.size() || j < current.size()) {
    if (i < incoming.size() && (j == current.size() || incoming[i].value < current[j].value)) {
      Entry& entry = incoming[i];
      if (j == current.size()) {
        if (i + 1 < incoming.size() && absorbable(entry, incoming[i + 1])) {
          incoming[i + 1].g += entry.g;
        } else {
          merged.push_back(entry);
        }
      } else if (absorbable(entry, current[j])) {
        current[j].g += entry.g;
      } else {
        // the new entry may sit anywhere within the rank range of its successor
        entry.delta = current[j].g + current[j].delta - entry.g;
        merged.push_back(entry);
      }
      i++;
    } else {
      if (j + 1 < current.size() && absorbable(current[j], current[j + 1])) {
        current[j + 1].g += current[j].g;
      } else {
        merged.push_back(current[j]);
      }
      j++;
    }
  }

  DCHECK(std::is_sorted(merged.begin(), merged.end(),
                        [](const Entry& lhs, const Entry& rhs) { return lhs.value < rhs.value; }));
  entries_ = std::move(merged);
  incoming_.clear();
}

std::vector<Entry> GKArray::reconstructEntries() const {
  DCHECK(incoming_.empty()) << "entries can only be reconstructed from a compacted summary";

  std::vector<Entry> entries;
  if (entries_.empty()) {
    return entries;
  }

  const int64_t spread = this->spread();
  auto append = [&entries](double value, int64_t g) {
    if (g > 0) {
      entries.emplace_back(value, g, 0);
    }
  };

  append(min_, entries_.front().g + entries_.front().delta - spread - 1);
  for (size_t i = 0; i + 1 < entries_.size(); i++) {
    append(entries_[i].value, entries_[i + 1].g + entries_[i + 1].delta - entries_[i].delta);
  }
  append(entries_.back().value, spread + 1 - entries_.back().delta);
  return entries;
}

Status GKArray::Merge(GKArray* other) {
  if (other == nullptr || other == this) {
    return {Status::InvalidArgument, "a summary can only be merged with another summary"};
  }
  if (epsilon_ != other->epsilon_) {
    LOG(WARNING) << "refuse to merge summaries with different epsilon: " << epsilon_ << " vs " << other->epsilon_;
    return {Status::IncompatiblePrecision,
            fmt::format("cannot merge summaries with different epsilon: {} vs {}", epsilon_, other->epsilon_)};
  }

  if (other->count_ == 0) {
    Compact();
    return Status::OK();
  }

  other->Compact();
  if (count_ == 0) {
    entries_ = other->entries_;
    incoming_.clear();
    count_ = other->count_;
    sum_ = other->sum_;
    mean_ = other->mean_;
    min_ = other->min_;
    max_ = other->max_;
    return Status::OK();
  }

  auto entries = other->reconstructEntries();

  const uint64_t total = count_ + other->count_;
  mean_ += (other->mean_ - mean_) * static_cast<double>(other->count_) / static_cast<double>(total);
  sum_ += other->sum_;
  count_ = total;
  epsilon_ = std::max(epsilon_, other->epsilon_);
  min_ = std::min(min_, other->min_);
  max_ = std::max(max_, other->max_);

  compact(std::move(entries));
  return Status::OK();
}

int64_t GKArray::rankOf(double q) const { return static_cast<int64_t>(q * static_cast<double>(count_ - 1) + 1); }

int64_t GKArray::spread() const { return static_cast<int64_t>(epsilon_ * static_cast<double>(count_ - 1)); }

std::vector<double> GKArray::expandedValues() const {
  return entries_ |
         ranges::views::transform([](const Entry& entry) { return ranges::views::repeat_n(entry.value, entry.g); }) |
         ranges::views::join | ranges::to<std::vector<double>>();
}

double GKArray::Quantile(double q) {
  if (!IsValidQuantile(q) || count_ == 0) {
    return NAN;
  }

  if (!incoming_.empty()) {
    Compact();
  }

  if (isSmallSample()) {
    return util::PercentileOfSorted(expandedValues(), q);
  }

  const int64_t rank = rankOf(q);
  const int64_t spread = this->spread();
  int64_t g_sum = 0;
  size_t i = 0;
  for (; i < entries_.size(); i++) {
    g_sum += entries_[i].g;
    if (g_sum + entries_[i].delta - 1 > rank + spread) {
      break;
    }
  }
  return i == 0 ? min_ : entries_[i - 1].value;
}

std::vector<double> GKArray::Quantiles(const std::vector<double>& qs) {
  if (count_ == 0) {
    return std::vector<double>(qs.size(), NAN);
  }

  if (!incoming_.empty()) {
    Compact();
  }

  std::vector<double> result;
  result.reserve(qs.size());

  if (isSmallSample()) {
    const auto values = expandedValues();
    for (auto q : qs) {
      result.push_back(util::PercentileOfSorted(values, q));
    }
    return result;
  }

  // NaN compares false both ways, so a list holding one looks sorted whatever its order
  const bool has_nan = std::any_of(qs.begin(), qs.end(), [](double q) { return std::isnan(q); });
  if (has_nan || !std::is_sorted(qs.begin(), qs.end())) {
    for (auto q : qs) {
      result.push_back(Quantile(q));
    }
    return result;
  }

  const int64_t spread = this->spread();
  int64_t g_sum = 0;
  size_t i = 0, j = 0;
  for (; i < entries_.size() && j < qs.size(); i++) {
    g_sum += entries_[i].g;
    for (; j < qs.size(); j++) {
      if (!IsValidQuantile(qs[j])) {
        result.push_back(NAN);
      } else if (g_sum + entries_[i].delta - 1 > rankOf(qs[j]) + spread) {
        result.push_back(i == 0 ? min_ : entries_[i - 1].value);
      } else {
        break;
      }
    }
  }
  for (; j < qs.size(); j++) {
    result.push_back(IsValidQuantile(qs[j]) ? max_ : NAN);
  }
  return result;
}

std::string GKArray::ToString() const {
  return fmt::format("gkarray<epsilon: {}, count: {}, entries: {}, buffered: {}>", epsilon_, count_, entries_.size(),
                     incoming_.size());
}

StatusOr<GKArray> GKArrayMerge(const std::vector<GKArray*>& sketches) {
  if (sketches.empty()) {
    return {Status::InvalidArgument, "no summary to merge"};
  }
  if (std::any_of(sketches.begin(), sketches.end(), [](const GKArray* sketch) { return sketch == nullptr; })) {
    return {Status::InvalidArgument, "cannot merge a null summary"};
  }

  auto merged = GKArray::Create({sketches.front()->Epsilon()});
  if (!merged) {
    return merged;
  }
  for (auto* sketch : sketches) {
    auto s = merged->Merge(sketch);
    if (!s) {
      return s;
    }
  }
  return merged;
}

}  // namespace gksketch
