//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "layout/row_partitioner.hpp"

#include <cmath>

namespace photoreel {

auto RowPartitioner::Solve(const std::vector<ItemEntry>& items, double width, double ideal_height,
                           const PartitionParams& params, bool safe) -> std::vector<Breakpoint> {
  const size_t n            = items.size();
  const double ideal_aspect = width / ideal_height;
  const double shrink       = params.shrink_ratio_ * ideal_aspect;
  const double stretch =
      (safe ? params.safe_stretch_ratio_ : params.stretch_ratio_) * ideal_aspect;

  std::vector<Breakpoint> path(n + 1);
  path[0].reached_ = true;

  auto update      = [&path](size_t start, size_t end, double cost, double height) {
    auto& bp = path[end];
    if (!bp.reached_ || cost < bp.cost_) {
      bp = {true, start, cost, height};
    }
  };

  for (size_t start = 0; start < n; ++start) {
    if (!path[start].reached_) {
      continue;
    }
    const double base_cost = path[start].cost_;

    double       aspect    = 0.0;
    for (size_t end = start + 1; end <= n; ++end) {
      aspect += items[end - 1].Aspect();

      if (end == n && aspect < ideal_aspect) {
        update(start, end, base_cost, ideal_height);
      } else if (aspect >= shrink || safe) {
        if (aspect <= stretch || end == start + 1) {
          const double row_cost = (aspect - ideal_aspect) * (aspect - ideal_aspect);
          update(start, end, base_cost + row_cost, width / aspect);
        } else {
          break;
        }
      }
    }
  }
  return path;
}

void RowPartitioner::FillWidths(LayoutRow& row, const std::vector<ItemEntry>& items) {
  row.widths_.clear();
  row.widths_.reserve(row.Size());
  for (size_t i = row.start_; i < row.end_; ++i) {
    row.widths_.push_back(items[i].Aspect() * row.height_);
  }
}

auto RowPartitioner::Partition(const std::vector<ItemEntry>& items, double width,
                               double ideal_height, const PartitionParams& params, bool safe)
    -> std::vector<LayoutRow> {
  if (items.empty() || width <= 0.0 || ideal_height <= 0.0) {
    return {};
  }

  const auto             path = Solve(items, width, ideal_height, params, safe);

  std::vector<LayoutRow> rows;
  size_t                 end  = items.size();
  while (end > 0) {
    const auto& bp = path[end];
    if (!bp.reached_) {
      // Safe mode admits every single-item row, so this cannot recurse twice.
      return Partition(items, width, ideal_height, params, true);
    }
    rows.push_back(LayoutRow{bp.start_, end, bp.height_, {}});
    end = bp.start_;
  }

  std::vector<LayoutRow> ordered(rows.rbegin(), rows.rend());
  for (auto& row : ordered) {
    FillWidths(row, items);
  }
  return ordered;
}

auto RowPartitioner::PathCost(const std::vector<LayoutRow>& rows,
                              const std::vector<ItemEntry>& items, double width,
                              double ideal_height) -> double {
  const double ideal_aspect = width / ideal_height;
  double       total        = 0.0;
  for (const auto& row : rows) {
    double aspect = 0.0;
    for (size_t i = row.start_; i < row.end_; ++i) {
      aspect += items[i].Aspect();
    }
    if (row.end_ == items.size() && aspect < ideal_aspect) {
      continue;
    }
    total += (aspect - ideal_aspect) * (aspect - ideal_aspect);
  }
  return total;
}

auto RowPartitioner::IsAdmissible(const std::vector<LayoutRow>& rows,
                                  const std::vector<ItemEntry>& items, double width,
                                  double ideal_height, const PartitionParams& params, bool safe)
    -> bool {
  const double ideal_aspect = width / ideal_height;
  const double shrink       = params.shrink_ratio_ * ideal_aspect;
  const double stretch =
      (safe ? params.safe_stretch_ratio_ : params.stretch_ratio_) * ideal_aspect;

  size_t expected_start = 0;
  for (const auto& row : rows) {
    if (row.start_ != expected_start || row.end_ <= row.start_ || row.end_ > items.size()) {
      return false;
    }
    double aspect = 0.0;
    for (size_t i = row.start_; i < row.end_; ++i) {
      aspect += items[i].Aspect();
      // Partition() stops extending a row once a multi-item prefix overshoots.
      const bool prefix_ok = aspect <= stretch || i == row.start_ || !(aspect >= shrink || safe);
      if (i + 1 < row.end_ && !prefix_ok) {
        return false;
      }
    }
    const bool terminal_short = row.end_ == items.size() && aspect < ideal_aspect;
    if (!terminal_short) {
      if (!(aspect >= shrink || safe)) {
        return false;
      }
      if (!(aspect <= stretch || row.Size() == 1)) {
        return false;
      }
    }
    expected_start = row.end_;
  }
  return expected_start == items.size();
}

auto RowPartitioner::ContentHeight(const std::vector<LayoutRow>& rows) -> double {
  double total = 0.0;
  for (const auto& row : rows) {
    total += row.height_;
  }
  return total;
}
};  // namespace photoreel
