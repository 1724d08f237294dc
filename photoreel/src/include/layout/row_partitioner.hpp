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

#pragma once

#include <vector>

#include "type/gallery_types.hpp"

namespace photoreel {

/// Bounds on how far a row may deviate from the ideal aspect ratio.
struct PartitionParams {
  double shrink_ratio_       = 0.8;
  double stretch_ratio_      = 1.2;
  double safe_stretch_ratio_ = 2.0;
};

/**
 * @brief Justified row layout for one section.
 *
 * Rows are chosen by a shortest-path search over the break points 0..n where the
 * cost of a row is the squared distance of its accumulated aspect ratio from
 * width / ideal_height. An unfilled last row is free and drawn at ideal_height.
 */
class RowPartitioner {
 public:
  static auto Partition(const std::vector<ItemEntry>& items, double width, double ideal_height,
                        const PartitionParams& params = {}, bool safe = false)
      -> std::vector<LayoutRow>;

  /// Sum of row costs of an arbitrary row sequence, using the same cost rule.
  static auto PathCost(const std::vector<LayoutRow>& rows, const std::vector<ItemEntry>& items,
                       double width, double ideal_height) -> double;

  /// True if every row of the sequence would be admitted by Partition().
  static auto IsAdmissible(const std::vector<LayoutRow>& rows,
                           const std::vector<ItemEntry>& items, double width, double ideal_height,
                           const PartitionParams& params = {}, bool safe = false) -> bool;

  static auto ContentHeight(const std::vector<LayoutRow>& rows) -> double;

 private:
  struct Breakpoint {
    bool   reached_ = false;
    size_t start_   = 0;
    double cost_    = 0.0;
    double height_  = 0.0;
  };

  static auto Solve(const std::vector<ItemEntry>& items, double width, double ideal_height,
                    const PartitionParams& params, bool safe) -> std::vector<Breakpoint>;
  static void FillWidths(LayoutRow& row, const std::vector<ItemEntry>& items);
};
};  // namespace photoreel
