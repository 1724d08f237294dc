#pragma once

#include <functional>
#include <map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "gallery/section_store.hpp"
#include "type/gallery_types.hpp"

namespace photoreel {

/// Every item of the section, including ones not yet materialized.
struct SelectAll {
  auto operator==(const SelectAll&) const -> bool = default;
};
using PartialSelection = std::unordered_set<item_id_t>;
using SectionSelection = std::variant<SelectAll, PartialSelection>;

/**
 * @brief Selection over all sections, keyed by item id.
 *
 * A section's entry is SelectAll exactly when every loaded item is selected and
 * a non-empty PartialSelection otherwise; unselected sections have no entry.
 * State is independent of section views, so it survives view destruction.
 */
class SelectionModel {
 public:
  using ChangeListener = std::function<void(const std::vector<section_idx_t>&)>;

  explicit SelectionModel(const SectionStore& store) : store_(store) {}

  void SetChangeListener(ChangeListener listener) { listener_ = std::move(listener); }

  auto IsSelected(section_idx_t section) const -> bool;
  auto IsSelected(section_idx_t section, const item_id_t& item) const -> bool;
  auto IsSelected(const ItemLocation& location) const -> bool;
  auto State(section_idx_t section) const -> const SectionSelection*;

  /// Plain click or shift-click on an item selector or a section header.
  void Click(const ItemLocation& location, bool shift);
  void Toggle(const ItemLocation& location);
  void SetSection(section_idx_t section, bool value);
  void RangeSet(const ItemLocation& from, const ItemLocation& to, bool value);
  void Clear();

  auto LastClicked() const -> const ItemLocation& { return last_clicked_; }
  auto SelectedCount() const -> size_t;
  auto SelectedItems() const -> std::vector<std::pair<section_idx_t, item_id_t>>;
  auto Snapshot() const -> const std::map<section_idx_t, SectionSelection>& { return selected_; }

  static auto SortLocations(const ItemLocation& a, const ItemLocation& b)
      -> std::pair<ItemLocation, ItemLocation>;

 private:
  auto OpenPartial(section_idx_t section) -> PartialSelection*;
  void Commit(section_idx_t section);
  void SetSectionQuiet(section_idx_t section, bool value);
  void SubRangeSet(section_idx_t section, int start, int stop, bool value);
  void Notify(std::vector<section_idx_t> sections);

  const SectionStore&                      store_;
  std::map<section_idx_t, SectionSelection> selected_{};
  ItemLocation                             last_clicked_{0, ItemLocation::kHeader};
  ChangeListener                           listener_{};
};
};  // namespace photoreel
