#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "concurrency/io_worker_pool.hpp"
#include "type/gallery_types.hpp"

namespace photoreel {

struct ListingResult {
  bool                      success_ = false;
  std::string               error_{};
  std::vector<SectionEntry> sections_{};
};

struct FragmentResult {
  bool                   success_ = false;
  std::string            error_{};
  std::vector<ItemEntry> items_{};
};

using ListingCallback    = std::function<void(ListingResult)>;
using FragmentCallback   = std::function<void(FragmentResult)>;
using CallbackDispatcher = std::function<void(std::function<void()>)>;

/// Posts callbacks to the Qt application thread; runs them inline without an application.
auto MakeQtDispatcher() -> CallbackDispatcher;

/**
 * @brief Asynchronous source of the head listing and of per-section fragments.
 *
 * Callbacks run on the dispatcher's thread. A failed fetch never carries data.
 */
class FragmentService {
 public:
  virtual ~FragmentService()                                                = default;
  virtual void FetchListing(fragment_ref_t ref, ListingCallback callback)   = 0;
  virtual void FetchFragment(fragment_ref_t ref, FragmentCallback callback) = 0;
};

/// Reads "<root>/<ref>.json" on worker threads.
class LocalFragmentService final : public FragmentService {
 public:
  explicit LocalFragmentService(std::filesystem::path root, CallbackDispatcher dispatcher = nullptr,
                                size_t worker_count = 2);
  ~LocalFragmentService() override;

  void FetchListing(fragment_ref_t ref, ListingCallback callback) override;
  void FetchFragment(fragment_ref_t ref, FragmentCallback callback) override;

  auto PathFor(fragment_ref_t ref) const -> std::filesystem::path;

 private:
  void                  Dispatch(std::function<void()> fn);

  std::filesystem::path root_;
  CallbackDispatcher    dispatcher_;
  IoWorkerPool          pool_;
};
};  // namespace photoreel
