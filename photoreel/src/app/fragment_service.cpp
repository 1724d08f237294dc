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

#include "app/fragment_service.hpp"

#include <QCoreApplication>
#include <QMetaObject>

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "wire/fragment_codec.hpp"

namespace photoreel {
namespace {
auto ReadFile(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error(std::format("Fragment {} not found", path.filename().string()));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}
}  // namespace

auto MakeQtDispatcher() -> CallbackDispatcher {
  return [](std::function<void()> fn) {
    auto* app = QCoreApplication::instance();
    if (!app) {
      fn();
      return;
    }
    QMetaObject::invokeMethod(app, std::move(fn), Qt::QueuedConnection);
  };
}

LocalFragmentService::LocalFragmentService(std::filesystem::path root,
                                           CallbackDispatcher dispatcher, size_t worker_count)
    : root_(std::move(root)),
      dispatcher_(dispatcher ? std::move(dispatcher) : MakeQtDispatcher()),
      pool_(worker_count) {}

LocalFragmentService::~LocalFragmentService() { pool_.Shutdown(); }

auto LocalFragmentService::PathFor(fragment_ref_t ref) const -> std::filesystem::path {
  return root_ / std::format("{}.json", ref);
}

void LocalFragmentService::Dispatch(std::function<void()> fn) { dispatcher_(std::move(fn)); }

void LocalFragmentService::FetchListing(fragment_ref_t ref, ListingCallback callback) {
  const auto path     = PathFor(ref);
  const bool accepted = pool_.Submit([this, path, callback]() {
    ListingResult result;
    try {
      result.sections_ = FragmentCodec::ParseListing(ReadFile(path));
      result.success_  = true;
    } catch (const std::exception& e) {
      result.sections_.clear();
      result.error_ = e.what();
    }
    Dispatch([callback, result = std::move(result)]() mutable { callback(std::move(result)); });
  });
  if (!accepted) {
    Dispatch([callback]() { callback(ListingResult{false, "Fragment service is shut down", {}}); });
  }
}

void LocalFragmentService::FetchFragment(fragment_ref_t ref, FragmentCallback callback) {
  const auto path     = PathFor(ref);
  const bool accepted = pool_.Submit([this, path, callback]() {
    FragmentResult result;
    try {
      result.items_   = FragmentCodec::ParseSection(ReadFile(path));
      result.success_ = true;
    } catch (const std::exception& e) {
      result.items_.clear();
      result.error_ = e.what();
    }
    Dispatch([callback, result = std::move(result)]() mutable { callback(std::move(result)); });
  });
  if (!accepted) {
    Dispatch([callback]() { callback(FragmentResult{false, "Fragment service is shut down", {}}); });
  }
}
};  // namespace photoreel
