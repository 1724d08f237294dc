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

#include "app/url_resolver.hpp"

namespace photoreel {

auto MakeTemplateUrlResolver(QString pattern) -> UrlResolver {
  return [pattern = std::move(pattern)](const item_id_t& id, QualityTier tier) {
    QString locator = pattern;
    locator.replace(QStringLiteral("{id}"), QString::fromStdString(id));
    locator.replace(QStringLiteral("{quality}"), QString::fromLatin1(QualityTierName(tier)));
    return locator;
  };
}
};  // namespace photoreel
