#pragma once

#include <QString>

#include <functional>

#include "type/type.hpp"

namespace photoreel {

/// Pure mapping from (item, tier) to an image locator. No caching.
using UrlResolver = std::function<QString(const item_id_t&, QualityTier)>;

/**
 * Substitutes "{id}" and "{quality}" in the template, e.g.
 * "/photos/{quality}/{id}.jpg" or "https://host/file/{id}?q={quality}".
 */
auto MakeTemplateUrlResolver(QString pattern) -> UrlResolver;
};  // namespace photoreel
