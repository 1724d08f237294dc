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

#include "ui/gallery_view/section_widget.hpp"

#include <QDateTime>
#include <QLabel>
#include <QLocale>
#include <QMouseEvent>
#include <QPainter>
#include <QPushButton>

#include <algorithm>
#include <cmath>

namespace photoreel::ui {
namespace {
constexpr double kTileInset     = 2.0;
constexpr double kSelectorSize  = 18.0;
constexpr double kSelectorInset = 8.0;

auto SelectorRect(const QRectF& anchor) -> QRectF {
  return {anchor.left() + kSelectorInset, anchor.top() + kSelectorInset, kSelectorSize,
          kSelectorSize};
}

void PaintSelector(QPainter& painter, const QRectF& rect, bool selected) {
  painter.save();
  painter.setRenderHint(QPainter::Antialiasing, true);
  QPen pen(QColor(0xF2, 0xF2, 0xF2, 220));
  pen.setWidthF(1.6);
  painter.setPen(pen);
  painter.setBrush(selected ? QColor(0xFC, 0xC7, 0x04, 230) : QColor(0, 0, 0, 60));
  painter.drawEllipse(rect);
  painter.restore();
}
}  // namespace

SectionWidget::SectionWidget(section_idx_t index, const SectionEntry& entry, double header_height,
                             SectionViewHost& host, PixmapCache& cache, QWidget* parent)
    : QWidget(parent),
      index_(index),
      entry_(entry),
      header_height_(header_height),
      host_(host),
      cache_(cache) {
  const auto date = QDateTime::fromSecsSinceEpoch(entry.timestamp_).date();
  date_text_      = QLocale().toString(date, QLocale::ShortFormat);

  error_label_    = new QLabel(this);
  error_label_->setAlignment(Qt::AlignCenter);
  error_label_->setWordWrap(true);
  error_label_->hide();

  retry_button_ = new QPushButton(tr("Retry"), this);
  retry_button_->hide();
  connect(retry_button_, &QPushButton::clicked, this, [this]() { host_.OnRetryRequested(index_); });

  show();
}

void SectionWidget::SetTop(double top) {
  move(0, static_cast<int>(std::lround(top)));
  if (parentWidget() && width() != parentWidget()->width()) {
    resize(parentWidget()->width(), height());
  }
}

void SectionWidget::SetBodyHeight(double body_height) {
  const int w = parentWidget() ? parentWidget()->width() : width();
  resize(w, static_cast<int>(std::ceil(header_height_ + std::max(0.0, body_height))));
}

void SectionWidget::ShowPlaceholder(double body_height) {
  mode_ = Mode::Placeholder;
  rows_.clear();
  error_label_->hide();
  retry_button_->hide();
  SetBodyHeight(body_height);
  update();
}

void SectionWidget::ShowError(double body_height, const QString& message) {
  mode_ = Mode::Error;
  rows_.clear();
  SetBodyHeight(body_height);

  const int body_top = static_cast<int>(header_height_);
  error_label_->setText(tr("Could not load this section: %1").arg(message));
  error_label_->setGeometry(16, body_top + 8, width() - 32, 40);
  error_label_->show();
  retry_button_->adjustSize();
  retry_button_->move((width() - retry_button_->width()) / 2, body_top + 56);
  retry_button_->show();
  update();
}

void SectionWidget::SetRows(const std::vector<RowContent>& rows) {
  mode_ = Mode::Rows;
  rows_ = rows;
  error_label_->hide();
  retry_button_->hide();

  double body = 0.0;
  for (const auto& row : rows_) {
    body += row.height_;
  }
  SetBodyHeight(body);
  update();
}

void SectionWidget::SetRowSources(size_t row, QualityTier, const std::vector<QString>& locators) {
  if (row >= rows_.size()) {
    return;
  }
  auto& tiles = rows_[row].tiles_;
  for (size_t k = 0; k < tiles.size() && k < locators.size(); ++k) {
    tiles[k].locator_ = locators[k];
  }
  update();
}

auto SectionWidget::TileRect(size_t row, size_t tile) const -> QRectF {
  double y = header_height_;
  for (size_t k = 0; k < row; ++k) {
    y += rows_[k].height_;
  }
  double x = 0.0;
  for (size_t k = 0; k < tile; ++k) {
    x += rows_[row].tiles_[k].width_;
  }
  const auto& t = rows_[row].tiles_[tile];
  return {x, y, t.width_, t.height_};
}

auto SectionWidget::PixmapFor(const QString& locator, const QSize& size) -> QPixmap {
  if (locator.isEmpty() || size.isEmpty()) {
    return {};
  }
  const QString key = QStringLiteral("%1@%2x%3").arg(locator).arg(size.width()).arg(size.height());
  if (auto cached = cache_.Get(key)) {
    return *cached;
  }
  QPixmap source(locator);
  if (source.isNull()) {
    qWarning("Failed to load image %s", qUtf8Printable(locator));
    cache_.Put(key, QPixmap());
    return {};
  }
  auto scaled = source.scaled(size, Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation);
  cache_.Put(key, scaled);
  return scaled;
}

void SectionWidget::paintEvent(QPaintEvent*) {
  QPainter painter(this);
  painter.fillRect(rect(), QColor(0x1E, 0x1E, 0x1E));

  const QRectF header(0.0, 0.0, width(), header_height_);
  painter.setPen(QColor(0xE6, 0xE6, 0xE6));
  painter.drawText(header.adjusted(kSelectorInset * 2 + kSelectorSize, 0, 0, 0),
                   Qt::AlignLeft | Qt::AlignVCenter, date_text_);
  PaintSelector(painter, SelectorRect(header), host_.IsSectionSelected(index_));

  if (mode_ == Mode::Placeholder) {
    painter.fillRect(QRectF(0.0, header_height_, width(), height() - header_height_),
                     QColor(0x2A, 0x2A, 0x2A));
    return;
  }
  if (mode_ == Mode::Error) {
    return;
  }

  for (size_t r = 0; r < rows_.size(); ++r) {
    for (size_t t = 0; t < rows_[r].tiles_.size(); ++t) {
      const auto&  tile  = rows_[r].tiles_[t];
      const QRectF inner = TileRect(r, t).adjusted(kTileInset, kTileInset, -kTileInset, -kTileInset);
      const auto   pm    = PixmapFor(tile.locator_, inner.size().toSize());
      if (pm.isNull()) {
        painter.fillRect(inner, QColor(0x33, 0x33, 0x33));
      } else {
        const QRectF src((pm.width() - inner.width()) / 2.0, (pm.height() - inner.height()) / 2.0,
                         inner.width(), inner.height());
        painter.drawPixmap(inner, pm, src);
      }
      PaintSelector(painter, SelectorRect(inner), host_.IsItemSelected(index_, tile.item_id_));
    }
  }
}

auto SectionWidget::HitTest(const QPointF& pos) const -> std::optional<Hit> {
  const QRectF header(0.0, 0.0, width(), header_height_);
  if (SelectorRect(header).contains(pos)) {
    return Hit{{index_, ItemLocation::kHeader}, true};
  }
  if (mode_ != Mode::Rows) {
    return std::nullopt;
  }
  for (size_t r = 0; r < rows_.size(); ++r) {
    for (size_t t = 0; t < rows_[r].tiles_.size(); ++t) {
      const QRectF cell = TileRect(r, t);
      if (!cell.contains(pos)) {
        continue;
      }
      const ItemLocation location{index_, rows_[r].tiles_[t].index_};
      const QRectF inner = cell.adjusted(kTileInset, kTileInset, -kTileInset, -kTileInset);
      return Hit{location, SelectorRect(inner).contains(pos)};
    }
  }
  return std::nullopt;
}

void SectionWidget::mouseReleaseEvent(QMouseEvent* event) {
  if (event->button() != Qt::LeftButton) {
    QWidget::mouseReleaseEvent(event);
    return;
  }
  const auto hit = HitTest(event->position());
  if (!hit) {
    return;
  }
  if (hit->selector_) {
    host_.OnSelectorClicked(hit->location_, event->modifiers().testFlag(Qt::ShiftModifier));
  } else {
    host_.OnItemActivated(hit->location_);
  }
}
};  // namespace photoreel::ui
