#pragma once

#include <QPixmap>
#include <QString>
#include <QWidget>

namespace photoreel {
class FullscreenNavigator;
};  // namespace photoreel

namespace photoreel::ui {

/// Overlay showing one item at the large tier. Input is forwarded to the navigator.
class FullscreenWidget final : public QWidget {
 public:
  FullscreenWidget(FullscreenNavigator& navigator, QWidget* parent = nullptr);

  void SetVisibleState(bool visible);
  void SetSource(const QString& locator);

 protected:
  void paintEvent(QPaintEvent*) override;
  void keyPressEvent(QKeyEvent* event) override;
  void mousePressEvent(QMouseEvent* event) override;
  void mouseReleaseEvent(QMouseEvent* event) override;

 private:
  FullscreenNavigator& navigator_;
  QString              locator_{};
  QPixmap              pixmap_{};
};
};  // namespace photoreel::ui
