#include <QApplication>
#include <QMessageBox>
#include <QStackedLayout>
#include <QWidget>

#include <charconv>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "app/fragment_service.hpp"
#include "app/url_resolver.hpp"
#include "config/gallery_config.hpp"
#include "gallery/gallery_engine.hpp"
#include "ui/gallery_view/fullscreen_widget.hpp"
#include "ui/gallery_view/gallery_widget.hpp"

namespace {

auto FindArgValue(int argc, char** argv, std::string_view option_name)
    -> std::optional<std::string_view> {
  const std::string opt_eq = std::string(option_name) + "=";
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i] ? argv[i] : "");
    if (arg == option_name) {
      if (i + 1 < argc && argv[i + 1]) {
        return std::string_view(argv[i + 1]);
      }
      return std::nullopt;
    }
    if (arg.rfind(opt_eq, 0) == 0) {
      return arg.substr(opt_eq.size());
    }
  }
  return std::nullopt;
}

auto ParseRef(std::string_view text) -> std::optional<photoreel::fragment_ref_t> {
  photoreel::fragment_ref_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

constexpr std::string_view kUsage =
    "usage: photoreel_viewer --root <dir> [--head <ref>] [--url-template <pattern>] "
    "[--config <file>]";

}  // namespace

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setApplicationName("photoreel");

  const auto root_arg = FindArgValue(argc, argv, "--root");
  if (!root_arg.has_value()) {
    qCritical("%s", kUsage.data());
    return 2;
  }
  const std::filesystem::path root(std::string(root_arg.value()));

  photoreel::fragment_ref_t head = 0;
  if (const auto head_arg = FindArgValue(argc, argv, "--head"); head_arg.has_value()) {
    const auto parsed = ParseRef(head_arg.value());
    if (!parsed.has_value()) {
      qCritical("Invalid --head value: %s", std::string(head_arg.value()).c_str());
      return 2;
    }
    head = parsed.value();
  }

  photoreel::GalleryConfig config;
  if (const auto config_arg = FindArgValue(argc, argv, "--config"); config_arg.has_value()) {
    try {
      config = photoreel::LoadGalleryConfig(std::string(config_arg.value()));
    } catch (const std::exception& e) {
      qCritical("Failed to load config: %s", e.what());
      return 1;
    }
  }

  QString pattern = QString::fromStdString((root / "{quality}" / "{id}.jpg").string());
  if (const auto tpl = FindArgValue(argc, argv, "--url-template"); tpl.has_value()) {
    pattern = QString::fromUtf8(tpl->data(), static_cast<qsizetype>(tpl->size()));
  }

  QWidget window;
  window.setWindowTitle("photoreel");
  window.resize(1280, 860);
  auto* stack   = new QStackedLayout(&window);
  stack->setStackingMode(QStackedLayout::StackAll);
  auto* gallery = new photoreel::ui::GalleryWidget(config.header_height_);
  stack->addWidget(gallery);

  auto service  = std::make_shared<photoreel::LocalFragmentService>(root);
  auto engine   = std::make_unique<photoreel::GalleryEngine>(
      *gallery, service, photoreel::MakeTemplateUrlResolver(pattern), config);

  auto* overlay = new photoreel::ui::FullscreenWidget(engine->Fullscreen());
  stack->addWidget(overlay);
  stack->setCurrentWidget(gallery);

  QObject::connect(engine.get(), &photoreel::GalleryEngine::FullscreenVisibilityChanged, overlay,
                   &photoreel::ui::FullscreenWidget::SetVisibleState);
  QObject::connect(engine.get(), &photoreel::GalleryEngine::FullscreenSourceChanged, overlay,
                   &photoreel::ui::FullscreenWidget::SetSource);
  QObject::connect(engine.get(), &photoreel::GalleryEngine::Installed, &window,
                   [&window](int count) {
                     window.setWindowTitle(QStringLiteral("photoreel - %1 sections").arg(count));
                   });
  QObject::connect(engine.get(), &photoreel::GalleryEngine::InstallFailed, &window,
                   [&window](const QString& message) {
                     QMessageBox::warning(&window, QStringLiteral("photoreel"),
                                          QStringLiteral("Could not load the gallery.\n%1")
                                              .arg(message));
                   });
  QObject::connect(engine.get(), &photoreel::GalleryEngine::SelectionChanged, &window,
                   [&window, gallery_engine = engine.get()]() {
                     const auto count = gallery_engine->Selection().SelectedCount();
                     window.setWindowTitle(count == 0
                                               ? QStringLiteral("photoreel")
                                               : QStringLiteral("photoreel - %1 selected")
                                                     .arg(static_cast<qulonglong>(count)));
                   });

  window.show();
  engine->Start(head);

  const int rc = app.exec();
  // Teardown clears selection and fullscreen; the window must not react to it.
  QObject::disconnect(engine.get(), nullptr, nullptr, nullptr);
  engine.reset();
  return rc;
}
