#include "qc/session/ChartSession.hpp"
#include <utility>

namespace qc {

ChartSession::ChartSession(FrameClock& clock, const ChartOptions& options)
  : options_(options),
    zoom_(options.zoom), anim_(clock, options.animation),
    hidden_(std::make_shared<const HiddenSeriesSet>()) {
  router_.setController(&zoom_);
  router_.setChartHandler([this](const PointerEvent& ev) { return handleChartPointer(ev); });
  anim_.setRenderFn([this](double enter, const std::vector<double>& vis) {
    renderFrame(enter, vis);
  });
  relayout();
}

ChartSession::~ChartSession() {
  dispose();
}

void ChartSession::setRenderer(Renderer* renderer) {
  renderer_ = renderer;
  sync();
}

void ChartSession::setRecipe(std::unique_ptr<Recipe> recipe) {
  recipe_ = std::move(recipe);
  zoom_.reset();
  hover_.reset();
  sync();
}

void ChartSession::setOptions(const ChartOptions& options) {
  options_ = options;
  zoom_.setConfig(options_.zoom);
  anim_.setConfig(options_.animation);
  relayout();
  sync();
}

void ChartSession::setCanvasSize(int width, int height) {
  layout_.canvasW = width;
  layout_.canvasH = height;
  relayout();
  sync();
}

void ChartSession::relayout() {
  const double legendHeight = options_.legend.visible ? options_.legend.height : 0.0;
  layout_ = computeLayout(layout_.canvasW, layout_.canvasH, options_.padding,
                          options_.hasXTitle, options_.hasYTitle,
                          legendHeight, options_.legend.position);
  zoom_.setPlotRect(layout_.plotRect());
}

void ChartSession::sync() {
  if (disposed_) return;
  const std::size_t count = recipe_ ? recipe_->seriesCount() : 0;
  anim_.update(count, hidden_, ready());
  if (ready()) anim_.drawOnce();
}

void ChartSession::renderFrame(double enterProgress, const std::vector<double>& visibility) {
  if (!ready() || !recipe_) return;

  FrameContext ctx;
  ctx.layout = layout_;
  ctx.zoom = recipe_->zoomable() ? zoom_.zoom() : kNoZoom;
  ctx.enterProgress = enterProgress;
  ctx.visibility = visibility;
  ctx.tickCountHint = options_.tickCount;

  lastFrame_ = recipe_->build(ctx);
  if (auto overlay = zoom_.selectionOverlayRect()) {
    lastFrame_.batch.rects.push_back(*overlay);
  }

  std::optional<ClipRect> clip;
  if (recipe_->zoomable()) clip = zoom_.clipRect();

  lastStats_ = renderer_->draw(lastFrame_.batch, options_.backgroundRgba(),
                               clip ? &*clip : nullptr);
  framesRendered_++;
}

bool ChartSession::handlePointer(const PointerEvent& ev) {
  if (disposed_) return false;

  const unsigned zoomRev = zoom_.revision();
  const bool hadSelection = zoom_.selection().has_value();

  bool consumed = router_.route(ev);
  if (ev.type == PointerEventType::Leave) hover_.reset();

  // Zoom and selection changes need a new frame even with no animation
  // running.
  if (zoom_.revision() != zoomRev || hadSelection || zoom_.selection().has_value()) {
    if (zoom_.revision() != zoomRev) hover_.reset();
    if (ready()) anim_.drawOnce();
  }
  return consumed;
}

bool ChartSession::handleChartPointer(const PointerEvent& ev) {
  if (ev.type != PointerEventType::Move) return false;
  hover_ = hitTest(lastFrame_.hits, ev.x, ev.y);
  return hover_.has_value();
}

void ChartSession::toggleSeries(std::size_t index) {
  auto next = std::make_shared<HiddenSeriesSet>(hidden_ ? *hidden_ : HiddenSeriesSet{});
  if (next->count(index)) next->erase(index);
  else next->insert(index);
  hidden_ = std::move(next);
  sync();
}

void ChartSession::setHiddenSeries(HiddenSeriesSet hidden) {
  hidden_ = std::make_shared<const HiddenSeriesSet>(std::move(hidden));
  sync();
}

bool ChartSession::seriesHidden(std::size_t index) const {
  return hidden_ && hidden_->count(index) != 0;
}

void ChartSession::drawOnce() {
  if (ready()) anim_.drawOnce();
}

void ChartSession::dispose() {
  if (disposed_) return;
  disposed_ = true;
  anim_.dispose();
  zoom_.dispose();
  renderer_ = nullptr;
}

} // namespace qc
