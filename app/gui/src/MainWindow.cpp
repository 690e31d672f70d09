#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QMessageBox>
#include <QTableWidgetItem>
#include <QMetaObject>
#include <QMetaType>
#include <QStatusBar>
#include <QDebug>

#include <QHeaderView>
#include <QTableWidget>
#include <QLabel>
#include <QPushButton>
#include <QDoubleSpinBox>
#include <QPlainTextEdit>
#include <QTabWidget>
#include <QImage>
#include <QPixmap>
#include <QPainter>
#include <QVBoxLayout>
#include <QResizeEvent>
#include <QSignalBlocker>

#include <QtCharts/QLegend>
#include <QtCharts/QLegendMarker>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

using vw::config::from_percent;
using vw::config::to_percent;

namespace {
const QColor C_REVENUE (33,150,243);   // barres CA (bleu)
const QColor C_EBIT    (255,193,7);    // ligne EBIT (ambre)
const QColor C_PV_FCF  (66,165,245);
const QColor C_PV_TV   (171,71,188);
const QColor C_EV      (69,90,100);
const QColor C_NA      (200,200,200);  // cellule infaisable

// rouge (bas) → jaune → vert (haut), t dans [0,1]
QColor rdYlGn(double t) {
  t = std::clamp(t, 0.0, 1.0);
  if (t < 0.5) {
    const double u = t / 0.5;
    return QColor(215, int(std::lround(48 + u * (217 - 48))), 39);
  }
  const double u = (t - 0.5) / 0.5;
  return QColor(int(std::lround(215 - u * (215 - 26))), int(std::lround(217 - u * (217 - 150))), int(std::lround(39 + u * (65 - 39))));
}

QString money(double v) { return QString("$%1M").arg(v, 0, 'f', 1); }
QString pct(double x, int prec = 1) { return QString("%1%").arg(to_percent(x), 0, 'f', prec); }
} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  // Enregistrement pour les queued connections
  qRegisterMetaType<gui::SnapshotPtr>("gui::SnapshotPtr");

  connect(ui->btnRun,          &QPushButton::clicked, this, &MainWindow::onRun);
  connect(ui->btnLoadDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  connect(ui->tabs, &QTabWidget::currentChanged, this, [this](int){ repaintHeatmap_(); });

  // Debounce timer
  debounce_ = new QTimer(this);
  debounce_->setSingleShot(true);
  debounce_->setInterval(300);
  connect(debounce_, &QTimer::timeout, this, [this]{
    if (busy_) { pending_ = true; return; }
    qDebug() << "[UI] debounce fired → onRun()";
    onRun();
  });

  setupProjectionChart();
  setupWaterfallChart();
  initInputs();
  startWorker();

  onRun(); // premier affichage avec les défauts
}

MainWindow::~MainWindow() {
  if (worker_) QObject::disconnect(worker_, nullptr, this, nullptr);
  stopWorker();

  // Les vues possèdent leurs QChart
  delete projChartView_; projChartView_ = nullptr;
  delete wfChartView_;   wfChartView_   = nullptr;

  delete ui;
}

// ========================= Worker =========================
void MainWindow::startWorker() {
  if (workerThread_ && worker_) return;

  workerThread_ = new QThread(this);
  worker_       = new gui::ValuationWorker();   // PAS de parent → il vit dans workerThread_
  worker_->moveToThread(workerThread_);

  connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);
  connect(worker_, &gui::ValuationWorker::finished, this, &MainWindow::onValuationFinished, Qt::QueuedConnection);
  connect(worker_, &gui::ValuationWorker::failed,   this, &MainWindow::onValuationFailed,   Qt::QueuedConnection);

  workerThread_->start();
}

void MainWindow::stopWorker() {
  if (!workerThread_) return;
  workerThread_->quit();
  workerThread_->wait();
  workerThread_ = nullptr;
  worker_ = nullptr; // deleteLater() via finished
}

// ========================= Entrées =========================
void MainWindow::applyBound(QDoubleSpinBox* sb, const vw::config::InputBound& b, bool percent) {
  sb->setRange(b.min, b.max);
  sb->setSingleStep(b.step);
  sb->setDecimals(b.step < 0.5 ? 2 : (b.step < 1.0 ? 1 : (percent ? 0 : 1)));
  sb->setSuffix(percent ? " %" : "");
  sb->setToolTip(QString::fromUtf8(b.label));
  sb->setValue(b.default_value);
}

void MainWindow::initInputs() {
  const auto& B = vw::config::default_bounds();
  applyBound(ui->sbRevenue, B.current_revenue, /*percent=*/false);
  ui->sbRevenue->setPrefix("$");
  ui->sbRevenue->setSuffix(" M");
  QDoubleSpinBox* growth[] = {ui->sbGrowth1, ui->sbGrowth2, ui->sbGrowth3, ui->sbGrowth4, ui->sbGrowth5};
  for (std::size_t i = 0; i < B.growth.size(); ++i) applyBound(growth[i], B.growth[i], true);
  applyBound(ui->sbMargin,  B.ebit_margin,     true);
  applyBound(ui->sbTax,     B.tax_rate,        true);
  applyBound(ui->sbWacc,    B.wacc,            true);
  applyBound(ui->sbTg,      B.terminal_growth, true);
  applyBound(ui->sbFcfConv, B.fcf_conversion,  true);

  for (auto* sb : {ui->sbRevenue, ui->sbGrowth1, ui->sbGrowth2, ui->sbGrowth3, ui->sbGrowth4,
                   ui->sbGrowth5, ui->sbMargin, ui->sbTax, ui->sbWacc, ui->sbTg, ui->sbFcfConv}) {
    connect(sb, qOverload<double>(&QDoubleSpinBox::valueChanged), this, [this](double){ armDebounce_(); });
  }
}

void MainWindow::armDebounce_() {
  if (busy_) { pending_ = true; return; }
  debounce_->start();
}

vw::model::Assumptions MainWindow::readAssumptions() const {
  return vw::model::Assumptions(
    ui->sbRevenue->value(),
    { from_percent(ui->sbGrowth1->value()), from_percent(ui->sbGrowth2->value()),
      from_percent(ui->sbGrowth3->value()), from_percent(ui->sbGrowth4->value()),
      from_percent(ui->sbGrowth5->value()) },
    from_percent(ui->sbMargin->value()),
    from_percent(ui->sbTax->value()),
    from_percent(ui->sbWacc->value()),
    from_percent(ui->sbTg->value()),
    from_percent(ui->sbFcfConv->value()));
}

void MainWindow::onLoadDefaults() {
  const auto& B = vw::config::default_bounds();
  const std::pair<QDoubleSpinBox*, const vw::config::InputBound*> all[] = {
    {ui->sbRevenue, &B.current_revenue},
    {ui->sbGrowth1, &B.growth[0]}, {ui->sbGrowth2, &B.growth[1]}, {ui->sbGrowth3, &B.growth[2]},
    {ui->sbGrowth4, &B.growth[3]}, {ui->sbGrowth5, &B.growth[4]},
    {ui->sbMargin, &B.ebit_margin}, {ui->sbTax, &B.tax_rate}, {ui->sbWacc, &B.wacc},
    {ui->sbTg, &B.terminal_growth}, {ui->sbFcfConv, &B.fcf_conversion},
  };
  for (const auto& [sb, b] : all) {
    QSignalBlocker block(sb);
    sb->setValue(b->default_value);
  }
  qDebug() << "[UI] defaults restored";
  onRun();
}

void MainWindow::onRun() {
  debounce_->stop();
  const vw::model::Assumptions a = readAssumptions();

  // Contrôle d’entrée : un message bloquant empêche le run
  const auto issues = vw::config::check_assumptions(a);
  QStringList lines;
  for (const auto& is : issues) lines << (is.blocking ? "⛔ " : "⚠ ") + QString::fromStdString(is.message);
  ui->lblInputIssues->setText(lines.join("\n"));
  if (vw::config::has_blocking_issue(issues)) {
    qWarning() << "[UI] blocking input issue:" << lines.join(" | ");
    clearResults("Invalid inputs: " + lines.join(" | "));
    return;
  }

  if (busy_) { pending_ = true; return; }
  busy_ = true;
  pending_ = false;
  statusBar()->showMessage("Computing…");

  vw::config::SensitivityConfig cfg;
  cfg.n_threads = static_cast<std::size_t>(std::max(1, QThread::idealThreadCount()));

  QMetaObject::invokeMethod(
      worker_,
      [w=worker_, a, cfg]{ w->runValuation(a, cfg); },
      Qt::QueuedConnection);
}

void MainWindow::onValuationFinished(gui::SnapshotPtr snap) {
  busy_ = false;
  if (!snap) return;
  last_ = snap;

  updateSummary(*snap);
  updateProjectionChart(snap->assumptions, snap->result);
  updateProjectionTable(snap->assumptions, snap->result);
  updateWaterfallChart(snap->result);
  updateInsights(*snap);
  repaintHeatmap_();

  statusBar()->showMessage(QString("EV %1, computed in %2 ms")
                             .arg(money(snap->result.enterprise_value))
                             .arg(snap->elapsed_ms), 5000);

  if (pending_) { pending_ = false; debounce_->start(); }
}

void MainWindow::onValuationFailed(const QString& why) {
  busy_ = false;
  qWarning() << "[UI] valuation failed:" << why;
  clearResults(why);
  QMessageBox::warning(this, "Valuation", why);
  if (pending_) { pending_ = false; debounce_->start(); }
}

void MainWindow::clearResults(const QString& why) {
  last_.reset();
  ui->lblEv->setText("-");
  ui->lblPvForecast->setText("-");
  ui->lblPvTerminal->setText("-");
  ui->lblWaccSens->setText("-");
  ui->txtInsights->setPlainText(why);
  ui->lblHeatmap->clear();
  ui->lblGridInfo->clear();
  statusBar()->showMessage(why);
}

// ========================= Résumé / Insights =========================
void MainWindow::updateSummary(const gui::ValuationSnapshot& s) {
  const auto& r = s.result;
  const auto& in = s.insights;
  ui->lblEv->setText(QString("%1  (%2x revenue)").arg(money(r.enterprise_value))
                                                  .arg(in.revenue_multiple, 0, 'f', 1));
  ui->lblPvForecast->setText(QString("%1  (%2 of EV)").arg(money(r.pv_forecast_period))
                                                       .arg(pct(in.forecast_share)));
  ui->lblPvTerminal->setText(QString("%1  (%2 of EV)").arg(money(r.pv_terminal_value))
                                                       .arg(pct(in.terminal_share)));
  if (s.waccSensitivity) {
    ui->lblWaccSens->setText(QString("%1% EV per 1 pt WACC")
                               .arg(100.0 * s.waccSensitivity->sensitivity, 0, 'f', 1));
  } else {
    ui->lblWaccSens->setText("n/a");
    ui->lblWaccSens->setToolTip(s.waccSensitivityNote);
  }
}

void MainWindow::updateInsights(const gui::ValuationSnapshot& s) {
  const auto& a  = s.assumptions;
  const auto& r  = s.result;
  const auto& in = s.insights;

  QStringList t;
  t << "Valuation metrics";
  t << QString("  EV / current revenue : %1x").arg(in.revenue_multiple, 0, 'f', 2);
  t << QString("  EV / year-5 revenue  : %1x").arg(in.ev_to_final_revenue, 0, 'f', 2);
  t << QString("  EV / EBITDA (est.)   : %1x").arg(in.ebitda_multiple_est, 0, 'f', 2);
  t << "";
  t << "Value composition";
  t << QString("  Terminal value : %1 of EV").arg(pct(in.terminal_share));
  t << QString("  Forecast FCF   : %1 of EV").arg(pct(in.forecast_share));
  t << "";
  t << "Growth";
  t << QString("  Revenue CAGR (5y) : %1").arg(pct(in.revenue_cagr));
  t << QString("  Year-5 revenue    : %1").arg(money(r.revenues.back()));
  t << QString("  Year-5 FCF        : %1").arg(money(r.fcfs.back()));
  t << "";
  t << "Assumption checks";
  t << QString("  WACC - terminal growth spread : %1 pts").arg(to_percent(in.wacc_tg_spread), 0, 'f', 2);
  if (in.high_terminal_dependency)
    t << "  ⚠ Terminal value exceeds 75% of EV: the valuation rests on long-term assumptions.";
  if (in.narrow_spread)
    t << "  ⚠ WACC is within 3 pts of terminal growth: results are highly sensitive.";
  if (!in.high_terminal_dependency && !in.narrow_spread)
    t << "  ✓ No warning.";
  t << "";
  if (s.waccSensitivity) {
    const auto& w = *s.waccSensitivity;
    t << QString("WACC ±%1 pt : EV %2 → %3 (sensitivity %4)")
           .arg(to_percent(w.bump), 0, 'f', 1)
           .arg(money(w.ev_minus)).arg(money(w.ev_plus))
           .arg(w.sensitivity, 0, 'f', 4);
  } else {
    t << "WACC sensitivity unavailable: " + s.waccSensitivityNote;
  }
  t << QString("Inputs: WACC %1, terminal growth %2, FCF conversion %3")
         .arg(pct(a.wacc)).arg(pct(a.terminal_growth, 2)).arg(pct(a.fcf_conversion, 0));

  ui->txtInsights->setPlainText(t.join("\n"));
}

// ========================= Projection =========================
void MainWindow::setupProjectionChart() {
  if (projChartView_) return;
  if (!ui->projectionChartContainer) return;

  using namespace QtCharts;

  projChart_ = new QChart();
  projChart_->setTitle("Revenue & EBIT projection ($M)");
  projChart_->legend()->setVisible(true);
  projChart_->legend()->setAlignment(Qt::AlignBottom);

  auto* bars = new QBarSeries(projChart_);
  revenueSet_ = new QBarSet("Revenue", bars);
  revenueSet_->setColor(C_REVENUE);
  revenueSet_->setBorderColor(Qt::transparent);
  bars->append(revenueSet_);
  bars->setBarWidth(0.6);

  ebitLine_ = new QLineSeries(projChart_);
  ebitLine_->setName("EBIT");
  ebitLine_->setPen(QPen(C_EBIT, 2.5));
  ebitLine_->setPointsVisible(true);

  projChart_->addSeries(bars);
  projChart_->addSeries(ebitLine_);

  auto* axX = new QBarCategoryAxis(projChart_);
  axX->append(QStringList() << "Y0" << "Y1" << "Y2" << "Y3" << "Y4" << "Y5");
  projAxisY_ = new QValueAxis(projChart_);
  projAxisY_->setTitleText("$M");
  projAxisY_->setLabelFormat("%.0f");

  projChart_->addAxis(axX, Qt::AlignBottom);
  projChart_->addAxis(projAxisY_, Qt::AlignLeft);
  bars->attachAxis(axX);
  bars->attachAxis(projAxisY_);
  ebitLine_->attachAxis(axX);
  ebitLine_->attachAxis(projAxisY_);

  projChartView_ = new QChartView(projChart_, ui->projectionChartContainer);
  projChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(ui->projectionChartContainer);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(projChartView_);
}

void MainWindow::updateProjectionChart(const vw::model::Assumptions& a,
                                       const vw::valuation::ValuationResult& r) {
  if (!revenueSet_ || !ebitLine_) return;

  const int n = revenueSet_->count();
  if (n > 0) revenueSet_->remove(0, n);
  *revenueSet_ << a.current_revenue;
  for (double v : r.revenues) *revenueSet_ << v;

  // EBIT de l’année 0 : même marge appliquée au CA courant
  ebitLine_->clear();
  ebitLine_->append(0.0, a.current_revenue * a.ebit_margin);
  for (std::size_t i = 0; i < r.ebits.size(); ++i) ebitLine_->append(double(i + 1), r.ebits[i]);

  double ymax = a.current_revenue;
  for (double v : r.revenues) ymax = std::max(ymax, v);
  double ymin = 0.0;
  for (double v : r.ebits) ymin = std::min(ymin, v);
  if (projAxisY_) { projAxisY_->setRange(ymin, 1.1 * ymax); projAxisY_->applyNiceNumbers(); }
}

void MainWindow::updateProjectionTable(const vw::model::Assumptions& a,
                                       const vw::valuation::ValuationResult& r) {
  auto* tbl = ui->tblProjection;
  if (!tbl) return;

  const QStringList rows = {"Revenue", "Growth", "EBIT", "NOPAT", "FCF", "Discount factor", "PV(FCF)"};
  const int nYears = static_cast<int>(r.revenues.size());
  tbl->clear();
  tbl->setRowCount(rows.size());
  tbl->setColumnCount(nYears + 1);
  QStringList hdr; hdr << "Y0";
  for (int y = 1; y <= nYears; ++y) hdr << QString("Y%1").arg(y);
  tbl->setHorizontalHeaderLabels(hdr);
  tbl->setVerticalHeaderLabels(rows);

  auto put = [tbl](int row, int col, const QString& s) {
    auto* it = new QTableWidgetItem(s);
    it->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
    tbl->setItem(row, col, it);
  };
  put(0, 0, QString::number(a.current_revenue, 'f', 2));
  for (int y = 0; y < nYears; ++y) {
    const auto i = static_cast<std::size_t>(y);
    put(0, y + 1, QString::number(r.revenues[i], 'f', 2));
    put(1, y + 1, pct(a.growth_rates[i]));
    put(2, y + 1, QString::number(r.ebits[i], 'f', 2));
    put(3, y + 1, QString::number(r.nopats[i], 'f', 2));
    put(4, y + 1, QString::number(r.fcfs[i], 'f', 2));
    put(5, y + 1, QString::number(r.discount_factors[i], 'f', 4));
    put(6, y + 1, QString::number(r.pv_fcfs[i], 'f', 2));
  }
  tbl->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
}

// ========================= Waterfall =========================
void MainWindow::setupWaterfallChart() {
  if (wfChartView_) return;
  if (!ui->waterfallChartContainer) return;

  using namespace QtCharts;

  wfChart_ = new QChart();
  wfChart_->setTitle("Enterprise value build-up ($M)");
  wfChart_->legend()->setVisible(true);
  wfChart_->legend()->setAlignment(Qt::AlignBottom);

  wfSeries_ = new QStackedBarSeries(wfChart_);
  wfBase_   = new QBarSet("", wfSeries_);
  wfPvFcf_  = new QBarSet("PV of FCF", wfSeries_);
  wfPvTv_   = new QBarSet("PV of terminal value", wfSeries_);
  wfEv_     = new QBarSet("Enterprise value", wfSeries_);

  wfBase_->setColor(Qt::transparent);
  wfBase_->setBorderColor(Qt::transparent);
  wfPvFcf_->setColor(C_PV_FCF);
  wfPvTv_->setColor(C_PV_TV);
  wfEv_->setColor(C_EV);

  // IMPORTANT : ajout explicite à la série
  wfSeries_->append({wfBase_, wfPvFcf_, wfPvTv_, wfEv_});
  wfSeries_->setBarWidth(0.6);

  wfChart_->addSeries(wfSeries_);
  // pas d’entrée de légende pour la base invisible
  const auto markers = wfChart_->legend()->markers(wfSeries_);
  if (!markers.isEmpty()) markers.front()->setVisible(false);

  auto* axX = new QBarCategoryAxis(wfChart_);
  axX->append(QStringList() << "Y1" << "Y2" << "Y3" << "Y4" << "Y5" << "Terminal" << "EV");
  wfAxisY_ = new QValueAxis(wfChart_);
  wfAxisY_->setTitleText("$M");
  wfAxisY_->setLabelFormat("%.0f");
  wfChart_->addAxis(axX, Qt::AlignBottom);
  wfChart_->addAxis(wfAxisY_, Qt::AlignLeft);
  wfSeries_->attachAxis(axX);
  wfSeries_->attachAxis(wfAxisY_);

  wfChartView_ = new QChartView(wfChart_, ui->waterfallChartContainer);
  wfChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(ui->waterfallChartContainer);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(wfChartView_);
}

void MainWindow::updateWaterfallChart(const vw::valuation::ValuationResult& r) {
  if (!wfSeries_) return;

  for (auto* s : {wfBase_, wfPvFcf_, wfPvTv_, wfEv_}) {
    const int n = s->count();
    if (n > 0) s->remove(0, n);
  }

  // Barres flottantes : base = cumul précédent (FCF négatifs : base abaissée)
  double cum = 0.0;
  for (double pv : r.pv_fcfs) {
    *wfBase_  << std::min(cum, cum + pv);
    *wfPvFcf_ << std::abs(pv);
    *wfPvTv_  << 0.0;
    *wfEv_    << 0.0;
    cum += pv;
  }
  *wfBase_ << cum; *wfPvFcf_ << 0.0; *wfPvTv_ << r.pv_terminal_value; *wfEv_ << 0.0;
  *wfBase_ << 0.0; *wfPvFcf_ << 0.0; *wfPvTv_ << 0.0;                 *wfEv_ << r.enterprise_value;

  if (wfAxisY_) {
    const double top = std::max(r.enterprise_value, cum + r.pv_terminal_value);
    wfAxisY_->setRange(std::min(0.0, cum), 1.1 * top);
    wfAxisY_->applyNiceNumbers();
  }
}

// ========================= Sensibilité =========================
void MainWindow::repaintHeatmap_()
{
  auto* lbl = ui->lblHeatmap;
  if (!lbl) return;

  lbl->clear();
  if (!last_) return;
  const auto& g = last_->grid;
  if (g.rows() == 0 || g.cols() == 0) return;

  double vmin = std::numeric_limits<double>::infinity();
  double vmax = -vmin;
  for (std::size_t i = 0; i < g.rows(); ++i)
    for (std::size_t j = 0; j < g.cols(); ++j)
      if (g.is_feasible(i, j)) { vmin = std::min(vmin, g.at(i, j)); vmax = std::max(vmax, g.at(i, j)); }

  // image : une cellule par point de grille + marges d’axes
  const int W = std::max(360, lbl->width());
  const int H = std::max(240, lbl->height());
  const int left = 64, top = 36;
  const double cw = double(W - left - 8) / double(g.cols());
  const double ch = double(H - top - 8) / double(g.rows());

  QImage img(W, H, QImage::Format_RGB32);
  img.fill(Qt::white);
  QPainter p(&img);
  p.setRenderHint(QPainter::Antialiasing);
  QFont f = p.font(); f.setPointSizeF(std::max(7.0, std::min(cw, ch) / 6.0)); p.setFont(f);

  p.setPen(Qt::black);
  p.drawText(QRectF(left, 0, W - left, top / 2), Qt::AlignCenter, "WACC");
  for (std::size_t j = 0; j < g.cols(); ++j)
    p.drawText(QRectF(left + j * cw, top / 2, cw, top / 2), Qt::AlignCenter, pct(g.rate_axis[j]));
  for (std::size_t i = 0; i < g.rows(); ++i)
    p.drawText(QRectF(0, top + i * ch, left - 4, ch), Qt::AlignRight | Qt::AlignVCenter,
               "g " + pct(g.growth_axis[i], 2));

  const double span = (vmax > vmin) ? (vmax - vmin) : 1.0;
  for (std::size_t i = 0; i < g.rows(); ++i) {
    for (std::size_t j = 0; j < g.cols(); ++j) {
      const QRectF cell(left + j * cw, top + i * ch, cw, ch);
      if (!g.is_feasible(i, j)) {
        p.fillRect(cell, C_NA);
        p.setPen(Qt::darkGray);
        p.drawText(cell, Qt::AlignCenter, "n/a");
        continue;
      }
      const double v = g.at(i, j);
      p.fillRect(cell, rdYlGn((v - vmin) / span));
      p.setPen(Qt::black);
      p.drawText(cell, Qt::AlignCenter, QString::number(v, 'f', 0));
    }
  }

  // cellule du cas de base (si présente sur les axes)
  const auto& a = last_->assumptions;
  for (std::size_t i = 0; i < g.rows(); ++i)
    for (std::size_t j = 0; j < g.cols(); ++j)
      if (std::abs(g.growth_axis[i] - a.terminal_growth) < 1e-9 && std::abs(g.rate_axis[j] - a.wacc) < 1e-9) {
        p.setPen(QPen(Qt::black, 2.5));
        p.drawRect(QRectF(left + j * cw, top + i * ch, cw, ch));
      }
  p.end();

  qDebug() << "[UI] heatmap" << g.rows() << "x" << g.cols()
           << "vmin=" << vmin << "vmax=" << vmax << "n/a=" << g.infeasible_count();

  lbl->setPixmap(QPixmap::fromImage(img).scaled(lbl->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
  ui->lblGridInfo->setText(QString("Enterprise value ($M). Rows: terminal growth, columns: WACC. "
                                   "Infeasible cells: %1").arg(g.infeasible_count()));
}

void MainWindow::resizeEvent(QResizeEvent* e) {
  QMainWindow::resizeEvent(e);
  if (ui->tabs->currentWidget() == ui->tabSensitivity) repaintHeatmap_();
}
