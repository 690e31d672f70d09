#pragma once
#include <QMainWindow>
#include <QThread>
#include <QTimer>
#include <QString>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QLineSeries>
#include <QtCharts/QStackedBarSeries>
#include <QtCharts/QBarCategoryAxis>
#include <QtCharts/QValueAxis>

#include <vw/model/assumptions.hpp>
#include <vw/config/input_bounds.hpp>

#include "ValuationWorker.hpp"

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class QDoubleSpinBox;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRun();
  void onLoadDefaults();

  // Callbacks worker
  void onValuationFinished(gui::SnapshotPtr snap);
  void onValuationFailed(const QString& why);

private:
  Ui::MainWindow* ui = nullptr;

  // ===== Worker =====
  QThread*              workerThread_ = nullptr;
  gui::ValuationWorker* worker_       = nullptr;
  bool busy_    = false;   // un run en cours
  bool pending_ = false;   // une édition est arrivée pendant le run
  gui::SnapshotPtr last_;  // dernier résultat affiché

  void startWorker();
  void stopWorker();

  // ===== Entrées =====
  QTimer* debounce_ = nullptr;
  void initInputs();
  void armDebounce_();
  static void applyBound(QDoubleSpinBox* sb, const vw::config::InputBound& b, bool percent);
  vw::model::Assumptions readAssumptions() const;

  // ===== Projection =====
  QtCharts::QChart*           projChart_     = nullptr;
  QtCharts::QChartView*       projChartView_ = nullptr;
  QtCharts::QBarSet*          revenueSet_    = nullptr;
  QtCharts::QLineSeries*      ebitLine_      = nullptr;
  QtCharts::QValueAxis*       projAxisY_     = nullptr;
  void setupProjectionChart();
  void updateProjectionChart(const vw::model::Assumptions& a,
                             const vw::valuation::ValuationResult& r);
  void updateProjectionTable(const vw::model::Assumptions& a,
                             const vw::valuation::ValuationResult& r);

  // ===== Waterfall =====
  QtCharts::QChart*            wfChart_     = nullptr;
  QtCharts::QChartView*        wfChartView_ = nullptr;
  QtCharts::QStackedBarSeries* wfSeries_    = nullptr;
  QtCharts::QBarSet*           wfBase_      = nullptr; // invisible (hauteur cumulée)
  QtCharts::QBarSet*           wfPvFcf_     = nullptr;
  QtCharts::QBarSet*           wfPvTv_      = nullptr;
  QtCharts::QBarSet*           wfEv_        = nullptr;
  QtCharts::QValueAxis*        wfAxisY_     = nullptr;
  void setupWaterfallChart();
  void updateWaterfallChart(const vw::valuation::ValuationResult& r);

  // ===== Sensibilité / Insights / Résumé =====
  void repaintHeatmap_();
  void updateInsights(const gui::ValuationSnapshot& s);
  void updateSummary(const gui::ValuationSnapshot& s);
  void clearResults(const QString& why);

protected:
  void resizeEvent(QResizeEvent* e) override;
};
