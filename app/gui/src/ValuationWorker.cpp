#include "ValuationWorker.hpp"

#include <chrono>
#include <memory>
#include <utility>

#include <QDebug>

namespace gui {

ValuationWorker::ValuationWorker(QObject* parent) : QObject(parent) {}

void ValuationWorker::runValuation(vw::model::Assumptions a, vw::config::SensitivityConfig cfg)
{
  try {
    qDebug() << "[ValuationWorker] run"
             << "revenue=" << a.current_revenue
             << "margin=" << a.ebit_margin << "tax=" << a.tax_rate
             << "wacc=" << a.wacc << "tg=" << a.terminal_growth
             << "fcfConv=" << a.fcf_conversion
             << "grid=" << cfg.n_wacc << "x" << cfg.n_tg << "threads=" << cfg.n_threads;

    const auto t0 = std::chrono::steady_clock::now();

    auto result   = vw::valuation::run_valuation(a);   // ValuationError si wacc <= g
    auto insights = vw::valuation::compute_insights(a, result);
    auto grid     = vw::sensitivity::sensitivity_grid(a, cfg);

    std::optional<vw::sensitivity::WaccSensitivity> ws;
    QString note;
    try {
      ws = vw::sensitivity::wacc_sensitivity(a, cfg.wacc_bump);
    } catch (const vw::valuation::ValuationError& e) {
      note = QString::fromUtf8(e.what());
      qWarning() << "[ValuationWorker] WACC sensitivity unavailable:" << note;
    }

    const auto t1 = std::chrono::steady_clock::now();
    const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    qDebug() << "[ValuationWorker] EV=" << result.enterprise_value
             << "infeasibleCells=" << grid.infeasible_count()
             << "ms=" << ms;

    SnapshotPtr snap = std::make_shared<const ValuationSnapshot>(ValuationSnapshot{
      std::move(a), std::move(result), insights, std::move(grid), ws, note, ms});
    emit finished(std::move(snap));
  } catch (const vw::valuation::ValuationError& e) {
    qWarning() << "[ValuationWorker] valuation failed:" << e.what();
    emit failed(QString::fromUtf8(e.what()));
  } catch (const std::exception& e) {
    qWarning() << "[ValuationWorker] error:" << e.what();
    emit failed(QString::fromUtf8(e.what()));
  }
}

} // namespace gui
