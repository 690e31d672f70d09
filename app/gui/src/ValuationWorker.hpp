#pragma once
#include <QObject>
#include <QMetaType>
#include <QString>
#include <memory>
#include <optional>

// VW types (on passe par valeur ⇒ on inclut ici)
#include <vw/model/assumptions.hpp>
#include <vw/config/sensitivity_config.hpp>
#include <vw/valuation/valuation.hpp>
#include <vw/valuation/insights.hpp>
#include <vw/sensitivity/sensitivity_grid.hpp>
#include <vw/sensitivity/wacc_sensitivity.hpp>

namespace gui {

// Tout ce qu’un run produit, figé pour l’affichage.
struct ValuationSnapshot {
  vw::model::Assumptions              assumptions;
  vw::valuation::ValuationResult      result;
  vw::valuation::ValuationInsights    insights;
  vw::sensitivity::SensitivityGrid    grid;
  std::optional<vw::sensitivity::WaccSensitivity> waccSensitivity; // vide si bump dégénéré
  QString                             waccSensitivityNote;
  long long                           elapsed_ms;
};

using SnapshotPtr = std::shared_ptr<const ValuationSnapshot>;

class ValuationWorker : public QObject {
  Q_OBJECT
public:
  explicit ValuationWorker(QObject* parent = nullptr);
  ~ValuationWorker() override = default;

public slots:
  // Valorisation de base + grille + sensibilité ±WACC. Aucun état conservé entre deux runs.
  void runValuation(vw::model::Assumptions a, vw::config::SensitivityConfig cfg);

signals:
  void finished(gui::SnapshotPtr snapshot);
  void failed(QString why);
};

} // namespace gui

Q_DECLARE_METATYPE(gui::SnapshotPtr)
