#pragma once
#include <QObject>
#include <QString>
#include <vector>

// BW types (on passe par valeur ⇒ on inclut ici)
#include <bw/analytics/yield_sweep.hpp>
#include <bw/config/pricing_config.hpp>
#include <bw/config/sweep_config.hpp>

namespace gui {

class SweepWorker : public QObject {
  Q_OBJECT
public:
  explicit SweepWorker(QObject* parent = nullptr);
  ~SweepWorker() override = default;

public slots:
  // Balayage en rendement + statistiques au rendement "yieldAt".
  void runSweep(double face, double tenor, double coupon, int freq,
                bw::config::SweepConfig sweep,
                bw::config::PricingConfig cfg,
                double yieldAt);

signals:
  void finished(const std::vector<bw::analytics::SweepPoint>& points,
                double price, double macaulay, double modified,
                long long elapsed_ms);
  void failed(QString why);
};

} // namespace gui
