#include "SweepWorker.hpp"

#include <bw/market/bond.hpp>
#include <bw/pricing/duration.hpp>

#include <chrono>

#include <QDebug>

namespace gui {

SweepWorker::SweepWorker(QObject* parent) : QObject(parent) {}

void SweepWorker::runSweep(double face, double tenor, double coupon, int freq,
                           bw::config::SweepConfig sweep,
                           bw::config::PricingConfig cfg,
                           double yieldAt)
{
  try {
    qDebug() << "[Sweep]"
             << "face=" << face << "tenor=" << tenor << "coupon=" << coupon << "freq=" << freq
             << "ymin=" << sweep.y_min << "ymax=" << sweep.y_max << "n=" << sweep.n_points
             << "periodic=" << (cfg.duration_convention == bw::config::DurationConvention::Periodic)
             << "yieldAt=" << yieldAt;

    const auto t0 = std::chrono::steady_clock::now();

    const bw::market::Bond bond(face, tenor, coupon, freq);
    const auto pts = bw::analytics::yield_sweep(bond, sweep, cfg);
    const auto st  = bw::pricing::bond_statistics(bond, yieldAt, cfg);

    const auto t1 = std::chrono::steady_clock::now();
    const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    qDebug() << "[Sweep]" << "points=" << static_cast<qulonglong>(pts.size())
             << "price=" << st.price << "mac=" << st.macaulay << "mod=" << st.modified;

    emit finished(pts, st.price, st.macaulay, st.modified, ms);
  } catch (const std::exception& e) {
    emit failed(QString::fromUtf8(e.what()));
  }
}

} // namespace gui
