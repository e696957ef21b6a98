#pragma once
#include <QMainWindow>
#include <QThread>
#include <QJsonObject>
#include <vector>

#include <QtCharts/QChartView>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <bw/analytics/yield_sweep.hpp>
#include <bw/config/pricing_config.hpp>
#include <bw/config/sweep_config.hpp>

namespace gui { class SweepWorker; }

class QDoubleSpinBox;
class QSpinBox;
class QComboBox;
class QLabel;
class QPushButton;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRunSweep();
  void onLoadDefaults();
  void onSaveProject();
  void onLoadProject();
  void onExportChartsPng();

  // Callbacks worker
  void onSweepFinished(const std::vector<bw::analytics::SweepPoint>& points,
                       double price, double macaulay, double modified,
                       long long ms);
  void onSweepFailed(const QString& why);

private:
  // Construction de l’UI (pas de .ui : tout est fait ici)
  void buildUi();
  void wireSignals();
  void setupCharts();

  void startWorker();
  void stopWorker();

  bw::config::PricingConfig pricingConfigFromUi() const;
  bw::config::SweepConfig   sweepConfigFromUi() const;

  QJsonObject makeProjectJson() const;
  void        loadProjectJson(const QJsonObject& obj);
  QString     projectsDir() const;

  void updateCharts(const std::vector<bw::analytics::SweepPoint>& points);

  // ===== Entrées =====
  QDoubleSpinBox* sbFace_{nullptr};
  QDoubleSpinBox* sbTenor_{nullptr};
  QDoubleSpinBox* sbCoupon_{nullptr};   // en %
  QSpinBox*       sbFreq_{nullptr};
  QDoubleSpinBox* sbYield_{nullptr};    // en %
  QDoubleSpinBox* sbYMin_{nullptr};     // en %
  QDoubleSpinBox* sbYMax_{nullptr};     // en %
  QSpinBox*       sbPoints_{nullptr};
  QComboBox*      cbConvention_{nullptr};
  QComboBox*      cbCountPolicy_{nullptr};

  QPushButton* btnRun_{nullptr};
  QPushButton* btnDefaults_{nullptr};
  QPushButton* btnSave_{nullptr};
  QPushButton* btnLoad_{nullptr};
  QPushButton* btnExportPng_{nullptr};

  // ===== Résultats =====
  QLabel* lblPrice_{nullptr};
  QLabel* lblMacaulay_{nullptr};
  QLabel* lblModified_{nullptr};
  QLabel* lblElapsed_{nullptr};

  // ===== Charts =====
  QtCharts::QChartView*  priceChartView_{nullptr};
  QtCharts::QLineSeries* priceSeries_{nullptr};
  QtCharts::QValueAxis*  pxAxis_{nullptr};
  QtCharts::QValueAxis*  pyAxis_{nullptr};

  QtCharts::QChartView*  durChartView_{nullptr};
  QtCharts::QLineSeries* macSeries_{nullptr};
  QtCharts::QLineSeries* modSeries_{nullptr};
  QtCharts::QValueAxis*  dxAxis_{nullptr};
  QtCharts::QValueAxis*  dyAxis_{nullptr};

  // Worker thread
  QThread*           sweepThread_{nullptr};
  gui::SweepWorker*  sweepWorker_{nullptr};
  bool               busy_{false};
};
