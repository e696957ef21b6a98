#include "MainWindow.hpp"
#include "SweepWorker.hpp"

#include <QComboBox>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFile>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QJsonDocument>
#include <QLabel>
#include <QMessageBox>
#include <QMetaObject>
#include <QPainter>
#include <QPen>
#include <QPixmap>
#include <QPushButton>
#include <QSpinBox>
#include <QStatusBar>
#include <QVBoxLayout>

#include <QtCharts/QChart>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace {
const QColor C_PRICE(33,150,243);   // prix (bleu)
const QColor C_MAC  (255,193,7);    // Macaulay (ambre)
const QColor C_MOD  (76,175,80);    // modifiée (vert)

QString convToString(bw::config::DurationConvention c) {
  return c == bw::config::DurationConvention::Periodic ? "periodic" : "reference";
}
QString countToString(bw::config::PeriodCountPolicy p) {
  switch (p) {
    case bw::config::PeriodCountPolicy::Truncate: return "truncate";
    case bw::config::PeriodCountPolicy::Strict:   return "strict";
    case bw::config::PeriodCountPolicy::Snap:     break;
  }
  return "snap";
}
} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  // Enregistrement pour la queued connection worker -> UI
  qRegisterMetaType<std::vector<bw::analytics::SweepPoint>>("std::vector<bw::analytics::SweepPoint>");

  buildUi();
  setupCharts();
  wireSignals();
  startWorker();
  onLoadDefaults();

  setWindowTitle("BondWorkbench");
}

MainWindow::~MainWindow() {
  if (sweepWorker_) QObject::disconnect(sweepWorker_, nullptr, this, nullptr);
  stopWorker();

  // les views possèdent leurs QChart
  delete priceChartView_; priceChartView_ = nullptr;
  delete durChartView_;   durChartView_   = nullptr;
}

void MainWindow::buildUi() {
  auto* central = new QWidget(this);
  auto* root = new QHBoxLayout(central);

  // ---- Panneau gauche : obligation / balayage / résultats ----
  auto* left = new QVBoxLayout();

  auto* gbBond = new QGroupBox(tr("Bond"), central);
  auto* fBond = new QFormLayout(gbBond);
  sbFace_   = new QDoubleSpinBox(gbBond); sbFace_->setRange(0.01, 1e9);   sbFace_->setDecimals(2);
  sbTenor_  = new QDoubleSpinBox(gbBond); sbTenor_->setRange(0.01, 100.0); sbTenor_->setDecimals(4);
  sbCoupon_ = new QDoubleSpinBox(gbBond); sbCoupon_->setRange(0.0, 100.0); sbCoupon_->setDecimals(4); sbCoupon_->setSuffix(" %");
  sbFreq_   = new QSpinBox(gbBond);       sbFreq_->setRange(1, 365);
  fBond->addRow(tr("Face"), sbFace_);
  fBond->addRow(tr("Tenor (years)"), sbTenor_);
  fBond->addRow(tr("Annual coupon"), sbCoupon_);
  fBond->addRow(tr("Payments / year"), sbFreq_);

  auto* gbConv = new QGroupBox(tr("Conventions"), central);
  auto* fConv = new QFormLayout(gbConv);
  cbConvention_ = new QComboBox(gbConv);
  cbConvention_->addItems({"reference", "periodic"});
  cbCountPolicy_ = new QComboBox(gbConv);
  cbCountPolicy_->addItems({"snap", "truncate", "strict"});
  fConv->addRow(tr("Duration weights"), cbConvention_);
  fConv->addRow(tr("Period count"), cbCountPolicy_);

  auto* gbSweep = new QGroupBox(tr("Yield"), central);
  auto* fSweep = new QFormLayout(gbSweep);
  sbYield_  = new QDoubleSpinBox(gbSweep); sbYield_->setRange(-50.0, 100.0); sbYield_->setDecimals(4); sbYield_->setSuffix(" %");
  sbYMin_   = new QDoubleSpinBox(gbSweep); sbYMin_->setRange(-50.0, 100.0);  sbYMin_->setDecimals(4);  sbYMin_->setSuffix(" %");
  sbYMax_   = new QDoubleSpinBox(gbSweep); sbYMax_->setRange(-50.0, 100.0);  sbYMax_->setDecimals(4);  sbYMax_->setSuffix(" %");
  sbPoints_ = new QSpinBox(gbSweep);       sbPoints_->setRange(1, 10000);
  fSweep->addRow(tr("Yield"), sbYield_);
  fSweep->addRow(tr("Sweep min"), sbYMin_);
  fSweep->addRow(tr("Sweep max"), sbYMax_);
  fSweep->addRow(tr("Points"), sbPoints_);

  auto* gbRes = new QGroupBox(tr("Statistics"), central);
  auto* fRes = new QFormLayout(gbRes);
  lblPrice_    = new QLabel("-", gbRes);
  lblMacaulay_ = new QLabel("-", gbRes);
  lblModified_ = new QLabel("-", gbRes);
  lblElapsed_  = new QLabel("-", gbRes);
  fRes->addRow(tr("Price"), lblPrice_);
  fRes->addRow(tr("Macaulay"), lblMacaulay_);
  fRes->addRow(tr("Modified"), lblModified_);
  fRes->addRow(tr("Elapsed (ms)"), lblElapsed_);

  btnRun_       = new QPushButton(tr("Run"), central);
  btnDefaults_  = new QPushButton(tr("Defaults"), central);
  btnSave_      = new QPushButton(tr("Save project"), central);
  btnLoad_      = new QPushButton(tr("Load project"), central);
  btnExportPng_ = new QPushButton(tr("Export PNG"), central);

  left->addWidget(gbBond);
  left->addWidget(gbConv);
  left->addWidget(gbSweep);
  left->addWidget(gbRes);
  left->addWidget(btnRun_);
  left->addWidget(btnDefaults_);
  left->addWidget(btnSave_);
  left->addWidget(btnLoad_);
  left->addWidget(btnExportPng_);
  left->addStretch();

  // ---- Panneau droit : charts ----
  auto* right = new QVBoxLayout();
  priceChartView_ = new QtCharts::QChartView(central);
  durChartView_   = new QtCharts::QChartView(central);
  priceChartView_->setRenderHint(QPainter::Antialiasing);
  durChartView_->setRenderHint(QPainter::Antialiasing);
  right->addWidget(priceChartView_, 1);
  right->addWidget(durChartView_, 1);

  root->addLayout(left, 0);
  root->addLayout(right, 1);
  setCentralWidget(central);
  resize(1100, 760);
}

void MainWindow::setupCharts() {
  using namespace QtCharts;

  // ---- Prix / rendement ----
  auto* pc = new QChart();
  pc->setTitle("Price vs yield");
  pc->legend()->setVisible(false);
  pxAxis_ = new QValueAxis(pc);
  pyAxis_ = new QValueAxis(pc);
  pxAxis_->setTitleText("Yield (%)");
  pyAxis_->setTitleText("Price");
  pxAxis_->setLabelFormat("%.2f");
  pyAxis_->setLabelFormat("%.2f");
  pc->addAxis(pxAxis_, Qt::AlignBottom);
  pc->addAxis(pyAxis_, Qt::AlignLeft);

  priceSeries_ = new QLineSeries(pc);
  priceSeries_->setName("Price");
  priceSeries_->setPen(QPen(C_PRICE, 2));
  pc->addSeries(priceSeries_);
  priceSeries_->attachAxis(pxAxis_);
  priceSeries_->attachAxis(pyAxis_);
  priceChartView_->setChart(pc);

  // ---- Durations / rendement ----
  auto* dc = new QChart();
  dc->setTitle("Duration vs yield");
  dxAxis_ = new QValueAxis(dc);
  dyAxis_ = new QValueAxis(dc);
  dxAxis_->setTitleText("Yield (%)");
  dyAxis_->setTitleText("Years");
  dxAxis_->setLabelFormat("%.2f");
  dyAxis_->setLabelFormat("%.3f");
  dc->addAxis(dxAxis_, Qt::AlignBottom);
  dc->addAxis(dyAxis_, Qt::AlignLeft);

  macSeries_ = new QLineSeries(dc); macSeries_->setName("Macaulay");
  modSeries_ = new QLineSeries(dc); modSeries_->setName("Modified");
  macSeries_->setPen(QPen(C_MAC, 2));
  modSeries_->setPen(QPen(C_MOD, 2));
  dc->addSeries(macSeries_);
  dc->addSeries(modSeries_);
  macSeries_->attachAxis(dxAxis_); macSeries_->attachAxis(dyAxis_);
  modSeries_->attachAxis(dxAxis_); modSeries_->attachAxis(dyAxis_);
  durChartView_->setChart(dc);
}

void MainWindow::wireSignals() {
  connect(btnRun_,       &QPushButton::clicked, this, &MainWindow::onRunSweep);
  connect(btnDefaults_,  &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  connect(btnSave_,      &QPushButton::clicked, this, &MainWindow::onSaveProject);
  connect(btnLoad_,      &QPushButton::clicked, this, &MainWindow::onLoadProject);
  connect(btnExportPng_, &QPushButton::clicked, this, &MainWindow::onExportChartsPng);
}

// ======================= Worker =======================
void MainWindow::startWorker() {
  if (sweepThread_) return;
  sweepThread_ = new QThread(this);
  sweepWorker_ = new gui::SweepWorker();
  sweepWorker_->moveToThread(sweepThread_);
  connect(sweepThread_, &QThread::finished, sweepWorker_, &QObject::deleteLater);
  connect(sweepWorker_, &gui::SweepWorker::finished, this, &MainWindow::onSweepFinished, Qt::QueuedConnection);
  connect(sweepWorker_, &gui::SweepWorker::failed,   this, &MainWindow::onSweepFailed,   Qt::QueuedConnection);
  sweepThread_->start();
}

void MainWindow::stopWorker() {
  if (!sweepThread_) return;
  sweepThread_->quit();
  sweepThread_->wait();
  sweepThread_ = nullptr;
  sweepWorker_ = nullptr; // deleteLater() via finished
}

bw::config::PricingConfig MainWindow::pricingConfigFromUi() const {
  bw::config::PricingConfig cfg;
  cfg.duration_convention = (cbConvention_->currentText() == "periodic")
                            ? bw::config::DurationConvention::Periodic
                            : bw::config::DurationConvention::Reference;
  const QString p = cbCountPolicy_->currentText();
  if      (p == "truncate") cfg.count_policy = bw::config::PeriodCountPolicy::Truncate;
  else if (p == "strict")   cfg.count_policy = bw::config::PeriodCountPolicy::Strict;
  else                      cfg.count_policy = bw::config::PeriodCountPolicy::Snap;
  return cfg;
}

bw::config::SweepConfig MainWindow::sweepConfigFromUi() const {
  bw::config::SweepConfig sw;
  sw.y_min    = sbYMin_->value() / 100.0;
  sw.y_max    = sbYMax_->value() / 100.0;
  sw.n_points = static_cast<std::size_t>(sbPoints_->value());
  return sw;
}

void MainWindow::onRunSweep() {
  if (busy_) { statusBar()->showMessage(tr("Sweep already running…"), 1500); return; }
  if (!sweepWorker_) startWorker();

  const double face   = sbFace_->value();
  const double tenor  = sbTenor_->value();
  const double coupon = sbCoupon_->value() / 100.0;
  const int    freq   = sbFreq_->value();
  const double y      = sbYield_->value() / 100.0;
  const auto   sweep  = sweepConfigFromUi();
  const auto   cfg    = pricingConfigFromUi();

  qDebug() << "[UI] runSweep" << "convention=" << convToString(cfg.duration_convention)
           << "count=" << countToString(cfg.count_policy);

  busy_ = true;
  btnRun_->setEnabled(false);
  QMetaObject::invokeMethod(
      sweepWorker_,
      [w=sweepWorker_, face, tenor, coupon, freq, sweep, cfg, y]{
        w->runSweep(face, tenor, coupon, freq, sweep, cfg, y);
      },
      Qt::QueuedConnection);

  statusBar()->showMessage(tr("Running sweep…"));
}

void MainWindow::onSweepFinished(const std::vector<bw::analytics::SweepPoint>& points,
                                 double price, double macaulay, double modified,
                                 long long ms) {
  busy_ = false;
  btnRun_->setEnabled(true);

  lblPrice_->setText(QString::number(price, 'f', 4));
  lblMacaulay_->setText(QString::number(macaulay, 'f', 4));
  lblModified_->setText(QString::number(modified, 'f', 4));
  lblElapsed_->setText(QString::number(ms));

  updateCharts(points);
  statusBar()->showMessage(tr("Sweep done (%1 points).").arg(points.size()), 2000);
}

void MainWindow::onSweepFailed(const QString& why) {
  busy_ = false;
  btnRun_->setEnabled(true);
  qDebug() << "[UI] sweep failed:" << why;
  QMessageBox::warning(this, tr("Sweep"), why);
  statusBar()->showMessage(tr("Sweep failed."), 2000);
}

void MainWindow::updateCharts(const std::vector<bw::analytics::SweepPoint>& points) {
  priceSeries_->clear();
  macSeries_->clear();
  modSeries_->clear();
  if (points.empty()) return;

  double pMin =  std::numeric_limits<double>::infinity(), pMax = -pMin;
  double dMin =  std::numeric_limits<double>::infinity(), dMax = -dMin;
  for (const auto& p : points) {
    const double x = 100.0 * p.yield;
    priceSeries_->append(x, p.price);
    macSeries_->append(x, p.macaulay);
    modSeries_->append(x, p.modified);
    pMin = std::min(pMin, p.price);    pMax = std::max(pMax, p.price);
    dMin = std::min(dMin, p.modified); dMax = std::max(dMax, p.macaulay);
  }

  // marge de 5 % (évite un axe dégénéré si un seul point)
  auto pad = [](double lo, double hi) {
    const double m = std::max(1e-6, 0.05 * (hi - lo));
    return std::make_pair(lo - m, hi + m);
  };
  const double x0 = 100.0 * points.front().yield;
  const double x1 = 100.0 * points.back().yield;
  const auto xr = (x1 > x0) ? std::make_pair(x0, x1) : pad(x0, x1);
  const auto pr = pad(pMin, pMax);
  const auto dr = pad(dMin, dMax);

  pxAxis_->setRange(xr.first, xr.second);
  dxAxis_->setRange(xr.first, xr.second);
  pyAxis_->setRange(pr.first, pr.second);
  dyAxis_->setRange(dr.first, dr.second);
}

void MainWindow::onLoadDefaults() {
  sbFace_->setValue(100.0);
  sbTenor_->setValue(5.0);
  sbCoupon_->setValue(5.0);
  sbFreq_->setValue(2);
  sbYield_->setValue(4.0);
  sbYMin_->setValue(0.0);
  sbYMax_->setValue(10.0);
  sbPoints_->setValue(41);
  cbConvention_->setCurrentText("reference");
  cbCountPolicy_->setCurrentText("snap");
}

// ======================= Projet JSON =======================
QJsonObject MainWindow::makeProjectJson() const {
  QJsonObject bond{
    {"face",        sbFace_->value()},
    {"tenor",       sbTenor_->value()},
    {"coupon_rate", sbCoupon_->value() / 100.0},
    {"frequency",   sbFreq_->value()}
  };
  QJsonObject sweep{
    {"yield",    sbYield_->value() / 100.0},
    {"y_min",    sbYMin_->value() / 100.0},
    {"y_max",    sbYMax_->value() / 100.0},
    {"n_points", sbPoints_->value()}
  };
  QJsonObject conventions{
    {"duration_convention", cbConvention_->currentText()},
    {"count_policy",        cbCountPolicy_->currentText()}
  };

  QJsonObject root;
  root["bond"]        = bond;
  root["sweep"]       = sweep;
  root["conventions"] = conventions;
  root["saved_at"]    = QDateTime::currentDateTime().toString(Qt::ISODate);
  return root;
}

void MainWindow::loadProjectJson(const QJsonObject& obj) {
  const QJsonObject bond  = obj.value("bond").toObject();
  const QJsonObject sweep = obj.value("sweep").toObject();
  const QJsonObject conv  = obj.value("conventions").toObject();

  // clés absentes => valeur courante conservée
  if (bond.contains("face"))        sbFace_->setValue(bond.value("face").toDouble());
  if (bond.contains("tenor"))       sbTenor_->setValue(bond.value("tenor").toDouble());
  if (bond.contains("coupon_rate")) sbCoupon_->setValue(100.0 * bond.value("coupon_rate").toDouble());
  if (bond.contains("frequency"))   sbFreq_->setValue(bond.value("frequency").toInt());

  if (sweep.contains("yield"))    sbYield_->setValue(100.0 * sweep.value("yield").toDouble());
  if (sweep.contains("y_min"))    sbYMin_->setValue(100.0 * sweep.value("y_min").toDouble());
  if (sweep.contains("y_max"))    sbYMax_->setValue(100.0 * sweep.value("y_max").toDouble());
  if (sweep.contains("n_points")) sbPoints_->setValue(sweep.value("n_points").toInt());

  if (conv.contains("duration_convention")) cbConvention_->setCurrentText(conv.value("duration_convention").toString());
  if (conv.contains("count_policy"))        cbCountPolicy_->setCurrentText(conv.value("count_policy").toString());
}

QString MainWindow::projectsDir() const {
  QDir exeDir(QCoreApplication::applicationDirPath());
  const QStringList candidates = {
    exeDir.absoluteFilePath("../data/projects"),
    exeDir.absoluteFilePath("../../data/projects"),
    QDir::current().absoluteFilePath("data/projects")
  };
  for (const QString& c : candidates) {
    if (QDir(c).exists()) return QDir::cleanPath(c);
  }
  const QString target = QDir::cleanPath(candidates.front());
  QDir().mkpath(target);
  return target;
}

void MainWindow::onSaveProject() {
  const QString suggested = projectsDir() + "/bond_" +
      QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss") + ".json";
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Save project"), suggested, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    QMessageBox::warning(this, tr("Save project"), f.errorString());
    return;
  }
  f.write(QJsonDocument(makeProjectJson()).toJson(QJsonDocument::Indented));
  f.close();
  statusBar()->showMessage(tr("Project saved to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

void MainWindow::onLoadProject() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load project"), projectsDir(), tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::ReadOnly)) {
    QMessageBox::warning(this, tr("Load project"), tr("Cannot open file for reading."));
    return;
  }
  const QJsonDocument doc = QJsonDocument::fromJson(f.readAll());
  f.close();
  if (!doc.isObject()) {
    QMessageBox::warning(this, tr("Load project"), tr("Invalid JSON file."));
    return;
  }
  loadProjectJson(doc.object());
  qDebug() << "[UI] project loaded:" << fn;
  statusBar()->showMessage(tr("Project loaded from %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

void MainWindow::onExportChartsPng() {
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export charts"), projectsDir() + "/charts.png", tr("PNG (*.png)"));
  if (fn.isEmpty()) return;

  // les deux charts empilés dans une seule image
  const QPixmap top = priceChartView_->grab();
  const QPixmap bottom = durChartView_->grab();
  QPixmap out(std::max(top.width(), bottom.width()), top.height() + bottom.height());
  out.fill(Qt::white);
  QPainter painter(&out);
  painter.drawPixmap(0, 0, top);
  painter.drawPixmap(0, top.height(), bottom);
  painter.end();

  if (!out.save(fn, "PNG")) {
    QMessageBox::warning(this, tr("Export charts"), tr("Cannot write %1").arg(fn));
    return;
  }
  statusBar()->showMessage(tr("Charts exported to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}
