#include "MainWindow.hpp"

#include <QApplication>

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QCoreApplication::setApplicationName("BondWorkbench");
  MainWindow w;
  w.show();
  return app.exec();
}
