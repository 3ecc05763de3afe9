/**
 * @file main.cpp
 * @brief Program entry (Windows desktop tool; the window also opens elsewhere, without SAP access).
 *
 * - Qt Widgets program
 * - Sheet mapping / run parameters / element addresses are managed by AppSettings (QSettings/ini)
 * - UI: MainWindow (pick file, choose work order, run)
 */

#include <QApplication>
#include <QCoreApplication>
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QCoreApplication::setOrganizationName("LongTextFiller");
    QCoreApplication::setApplicationName("LongTextFiller");

    MainWindow w;
    w.show();

    return app.exec();
}
