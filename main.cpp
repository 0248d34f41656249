#include "mainwindow.h"

#include <QApplication>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QApplication::setApplicationName("NanoSizer");
    QApplication::setOrganizationName("NanoSizer");

    // Формат журнала; уровни категорий задаются через QT_LOGGING_RULES
    qSetMessagePattern("%{time hh:mm:ss.zzz} %{category} %{type}: %{message}");

    MainWindow w;
    w.show();

    // Изображение из командной строки
    const QStringList args = QApplication::arguments();
    if (args.size() > 1)
        w.openImage(args.at(1));

    return a.exec();
}
