#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

#include "splitapp.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("chaptersplitter");
    QCoreApplication::setApplicationVersion("1.0.0");

    QTextStream out(stdout);
    QTextStream err(stderr);
    QTextStream in(stdin);

    chapters::SplitApp splitApp(out, err, in);
    return splitApp.run(QCoreApplication::arguments());
}
