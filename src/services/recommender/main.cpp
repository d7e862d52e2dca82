#include "recommender_service.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("reelpick-recommend"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    rp::RecommenderService service;
    return service.run(app.arguments());
}
