#pragma once

#include "core/runs/run_types.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QObject>
#include <QStringList>

namespace rp {

class RecommendationOrchestrator;

// Command-line front end: loads settings, opens the item index, runs the
// requested operation and prints the outcome as JSON on stdout.
class RecommenderService : public QObject {
    Q_OBJECT
public:
    explicit RecommenderService(QObject* parent = nullptr);
    ~RecommenderService() override;

    // Returns the process exit code.
    int run(const QStringList& arguments);

    static QJsonObject runToJson(const RecommendationRun& run);
    static QJsonObject summaryToJson(const BulkRunSummary& summary);

private:
    static void printJson(const QJsonObject& json);
};

} // namespace rp
