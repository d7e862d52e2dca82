#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/index/sqlite_store.h"
#include "core/runs/recommendation_orchestrator.h"
#include "core/runs/run_store.h"
#include "core/taste/taste_store.h"
#include "Support/test_fixtures.h"

using rp::test::embedding;
using rp::test::makeItem;
using rp::test::makeWatch;

class TestRecommendationPipeline : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Happy path ──────────────────────────────────────────
    void testRunRanksUnwatchedItemsWithEvidence();
    void testStoredCandidatesIncludeRejects();
    void testNothingLeftToRecommendCompletes();

    // ── Failures recorded on the run ────────────────────────
    void testColdStartUserFails();
    void testUnknownUserFails();
    void testConcurrentRunRejected();
    void testRunActiveInAnotherOrchestratorRejected();
    void testUnreadableLibraryConfigFailsRun();
    void testCancellationBetweenSteps();
    void testLockedStaleProfileNeedsForce();
    void testProviderAuthFailure();
    void testProviderRateLimitRetried();

    // ── Regenerate and recovery ─────────────────────────────
    void testRegenerateClearAll();
    void testRegenerateKeepHistory();
    void testRecoverAbandonedRuns();

private:
    static constexpr double kNow = 1700000000.0;
    static constexpr double kDay = 86400.0;

    std::unique_ptr<rp::RecommendationOrchestrator> makeOrchestrator();
    std::optional<rp::SQLiteStore> openStore() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    rp::RecommendationSettings m_settings;
    std::unique_ptr<rp::test::FakeItemIndex> m_index;
    std::shared_ptr<rp::test::FakeEmbeddingProvider> m_provider;
};

void TestRecommendationPipeline::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    m_settings = rp::RecommendationSettings();
    m_settings.dbPath = m_dir->filePath(QStringLiteral("reelpick.db"));
    m_settings.embeddingModelId = QString::fromLatin1(rp::test::kModel);
    m_settings.embeddingDimensions = rp::test::kDims;
    m_settings.movies.selectedCount = 3;
    m_settings.movies.diversityLambda = 0.0;
    m_settings.providerBackoffBaseMs = 1;
    m_settings.providerBackoffMaxMs = 4;

    m_index = std::make_unique<rp::test::FakeItemIndex>();
    m_provider = std::make_shared<rp::test::FakeEmbeddingProvider>();

    // Item 1 is the watched favorite; 2..6 drift away from it.
    std::optional<rp::SQLiteStore> store = openStore();
    QVERIFY(store.has_value());
    const std::vector<std::vector<float>> vectors = {
        {1, 0, 0, 0}, {1, 0.2F, 0, 0}, {1, 0.5F, 0, 0},
        {1, 1, 0, 0}, {0, 1, 0, 0},    {0, 0, 1, 0},
    };
    for (size_t i = 0; i < vectors.size(); ++i) {
        const int64_t id = static_cast<int64_t>(i) + 1;
        const auto& v = vectors[i];
        QVERIFY(rp::test::seedItem(*store,
                                   makeItem(id, QStringLiteral("Movie %1").arg(id),
                                            {QStringLiteral("Drama")}),
                                   embedding({v[0], v[1], v[2], v[3]}), m_index.get()));
    }
    QVERIFY(rp::test::seedUser(*store, QStringLiteral("u1")));
    QVERIFY(rp::test::seedUser(*store, QStringLiteral("u2")));
    QVERIFY(store->upsertWatch(makeWatch(QStringLiteral("u1"), 1, kNow - kDay, 9.0, true)));
}

void TestRecommendationPipeline::cleanup()
{
    m_provider.reset();
    m_index.reset();
    m_dir.reset();
}

std::optional<rp::SQLiteStore> TestRecommendationPipeline::openStore() const
{
    return rp::SQLiteStore::open(m_settings.dbPath);
}

std::unique_ptr<rp::RecommendationOrchestrator> TestRecommendationPipeline::makeOrchestrator()
{
    auto orchestrator = std::make_unique<rp::RecommendationOrchestrator>(
        m_settings, m_index.get(), m_provider);
    orchestrator->setClock([] { return kNow; });
    return orchestrator;
}

void TestRecommendationPipeline::testRunRanksUnwatchedItemsWithEvidence()
{
    auto orchestrator = makeOrchestrator();
    QSignalSpy finished(orchestrator.get(), &rp::RecommendationOrchestrator::runFinished);

    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Completed);
    QVERIFY(run.succeeded());
    QVERIFY(run.id > 0);
    QCOMPARE(run.selectedCount, 3);
    QCOMPARE(run.errorCode, rp::RecErrorCode::None);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.at(0).at(1).toString(), QStringLiteral("completed"));

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    const auto stored = runs.getRun(run.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->status, rp::RunStatus::Completed);
    QCOMPARE(stored->selectedCount, 3);

    const std::vector<rp::StoredCandidate> selected = runs.candidatesForRun(run.id, true);
    QCOMPARE(selected.size(), 3UL);
    QCOMPARE(selected[0].itemId, int64_t(2));
    QCOMPARE(selected[1].itemId, int64_t(3));
    QCOMPARE(selected[2].itemId, int64_t(4));
    for (size_t i = 0; i < selected.size(); ++i) {
        QCOMPARE(selected[i].rank, static_cast<int>(i) + 1);
        QVERIFY(selected[i].itemId != 1);

        const std::vector<rp::Evidence> evidence = runs.evidenceForCandidate(selected[i].id);
        QCOMPARE(evidence.size(), 1UL);
        QCOMPARE(evidence[0].similarItemId, int64_t(1));
        QCOMPARE(evidence[0].type, rp::EvidenceType::Favorite);
    }
}

void TestRecommendationPipeline::testStoredCandidatesIncludeRejects()
{
    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Completed);
    QCOMPARE(run.candidateCount, 5);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    const std::vector<rp::StoredCandidate> all = runs.candidatesForRun(run.id);
    QCOMPARE(all.size(), 5UL);
    QVERIFY(all[2].isSelected);
    QVERIFY(!all[3].isSelected);
    QVERIFY(all[3].score.base >= all[4].score.base);
}

void TestRecommendationPipeline::testNothingLeftToRecommendCompletes()
{
    {
        auto store = openStore();
        for (int64_t id = 2; id <= 6; ++id) {
            QVERIFY(store->upsertWatch(makeWatch(QStringLiteral("u1"), id, kNow - 2 * kDay)));
        }
    }

    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Completed);
    QCOMPARE(run.candidateCount, 0);
    QCOMPARE(run.selectedCount, 0);
}

void TestRecommendationPipeline::testColdStartUserFails()
{
    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u2"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Failed);
    QCOMPARE(run.errorCode, rp::RecErrorCode::InsufficientData);
    QVERIFY(run.id > 0);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    const auto stored = runs.getRun(run.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->status, rp::RunStatus::Failed);
    QCOMPARE(stored->errorCode, rp::RecErrorCode::InsufficientData);
    QVERIFY(runs.candidatesForRun(run.id).empty());
}

void TestRecommendationPipeline::testUnknownUserFails()
{
    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("ghost"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Failed);
    QCOMPARE(run.errorCode, rp::RecErrorCode::InsufficientData);
}

void TestRecommendationPipeline::testConcurrentRunRejected()
{
    auto orchestrator = makeOrchestrator();
    auto held = orchestrator->registry().tryAcquire(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(held.has_value());

    const rp::RecommendationRun rejected =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(rejected.status, rp::RunStatus::Failed);
    QCOMPARE(rejected.errorCode, rp::RecErrorCode::RunInProgress);
    QCOMPARE(rejected.id, int64_t(0));

    // Nothing was recorded for the rejected request
    {
        auto store = openStore();
        rp::RunStore runs(store->rawDb());
        QVERIFY(runs.listRuns(QStringLiteral("u1"), rp::MediaType::Movie).empty());
    }

    held.reset();
    QCOMPARE(orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie).status,
             rp::RunStatus::Completed);
}

void TestRecommendationPipeline::testRunActiveInAnotherOrchestratorRejected()
{
    // Two orchestrators on one database file stand in for two processes:
    // their in-memory registries know nothing of each other.
    auto first = makeOrchestrator();
    auto second = makeOrchestrator();

    rp::RecommendationRun competing;
    int recovered = -1;
    rp::RecommendationOrchestrator* other = second.get();
    connect(first.get(), &rp::RecommendationOrchestrator::stepChanged, first.get(),
            [&competing, &recovered, other](const QString& userId, const QString& step) {
                if (step == QLatin1String("retrieving")) {
                    recovered = other->recoverAbandonedRuns();
                    competing = other->runForUser(userId, rp::MediaType::Movie);
                }
            },
            Qt::DirectConnection);

    const rp::RecommendationRun run =
        first->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Completed);

    // The live run was neither failed by recovery nor duplicated
    QCOMPARE(recovered, 0);
    QCOMPARE(competing.status, rp::RunStatus::Failed);
    QCOMPARE(competing.errorCode, rp::RecErrorCode::RunInProgress);
    QCOMPARE(competing.id, int64_t(0));
    {
        auto store = openStore();
        rp::RunStore runs(store->rawDb());
        const auto stored = runs.listRuns(QStringLiteral("u1"), rp::MediaType::Movie);
        QCOMPARE(stored.size(), 1UL);
        QCOMPARE(stored[0].id, run.id);
        QCOMPARE(stored[0].status, rp::RunStatus::Completed);
    }

    // Once the first run is done the other orchestrator may run
    QCOMPARE(second->runForUser(QStringLiteral("u1"), rp::MediaType::Movie).status,
             rp::RunStatus::Completed);
}

void TestRecommendationPipeline::testUnreadableLibraryConfigFailsRun()
{
    {
        auto store = openStore();
        QCOMPARE(sqlite3_exec(store->rawDb(), "DROP TABLE library_config", nullptr, nullptr,
                              nullptr),
                 SQLITE_OK);
    }

    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Failed);
    QCOMPARE(run.errorCode, rp::RecErrorCode::StorageFailure);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    QCOMPARE(runs.getRun(run.id)->status, rp::RunStatus::Failed);
    QVERIFY(runs.candidatesForRun(run.id).empty());
}

void TestRecommendationPipeline::testCancellationBetweenSteps()
{
    auto orchestrator = makeOrchestrator();
    QVERIFY(!orchestrator->cancel(QStringLiteral("u1"), rp::MediaType::Movie));

    rp::RecommendationOrchestrator* raw = orchestrator.get();
    connect(raw, &rp::RecommendationOrchestrator::stepChanged, raw,
            [raw](const QString& userId, const QString& step) {
                if (step == QLatin1String("profile")) {
                    raw->cancel(userId, rp::MediaType::Movie);
                }
            },
            Qt::DirectConnection);

    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Cancelled);
    QCOMPARE(run.errorCode, rp::RecErrorCode::Cancelled);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    QCOMPARE(runs.getRun(run.id)->status, rp::RunStatus::Cancelled);
    QVERIFY(runs.candidatesForRun(run.id).empty());
    QVERIFY(!orchestrator->registry().isActive(QStringLiteral("u1"), rp::MediaType::Movie));
}

void TestRecommendationPipeline::testLockedStaleProfileNeedsForce()
{
    {
        auto store = openStore();
        rp::TasteStore taste(store->rawDb());
        rp::TasteProfile profile;
        profile.userId = QStringLiteral("u1");
        profile.mediaType = rp::MediaType::Movie;
        profile.embedding = embedding({0, 0, 0, 1}, "legacy-model");
        QVERIFY(taste.saveAutoProfile(profile, kNow - kDay));
        QVERIFY(taste.setLocked(QStringLiteral("u1"), rp::MediaType::Movie, true, kNow - kDay));
    }

    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun stale =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(stale.status, rp::RunStatus::Failed);
    QCOMPARE(stale.errorCode, rp::RecErrorCode::ProfileStale);

    const rp::RecommendationRun forced = orchestrator->runForUser(
        QStringLiteral("u1"), rp::MediaType::Movie, rp::RunType::Manual, QString(), true);
    QCOMPARE(forced.status, rp::RunStatus::Completed);

    auto store = openStore();
    rp::TasteStore taste(store->rawDb());
    const auto rebuilt = taste.getProfile(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(rebuilt.has_value());
    QVERIFY(rebuilt->isLocked);
    QCOMPARE(rebuilt->embeddingModel(), std::string(rp::test::kModel));
}

void TestRecommendationPipeline::testProviderAuthFailure()
{
    {
        auto store = openStore();
        rp::TasteStore taste(store->rawDb());
        rp::CustomInterest interest;
        interest.userId = QStringLiteral("u1");
        interest.text = QStringLiteral("slow burning space horror");
        QVERIFY(taste.addCustomInterest(interest, kNow).has_value());
    }
    m_provider->failNext(rp::ProviderErrorKind::Auth);

    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Failed);
    QCOMPARE(run.errorCode, rp::RecErrorCode::ProviderAuth);
    QCOMPARE(m_provider->calls(), 1);
}

void TestRecommendationPipeline::testProviderRateLimitRetried()
{
    {
        auto store = openStore();
        rp::TasteStore taste(store->rawDb());
        rp::CustomInterest interest;
        interest.userId = QStringLiteral("u1");
        interest.text = QStringLiteral("heist thrillers");
        QVERIFY(taste.addCustomInterest(interest, kNow).has_value());
    }
    m_provider->setVector(QStringLiteral("heist thrillers"), rp::test::unit({1, 0, 0, 0}));
    m_provider->failNext(rp::ProviderErrorKind::RateLimit, 2);

    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun run =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(run.status, rp::RunStatus::Completed);
    QCOMPARE(m_provider->calls(), 3);

    auto store = openStore();
    rp::TasteStore taste(store->rawDb());
    const auto interests = taste.customInterests(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(interests.size(), 1UL);
    QVERIFY(interests[0].embedding.has_value());
}

void TestRecommendationPipeline::testRegenerateClearAll()
{
    auto orchestrator = makeOrchestrator();
    QVERIFY(orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie).succeeded());
    QVERIFY(orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie).succeeded());
    QVERIFY(orchestrator->runForUser(QStringLiteral("u2"), rp::MediaType::Movie).id > 0);

    const rp::RecommendationRun regenerated =
        orchestrator->regenerate(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(regenerated.status, rp::RunStatus::Completed);
    QCOMPARE(regenerated.runType, rp::RunType::Regenerate);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    const auto remaining = runs.listRuns(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(remaining.size(), 1UL);
    QCOMPARE(remaining[0].id, regenerated.id);
    QCOMPARE(runs.listRuns(QStringLiteral("u2"), rp::MediaType::Movie).size(), 1UL);
}

void TestRecommendationPipeline::testRegenerateKeepHistory()
{
    m_settings.regeneratePolicy = rp::RegeneratePolicy::KeepHistory;
    auto orchestrator = makeOrchestrator();
    const rp::RecommendationRun first =
        orchestrator->runForUser(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(first.succeeded());

    const rp::RecommendationRun regenerated =
        orchestrator->regenerate(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(regenerated.succeeded());

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    QCOMPARE(runs.listRuns(QStringLiteral("u1"), rp::MediaType::Movie).size(), 2UL);

    // The old run keeps only its selected rows
    const auto kept = runs.candidatesForRun(first.id);
    QCOMPARE(kept.size(), 3UL);
    for (const rp::StoredCandidate& row : kept) {
        QVERIFY(row.isSelected);
    }
    QCOMPARE(runs.getRun(first.id)->candidateCount, 3);
    QCOMPARE(runs.candidatesForRun(regenerated.id).size(), 5UL);
    QCOMPARE(runs.latestCompletedRun(QStringLiteral("u1"), rp::MediaType::Movie)->id,
             regenerated.id);
}

void TestRecommendationPipeline::testRecoverAbandonedRuns()
{
    int64_t abandonedId = 0;
    {
        auto store = openStore();
        rp::RunStore runs(store->rawDb());
        const auto run = runs.createRun(QStringLiteral("u1"), rp::MediaType::Movie,
                                        rp::RunType::Scheduled, QString(), kNow - kDay);
        QVERIFY(run.has_value());
        QVERIFY(runs.markRunning(run->id));
        abandonedId = run->id;
    }

    auto orchestrator = makeOrchestrator();
    QCOMPARE(orchestrator->recoverAbandonedRuns(), 1);
    QCOMPARE(orchestrator->recoverAbandonedRuns(), 0);

    auto store = openStore();
    rp::RunStore runs(store->rawDb());
    const auto recovered = runs.getRun(abandonedId);
    QCOMPARE(recovered->status, rp::RunStatus::Failed);
    QCOMPARE(recovered->errorCode, rp::RecErrorCode::StorageFailure);
    QVERIFY(!runs.hasActiveRun(QStringLiteral("u1"), rp::MediaType::Movie));
}

QTEST_MAIN(TestRecommendationPipeline)
#include "test_recommendation_pipeline.moc"
