#include <QtTest/QtTest>

#include "core/index/sqlite_store.h"
#include "core/taste/taste_store.h"
#include "Support/test_fixtures.h"

using rp::test::embedding;

class TestTasteStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Profiles ─────────────────────────────────────────────────
    void testMissingProfile();
    void testSaveAndLoadAutoProfile();
    void testAutoSaveKeepsLockAndThresholds();
    void testUserSettingsWithoutEmbedding();
    void testSetLocked();
    void testProfileRequiresUser();
    void testProfileState();

    // ── Preferences ──────────────────────────────────────────────
    void testAutoFranchiseUpsertSkipsUserSetRows();
    void testFranchiseRowsForBothTypes();
    void testAutoGenreUpsertSkipsUserSetRows();
    void testClearUserOverrides();

    // ── Custom interests ─────────────────────────────────────────
    void testCustomInterestLifecycle();
    void testBlankInterestRejected();

private:
    std::optional<rp::SQLiteStore> m_store;
    std::unique_ptr<rp::TasteStore> m_taste;
};

void TestTasteStore::init()
{
    m_store = rp::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    QVERIFY(rp::test::seedUser(*m_store, QStringLiteral("u1")));
    m_taste = std::make_unique<rp::TasteStore>(m_store->rawDb());
}

void TestTasteStore::cleanup()
{
    m_taste.reset();
    m_store.reset();
}

void TestTasteStore::testMissingProfile()
{
    QVERIFY(!m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Movie).has_value());
}

void TestTasteStore::testSaveAndLoadAutoProfile()
{
    rp::TasteProfile profile;
    profile.userId = QStringLiteral("u1");
    profile.mediaType = rp::MediaType::Movie;
    profile.embedding = embedding({1, 2, 3, 4});
    profile.refreshIntervalDays = 3;
    QVERIFY(m_taste->saveAutoProfile(profile, 1000.0));

    const auto loaded = m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->embeddingModel(), std::string(rp::test::kModel));
    QCOMPARE(loaded->embedding.values, profile.embedding.values);
    QCOMPARE(loaded->refreshIntervalDays, 3);
    QCOMPARE(loaded->autoUpdatedAt, 1000.0);
    QVERIFY(!loaded->isLocked);

    // Media types are stored independently
    QVERIFY(!m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Series).has_value());
}

void TestTasteStore::testAutoSaveKeepsLockAndThresholds()
{
    rp::TasteProfile settings;
    settings.userId = QStringLiteral("u1");
    settings.isLocked = true;
    settings.minFranchiseItems = 4;
    QVERIFY(m_taste->saveUserSettings(settings, 500.0));

    rp::TasteProfile rebuilt;
    rebuilt.userId = QStringLiteral("u1");
    rebuilt.embedding = embedding({0, 1, 0, 0});
    QVERIFY(m_taste->saveAutoProfile(rebuilt, 900.0));

    const auto loaded = m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(loaded->isLocked);
    QCOMPARE(loaded->minFranchiseItems, 4);
    QCOMPARE(loaded->userModifiedAt, 500.0);
    QCOMPARE(loaded->autoUpdatedAt, 900.0);
    QVERIFY(loaded->embedding.isValid());

    rp::TasteProfile invalid;
    invalid.userId = QStringLiteral("u1");
    QVERIFY(!m_taste->saveAutoProfile(invalid, 1000.0));
}

void TestTasteStore::testUserSettingsWithoutEmbedding()
{
    rp::TasteProfile settings;
    settings.userId = QStringLiteral("u1");
    settings.mediaType = rp::MediaType::Series;
    settings.refreshIntervalDays = -4;
    settings.minFranchiseSize = 0;
    QVERIFY(m_taste->saveUserSettings(settings, 10.0));

    const auto loaded = m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Series);
    QVERIFY(loaded.has_value());
    QVERIFY(!loaded->embedding.isValid());
    QCOMPARE(loaded->refreshIntervalDays, 0);
    QCOMPARE(loaded->minFranchiseSize, 1);
    QCOMPARE(loaded->state(rp::test::kModel, rp::test::kDims, 20.0), rp::ProfileState::Missing);
}

void TestTasteStore::testSetLocked()
{
    rp::TasteProfile profile;
    profile.userId = QStringLiteral("u1");
    profile.embedding = embedding({1, 0, 0, 0});
    QVERIFY(m_taste->saveAutoProfile(profile, 100.0));

    QVERIFY(m_taste->setLocked(QStringLiteral("u1"), rp::MediaType::Movie, true, 200.0));
    auto loaded = m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(loaded->isLocked);
    QVERIFY(loaded->embedding.isValid());

    QVERIFY(m_taste->setLocked(QStringLiteral("u1"), rp::MediaType::Movie, false, 300.0));
    loaded = m_taste->getProfile(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(!loaded->isLocked);
    QCOMPARE(loaded->userModifiedAt, 300.0);
}

void TestTasteStore::testProfileRequiresUser()
{
    rp::TasteProfile profile;
    profile.userId = QStringLiteral("nobody");
    profile.embedding = embedding({1, 0, 0, 0});
    QVERIFY(!m_taste->saveAutoProfile(profile, 100.0));
}

void TestTasteStore::testProfileState()
{
    const double day = 86400.0;
    rp::TasteProfile profile;
    QCOMPARE(profile.state(rp::test::kModel, rp::test::kDims, 0.0), rp::ProfileState::Missing);

    profile.embedding = embedding({1, 0, 0, 0});
    QCOMPARE(profile.state(rp::test::kModel, rp::test::kDims, 10 * day),
             rp::ProfileState::Expired);

    profile.autoUpdatedAt = 10 * day;
    profile.refreshIntervalDays = 7;
    QCOMPARE(profile.state(rp::test::kModel, rp::test::kDims, 16 * day), rp::ProfileState::Fresh);
    QCOMPARE(profile.state(rp::test::kModel, rp::test::kDims, 17 * day),
             rp::ProfileState::Expired);
    QCOMPARE(profile.state("other-model", rp::test::kDims, 11 * day), rp::ProfileState::Stale);
    QCOMPARE(profile.state(rp::test::kModel, 8, 11 * day), rp::ProfileState::Stale);

    // A zero interval never expires
    profile.refreshIntervalDays = 0;
    QCOMPARE(profile.state(rp::test::kModel, rp::test::kDims, 400 * day),
             rp::ProfileState::Fresh);
}

void TestTasteStore::testAutoFranchiseUpsertSkipsUserSetRows()
{
    rp::FranchisePreference userSet;
    userSet.userId = QStringLiteral("u1");
    userSet.franchiseName = QStringLiteral("Alien");
    userSet.mediaType = rp::MediaType::Movie;
    userSet.preferenceScore = -0.8;
    QVERIFY(m_taste->setUserFranchisePreference(userSet, 10.0));

    rp::FranchisePreference learnedAlien = userSet;
    learnedAlien.preferenceScore = 0.6;
    learnedAlien.itemsWatched = 3;
    rp::FranchisePreference learnedHeat = learnedAlien;
    learnedHeat.franchiseName = QStringLiteral("Heat");
    learnedHeat.preferenceScore = 2.5;
    QVERIFY(m_taste->upsertAutoFranchisePreferences({learnedAlien, learnedHeat}, 20.0));

    const auto prefs = m_taste->franchisePreferences(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(prefs.size(), 2UL);
    QCOMPARE(prefs[0].franchiseName, QStringLiteral("Alien"));
    QCOMPARE(prefs[0].preferenceScore, -0.8);
    QVERIFY(prefs[0].isUserSet);
    QCOMPARE(prefs[1].franchiseName, QStringLiteral("Heat"));
    QCOMPARE(prefs[1].preferenceScore, 1.0);
    QCOMPARE(prefs[1].itemsWatched, 3);
    QVERIFY(!prefs[1].isUserSet);
}

void TestTasteStore::testFranchiseRowsForBothTypes()
{
    rp::FranchisePreference both;
    both.userId = QStringLiteral("u1");
    both.franchiseName = QStringLiteral("Star Trek");
    both.preferenceScore = 0.5;
    rp::FranchisePreference seriesOnly = both;
    seriesOnly.mediaType = rp::MediaType::Series;
    seriesOnly.preferenceScore = 0.9;
    QVERIFY(m_taste->setUserFranchisePreference(both, 10.0));
    QVERIFY(m_taste->setUserFranchisePreference(seriesOnly, 10.0));

    const auto moviePrefs =
        m_taste->franchisePreferences(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(moviePrefs.size(), 1UL);
    QVERIFY(!moviePrefs[0].mediaType.has_value());

    const auto seriesPrefs =
        m_taste->franchisePreferences(QStringLiteral("u1"), rp::MediaType::Series);
    QCOMPARE(seriesPrefs.size(), 2UL);
}

void TestTasteStore::testAutoGenreUpsertSkipsUserSetRows()
{
    rp::GenreWeight avoid{QStringLiteral("u1"), QStringLiteral("Horror"), 0.0, true};
    QVERIFY(m_taste->setUserGenreWeight(avoid, 10.0));

    rp::GenreWeight learnedHorror{QStringLiteral("u1"), QStringLiteral("Horror"), 1.4, false};
    rp::GenreWeight learnedDrama{QStringLiteral("u1"), QStringLiteral("Drama"), 3.0, false};
    QVERIFY(m_taste->upsertAutoGenreWeights({learnedHorror, learnedDrama}, 20.0));

    const auto weights = m_taste->genreWeights(QStringLiteral("u1"));
    QCOMPARE(weights.size(), 2UL);
    QCOMPARE(weights[0].genre, QStringLiteral("Drama"));
    QCOMPARE(weights[0].weight, 2.0);
    QCOMPARE(weights[1].genre, QStringLiteral("Horror"));
    QCOMPARE(weights[1].weight, 0.0);
    QVERIFY(weights[1].isUserSet);
}

void TestTasteStore::testClearUserOverrides()
{
    rp::GenreWeight avoid{QStringLiteral("u1"), QStringLiteral("Horror"), 0.0, true};
    QVERIFY(m_taste->setUserGenreWeight(avoid, 10.0));
    QVERIFY(m_taste->clearUserOverrides(QStringLiteral("u1")));

    rp::GenreWeight learned{QStringLiteral("u1"), QStringLiteral("Horror"), 1.3, false};
    QVERIFY(m_taste->upsertAutoGenreWeights({learned}, 20.0));

    const auto weights = m_taste->genreWeights(QStringLiteral("u1"));
    QCOMPARE(weights.size(), 1UL);
    QCOMPARE(weights[0].weight, 1.3);
    QVERIFY(!weights[0].isUserSet);
}

void TestTasteStore::testCustomInterestLifecycle()
{
    rp::CustomInterest interest;
    interest.userId = QStringLiteral("u1");
    interest.mediaType = rp::MediaType::Movie;
    interest.text = QStringLiteral("  heist films with a twist ");
    interest.weight = 1.5;

    const std::optional<int64_t> id = m_taste->addCustomInterest(interest, 10.0);
    QVERIFY(id.has_value());

    auto interests = m_taste->customInterests(QStringLiteral("u1"), rp::MediaType::Movie);
    QCOMPARE(interests.size(), 1UL);
    QCOMPARE(interests[0].id, *id);
    QCOMPARE(interests[0].text, QStringLiteral("heist films with a twist"));
    QCOMPARE(interests[0].weight, 1.5);
    QVERIFY(!interests[0].embedding.has_value());
    QVERIFY(m_taste->customInterests(QStringLiteral("u1"), rp::MediaType::Series).empty());

    QVERIFY(m_taste->updateInterestEmbedding(*id, embedding({0, 0, 1, 0})));
    interests = m_taste->customInterests(QStringLiteral("u1"), rp::MediaType::Movie);
    QVERIFY(interests[0].embedding.has_value());
    QCOMPARE(interests[0].embedding->modelId, std::string(rp::test::kModel));
    QCOMPARE(interests[0].embedding->dimension, rp::test::kDims);

    QVERIFY(!m_taste->updateInterestEmbedding(*id + 100, embedding({0, 0, 1, 0})));

    QVERIFY(m_taste->removeCustomInterest(*id));
    QVERIFY(m_taste->customInterests(QStringLiteral("u1"), rp::MediaType::Movie).empty());
}

void TestTasteStore::testBlankInterestRejected()
{
    rp::CustomInterest blank;
    blank.userId = QStringLiteral("u1");
    blank.text = QStringLiteral("   ");
    QVERIFY(!m_taste->addCustomInterest(blank, 10.0).has_value());
}

QTEST_MAIN(TestTasteStore)
#include "test_taste_store.moc"
