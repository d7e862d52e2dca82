#include <QtTest/QtTest>
#include "core/taste/preference_learner.h"

#include <cmath>

class TestPreferenceLearner : public QObject {
    Q_OBJECT

private:
    static constexpr double kNow = 1700000000.0;
    static constexpr double kDay = 86400.0;

    static rp::WatchedItem watched(int64_t id, const QString& franchise,
                                   const QStringList& genres = {})
    {
        rp::WatchedItem item;
        item.itemId = id;
        item.franchise = franchise;
        item.genres = genres;
        item.lastPlayedAt = kNow;
        return item;
    }

    static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

private slots:
    void testAgeFactor();
    void testFranchiseScoreFromCompletion();
    void testFranchiseRepeatPlaysAndRatings();
    void testFranchiseThresholds();
    void testFranchiseUnknownSizeUsesWatchedCount();
    void testFranchiseScoreDecaysWithAge();
    void testGenreWeightsFromFrequency();
    void testFavoriteGenreBonus();
    void testGenreWeightDecaysTowardNeutral();
    void testEmptyHistory();
};

void TestPreferenceLearner::testAgeFactor()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    QVERIFY(near(learner.ageFactor(kNow - 365 * kDay, kNow), 0.5));
    QVERIFY(near(learner.ageFactor(kNow, kNow), 1.0));
    QVERIFY(near(learner.ageFactor(kNow + kDay, kNow), 1.0));
    QVERIFY(near(learner.ageFactor(0.0, kNow), 1.0));

    rp::PreferenceLearner::Options noDecay;
    noDecay.decayHalfLifeDays = 0.0;
    QVERIFY(near(rp::PreferenceLearner(noDecay).ageFactor(kNow - 900 * kDay, kNow), 1.0));
}

void TestPreferenceLearner::testFranchiseScoreFromCompletion()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    const std::vector<rp::WatchedItem> history = {
        watched(1, QStringLiteral("Alien")),
        watched(2, QStringLiteral(" Alien ")),
    };
    const QHash<QString, int> sizes{{QStringLiteral("Alien"), 4}};

    const rp::PreferenceLearner::Result result =
        learner.learn(QStringLiteral("u1"), rp::MediaType::Movie, history, sizes, kNow);
    QCOMPARE(result.franchises.size(), 1UL);

    const rp::FranchisePreference& pref = result.franchises[0];
    QCOMPARE(pref.userId, QStringLiteral("u1"));
    QCOMPARE(pref.franchiseName, QStringLiteral("Alien"));
    QCOMPARE(pref.mediaType, std::optional<rp::MediaType>(rp::MediaType::Movie));
    QCOMPARE(pref.itemsWatched, 2);
    QVERIFY(near(pref.totalEngagement, 2.0));
    // Half the franchise watched once each
    QVERIFY(near(pref.preferenceScore, 0.5 * 0.4 + 0.15));
    QVERIFY(!pref.isUserSet);
}

void TestPreferenceLearner::testFranchiseRepeatPlaysAndRatings()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    std::vector<rp::WatchedItem> history = {
        watched(1, QStringLiteral("Heat")),
        watched(2, QStringLiteral("Heat")),
    };
    history[0].playCount = 3;
    history[0].userRating = 9.0;
    history[1].playCount = 2;
    history[1].userRating = 7.0;

    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history,
        QHash<QString, int>{{QStringLiteral("Heat"), 2}}, kNow);
    QCOMPARE(result.franchises.size(), 1UL);
    QVERIFY(near(result.franchises[0].preferenceScore, 0.4 + 0.3 + (0.8 - 0.5) * 0.6));

    // Low ratings pull the score down
    history[0].userRating = 1.0;
    history[1].userRating = 1.0;
    history[0].playCount = 1;
    history[1].playCount = 1;
    const rp::PreferenceLearner::Result disliked = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history,
        QHash<QString, int>{{QStringLiteral("Heat"), 2}}, kNow);
    QVERIFY(near(disliked.franchises[0].preferenceScore, 0.4 + 0.15 + (0.1 - 0.5) * 0.6));
}

void TestPreferenceLearner::testFranchiseThresholds()
{
    rp::PreferenceLearner::Options options;
    options.minFranchiseItems = 2;
    options.minFranchiseSize = 5;
    const rp::PreferenceLearner learner(options);

    const std::vector<rp::WatchedItem> history = {
        watched(1, QStringLiteral("Small")),
        watched(2, QStringLiteral("Small")),
        watched(3, QStringLiteral("Large")),
        watched(4, QStringLiteral("Large")),
        watched(5, QStringLiteral("Single")),
        watched(6, QString()),
    };
    const QHash<QString, int> sizes{
        {QStringLiteral("Small"), 3},
        {QStringLiteral("Large"), 8},
        {QStringLiteral("Single"), 10},
    };

    const rp::PreferenceLearner::Result result =
        learner.learn(QStringLiteral("u1"), rp::MediaType::Series, history, sizes, kNow);
    QCOMPARE(result.franchises.size(), 1UL);
    QCOMPARE(result.franchises[0].franchiseName, QStringLiteral("Large"));
    QCOMPARE(result.franchises[0].mediaType, std::optional<rp::MediaType>(rp::MediaType::Series));
}

void TestPreferenceLearner::testFranchiseUnknownSizeUsesWatchedCount()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    const std::vector<rp::WatchedItem> history = {
        watched(1, QStringLiteral("Trilogy")),
        watched(2, QStringLiteral("Trilogy")),
    };
    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history, QHash<QString, int>(), kNow);
    QCOMPARE(result.franchises.size(), 1UL);
    QVERIFY(near(result.franchises[0].preferenceScore, 1.0 * 0.4 + 0.15));
}

void TestPreferenceLearner::testFranchiseScoreDecaysWithAge()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    std::vector<rp::WatchedItem> history = {
        watched(1, QStringLiteral("Old")),
        watched(2, QStringLiteral("Old")),
    };
    history[0].lastPlayedAt = kNow - 800 * kDay;
    history[1].lastPlayedAt = kNow - 365 * kDay;

    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history,
        QHash<QString, int>{{QStringLiteral("Old"), 2}}, kNow);
    // Decay uses the most recent play in the franchise
    QVERIFY(near(result.franchises[0].preferenceScore, (0.4 + 0.15) * 0.5));
}

void TestPreferenceLearner::testGenreWeightsFromFrequency()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    const std::vector<rp::WatchedItem> history = {
        watched(1, {}, {QStringLiteral("Drama")}),
        watched(2, {}, {QStringLiteral("Drama"), QStringLiteral("Comedy")}),
        watched(3, {}, {QStringLiteral("Drama"), QStringLiteral(" ")}),
    };

    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history, QHash<QString, int>(), kNow);
    QCOMPARE(result.genres.size(), 2UL);

    // Ordered by genre name
    QCOMPARE(result.genres[0].genre, QStringLiteral("Comedy"));
    QCOMPARE(result.genres[1].genre, QStringLiteral("Drama"));
    QVERIFY(near(result.genres[0].weight, 0.8));
    QVERIFY(near(result.genres[1].weight, 1.2));
    QVERIFY(!result.genres[0].isUserSet);
    QCOMPARE(result.genres[1].userId, QStringLiteral("u1"));
}

void TestPreferenceLearner::testFavoriteGenreBonus()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    std::vector<rp::WatchedItem> history = {
        watched(1, {}, {QStringLiteral("Drama")}),
        watched(2, {}, {QStringLiteral("Comedy")}),
    };
    history[1].isFavorite = true;

    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history, QHash<QString, int>(), kNow);
    QCOMPARE(result.genres.size(), 2UL);
    QVERIFY(near(result.genres[0].weight, 1.2));
    QVERIFY(near(result.genres[1].weight, 1.0));
}

void TestPreferenceLearner::testGenreWeightDecaysTowardNeutral()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    std::vector<rp::WatchedItem> history = {
        watched(1, {}, {QStringLiteral("Drama")}),
        watched(2, {}, {QStringLiteral("Drama")}),
        watched(3, {}, {QStringLiteral("Drama"), QStringLiteral("Comedy")}),
    };
    for (rp::WatchedItem& item : history) {
        item.lastPlayedAt = kNow - 365 * kDay;
    }

    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, history, QHash<QString, int>(), kNow);
    QVERIFY(near(result.genres[0].weight, 1.0 - 0.2 * 0.5));
    QVERIFY(near(result.genres[1].weight, 1.0 + 0.2 * 0.5));
}

void TestPreferenceLearner::testEmptyHistory()
{
    const rp::PreferenceLearner learner{rp::PreferenceLearner::Options()};
    const rp::PreferenceLearner::Result result = learner.learn(
        QStringLiteral("u1"), rp::MediaType::Movie, {}, QHash<QString, int>(), kNow);
    QVERIFY(result.franchises.empty());
    QVERIFY(result.genres.empty());
}

QTEST_MAIN(TestPreferenceLearner)
#include "test_preference_learner.moc"
