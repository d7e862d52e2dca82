#include <QtTest/QtTest>
#include "core/ranking/diversity_selector.h"

#include <cmath>
#include <limits>

class TestDiversitySelector : public QObject {
    Q_OBJECT

private:
    static rp::Candidate make(int64_t id, double base, double similarity,
                              const QStringList& genres)
    {
        rp::Candidate c;
        c.itemId = id;
        c.title = QStringLiteral("Title %1").arg(id);
        c.year = 2000;
        c.genres = genres;
        c.similarity = similarity;
        c.score.similarity = similarity;
        c.score.base = base;
        c.score.final = base;
        return c;
    }

    static rp::Candidate makeShow(int64_t id, double base, const QString& network)
    {
        rp::Candidate c = make(id, base, base, {QStringLiteral("Drama")});
        c.network = network;
        return c;
    }

    // Eight candidates in three genre clusters; item 5 has the best base
    // score but sits mid-pool.
    static std::vector<rp::Candidate> clusteredPool()
    {
        const QString action = QStringLiteral("Action");
        const QString drama = QStringLiteral("Drama");
        const QString comedy = QStringLiteral("Comedy");
        return {
            make(1, 0.80, 0.80, {action, QStringLiteral("Thriller")}),
            make(2, 0.78, 0.82, {action}),
            make(3, 0.74, 0.70, {drama}),
            make(4, 0.72, 0.60, {drama, QStringLiteral("Romance")}),
            make(5, 0.95, 0.90, {action, QStringLiteral("Thriller")}),
            make(6, 0.60, 0.55, {comedy}),
            make(7, 0.76, 0.75, {action}),
            make(8, 0.58, 0.50, {comedy, drama}),
        };
    }

    static std::vector<int64_t> ids(const std::vector<rp::Candidate>& candidates)
    {
        std::vector<int64_t> out;
        for (const rp::Candidate& c : candidates) {
            out.push_back(c.itemId);
        }
        return out;
    }

private slots:
    void testLambdaClamped();
    void testOverlap();
    void testSimpleSelectionSortsByBase();
    void testTieBreaksBySimilarityThenPosition();
    void testKLargerThanPool();
    void testZeroKRejectsAll();
    void testPenaltyPromotesDifferentGenres();
    void testPenaltyIsSimilarityWeighted();
    void testDuplicateTitlesPenalised();
    void testSelectedNeverExceedsK();
    void testSelectionIsDeterministic();
    void testFirstPickIsBestBaseScore();
    void testDistinctGenreWinsSecondPick();
    void testNetworkOverlap();
    void testNetworkWeightPromotesOtherNetworks();
};

void TestDiversitySelector::testLambdaClamped()
{
    QCOMPARE(rp::DiversitySelector(0.3).lambda(), 0.3);
    QCOMPARE(rp::DiversitySelector(5.0).lambda(), 1.0);
    QCOMPARE(rp::DiversitySelector(-1.0).lambda(), 0.0);
    QCOMPARE(rp::DiversitySelector(std::numeric_limits<double>::quiet_NaN()).lambda(), 0.0);
}

void TestDiversitySelector::testOverlap()
{
    const rp::Candidate a = make(1, 0, 0, {QStringLiteral("Action"), QStringLiteral("Drama")});
    const rp::Candidate b = make(2, 0, 0, {QStringLiteral(" action "), QStringLiteral("Comedy")});
    const rp::Candidate none = make(3, 0, 0, {});

    QVERIFY(std::abs(rp::DiversitySelector::overlap(a, b) - 1.0 / 3.0) < 1e-9);
    QCOMPARE(rp::DiversitySelector::overlap(a, a), 1.0);
    QCOMPARE(rp::DiversitySelector::overlap(a, none), 0.0);

    // Same title and year is a full overlap even without genres
    rp::Candidate reRelease = make(4, 0, 0, {});
    reRelease.title = QStringLiteral("TITLE 3");
    QCOMPARE(rp::DiversitySelector::overlap(none, reRelease), 1.0);
}

void TestDiversitySelector::testSimpleSelectionSortsByBase()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.3, 0.9, {}),
        make(2, 0.8, 0.5, {}),
        make(3, 0.5, 0.6, {}),
        make(4, 0.1, 0.2, {}),
    };
    const rp::SelectionResult result = rp::DiversitySelector(0.0).select(pool, 2);

    QCOMPARE(ids(result.selected), (std::vector<int64_t>{2, 3}));
    QCOMPARE(result.selected[0].rank, 1);
    QCOMPARE(result.selected[1].rank, 2);
    QVERIFY(result.selected[0].isSelected);
    QCOMPARE(result.selected[0].score.final, result.selected[0].score.base);

    // Rejected keep input order
    QCOMPARE(ids(result.rejected), (std::vector<int64_t>{1, 4}));
    QCOMPARE(result.rejected[0].rank, 0);
    QVERIFY(!result.rejected[0].isSelected);
}

void TestDiversitySelector::testTieBreaksBySimilarityThenPosition()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.5, 0.4, {}),
        make(2, 0.5, 0.7, {}),
        make(3, 0.5, 0.7, {}),
        make(4, 0.5, 0.1, {}),
    };

    const rp::SelectionResult simple = rp::DiversitySelector::selectSimple(pool, 4);
    QCOMPARE(ids(simple.selected), (std::vector<int64_t>{2, 3, 1, 4}));

    // Without genres the penalty stays at zero, so the order holds
    const rp::SelectionResult diverse = rp::DiversitySelector(0.5).select(pool, 4);
    QCOMPARE(ids(diverse.selected), (std::vector<int64_t>{2, 3, 1, 4}));
}

void TestDiversitySelector::testKLargerThanPool()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.2, 0.2, {QStringLiteral("Drama")}),
        make(2, 0.9, 0.9, {QStringLiteral("Drama")}),
    };
    const rp::SelectionResult result = rp::DiversitySelector(0.4).select(pool, 10);
    QCOMPARE(result.selected.size(), 2UL);
    QVERIFY(result.rejected.empty());
    QCOMPARE(result.selected[0].itemId, int64_t(2));
}

void TestDiversitySelector::testZeroKRejectsAll()
{
    std::vector<rp::Candidate> pool = {make(1, 0.2, 0.2, {}), make(2, 0.9, 0.9, {})};
    const rp::SelectionResult result = rp::DiversitySelector(0.4).select(pool, 0);
    QVERIFY(result.selected.empty());
    QCOMPARE(ids(result.rejected), (std::vector<int64_t>{1, 2}));

    QVERIFY(rp::DiversitySelector(0.4).select({}, 5).selected.empty());
}

void TestDiversitySelector::testPenaltyPromotesDifferentGenres()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.90, 0.90, {QStringLiteral("Action")}),
        make(2, 0.85, 0.85, {QStringLiteral("Action")}),
        make(3, 0.70, 0.70, {QStringLiteral("Drama")}),
    };

    const rp::SelectionResult plain = rp::DiversitySelector(0.0).select(pool, 2);
    QCOMPARE(ids(plain.selected), (std::vector<int64_t>{1, 2}));

    const rp::SelectionResult diverse = rp::DiversitySelector(0.5).select(pool, 2);
    QCOMPARE(ids(diverse.selected), (std::vector<int64_t>{1, 3}));
    QCOMPARE(diverse.selected[1].score.diversityPenalty, 0.0);
    QCOMPARE(diverse.selected[1].diversityScore, 1.0);

    // The rejected candidate reports its undiversified score
    QCOMPARE(diverse.rejected.size(), 1UL);
    QCOMPARE(diverse.rejected[0].itemId, int64_t(2));
    QCOMPARE(diverse.rejected[0].score.final, 0.85);
    QCOMPARE(diverse.rejected[0].score.diversityPenalty, 0.0);
}

void TestDiversitySelector::testPenaltyIsSimilarityWeighted()
{
    std::vector<rp::Candidate> pool = {
        make(1, 1.00, 0.9, {QStringLiteral("Action")}),
        make(2, 0.95, 0.5, {QStringLiteral("Drama")}),
        make(3, 0.90, 0.8, {QStringLiteral("Action")}),
    };
    const rp::SelectionResult result = rp::DiversitySelector(1.0).select(pool, 3);
    QCOMPARE(ids(result.selected), (std::vector<int64_t>{1, 2, 3}));

    // Overlaps 1 with item 1 (weight 0.9) and 0 with item 2 (weight 0.5)
    const double expectedPenalty = 0.9 / 1.4;
    const rp::Candidate& last = result.selected[2];
    QVERIFY(std::abs(last.score.diversityPenalty - expectedPenalty) < 1e-9);
    QVERIFY(std::abs(last.score.final - (0.90 - expectedPenalty)) < 1e-9);
    QVERIFY(std::abs(last.diversityScore - (1.0 - expectedPenalty)) < 1e-9);
    QCOMPARE(last.rank, 3);
}

void TestDiversitySelector::testDuplicateTitlesPenalised()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.90, 0.9, {}),
        make(2, 0.89, 0.9, {}),
        make(3, 0.70, 0.7, {}),
    };
    pool[1].title = pool[0].title;

    const rp::SelectionResult result = rp::DiversitySelector(0.5).select(pool, 2);
    QCOMPARE(ids(result.selected), (std::vector<int64_t>{1, 3}));
}

void TestDiversitySelector::testSelectedNeverExceedsK()
{
    std::vector<rp::Candidate> pool;
    for (int i = 0; i < 30; ++i) {
        pool.push_back(make(i + 1, 1.0 - i * 0.01, 0.5,
                            {i % 2 == 0 ? QStringLiteral("Drama") : QStringLiteral("Comedy")}));
    }
    const rp::SelectionResult result = rp::DiversitySelector(0.3).select(pool, 12);
    QCOMPARE(result.selected.size(), 12UL);
    QCOMPARE(result.rejected.size(), 18UL);
    for (size_t i = 0; i < result.selected.size(); ++i) {
        QCOMPARE(result.selected[i].rank, static_cast<int>(i) + 1);
    }
}

void TestDiversitySelector::testSelectionIsDeterministic()
{
    const rp::DiversitySelector selector(0.4, 0.4);
    std::vector<rp::Candidate> pool = clusteredPool();
    pool[2].network = QStringLiteral("HBO");
    pool[3].network = QStringLiteral("HBO");
    pool[5].network = QStringLiteral("AMC");

    const rp::SelectionResult first = selector.select(pool, 5);
    const rp::SelectionResult second = selector.select(pool, 5);

    QCOMPARE(first.selected.size(), 5UL);
    QCOMPARE(second.selected.size(), first.selected.size());
    for (size_t i = 0; i < first.selected.size(); ++i) {
        const rp::Candidate& a = first.selected[i];
        const rp::Candidate& b = second.selected[i];
        QCOMPARE(b.itemId, a.itemId);
        QCOMPARE(b.rank, a.rank);
        QCOMPARE(b.score.base, a.score.base);
        QCOMPARE(b.score.final, a.score.final);
        QCOMPARE(b.score.diversityPenalty, a.score.diversityPenalty);
        QCOMPARE(b.diversityScore, a.diversityScore);
    }
    QCOMPARE(ids(second.rejected), ids(first.rejected));
}

void TestDiversitySelector::testFirstPickIsBestBaseScore()
{
    for (double lambda : {0.0, 0.5, 1.0}) {
        const rp::SelectionResult result = rp::DiversitySelector(lambda).select(clusteredPool(), 4);
        QVERIFY2(!result.selected.empty(), qPrintable(QString::number(lambda)));
        const rp::Candidate& top = result.selected.front();
        QCOMPARE(top.itemId, int64_t(5));
        QCOMPARE(top.rank, 1);
        QCOMPARE(top.score.diversityPenalty, 0.0);
        QCOMPARE(top.score.final, top.score.base);
    }
}

void TestDiversitySelector::testDistinctGenreWinsSecondPick()
{
    std::vector<rp::Candidate> pool = {
        make(1, 0.90, 0.90, {QStringLiteral("Action")}),
        make(2, 0.90, 0.90, {QStringLiteral("Action")}),
        make(3, 0.85, 0.85, {QStringLiteral("Drama")}),
    };

    const rp::SelectionResult result = rp::DiversitySelector(0.5).select(pool, 2);
    QCOMPARE(ids(result.selected), (std::vector<int64_t>{1, 3}));
    // 0.85 unpenalised beats 0.90 - 0.5 * 1.0
    QCOMPARE(result.selected[1].score.final, 0.85);
    QCOMPARE(ids(result.rejected), (std::vector<int64_t>{2}));
}

void TestDiversitySelector::testNetworkOverlap()
{
    const rp::Candidate hbo = makeShow(1, 0, QStringLiteral("HBO"));
    const rp::Candidate hboAgain = makeShow(2, 0, QStringLiteral(" hbo"));
    const rp::Candidate amc = makeShow(3, 0, QStringLiteral("AMC"));
    const rp::Candidate unknown = makeShow(4, 0, QString());

    // Same genres everywhere, so only the network term moves
    QCOMPARE(rp::DiversitySelector::overlap(hbo, hboAgain, 0.4), 1.0);
    QVERIFY(std::abs(rp::DiversitySelector::overlap(hbo, amc, 0.4) - 0.6) < 1e-9);
    QVERIFY(std::abs(rp::DiversitySelector::overlap(hbo, unknown, 0.4) - 0.8) < 1e-9);
    QCOMPARE(rp::DiversitySelector::overlap(hbo, amc), 1.0);

    QCOMPARE(rp::DiversitySelector(0.5, 0.4).networkWeight(), 0.4);
    QCOMPARE(rp::DiversitySelector(0.5, 3.0).networkWeight(), 1.0);
    QCOMPARE(rp::DiversitySelector(0.5).networkWeight(), 0.0);
}

void TestDiversitySelector::testNetworkWeightPromotesOtherNetworks()
{
    std::vector<rp::Candidate> pool = {
        makeShow(1, 0.90, QStringLiteral("HBO")),
        makeShow(2, 0.80, QStringLiteral("HBO")),
        makeShow(3, 0.78, QStringLiteral("AMC")),
    };

    // Genres alone cannot tell 2 and 3 apart, so base score decides
    const rp::SelectionResult genresOnly = rp::DiversitySelector(0.5).select(pool, 2);
    QCOMPARE(ids(genresOnly.selected), (std::vector<int64_t>{1, 2}));

    const rp::SelectionResult withNetwork = rp::DiversitySelector(0.5, 0.4).select(pool, 2);
    QCOMPARE(ids(withNetwork.selected), (std::vector<int64_t>{1, 3}));
    QVERIFY(std::abs(withNetwork.selected[1].score.diversityPenalty - 0.6) < 1e-9);
    QVERIFY(std::abs(withNetwork.selected[1].score.final - (0.78 - 0.3)) < 1e-9);
}

QTEST_MAIN(TestDiversitySelector)
#include "test_diversity_selector.moc"
