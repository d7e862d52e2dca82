#include <QtTest/QtTest>

#include "core/embedding/embedding_vector.h"

#include <cmath>

class TestEmbeddingVector : public QObject {
    Q_OBJECT

private slots:
    void testValidity();
    void testCompatibilityRequiresSameModelAndDims();
    void testCosineSimilarity();
    void testCosineRejectsZeroVector();
    void testNormalize();
    void testBlobRoundTrip();
    void testBlobRejectsPartialFloat();
};

void TestEmbeddingVector::testValidity()
{
    QVERIFY(!rp::EmbeddingVector().isValid());
    QVERIFY(!rp::EmbeddingVector("", {1.0f, 0.0f}).isValid());
    QVERIFY(!rp::EmbeddingVector("m", {}).isValid());

    const rp::EmbeddingVector v("m", {1.0f, 2.0f, 3.0f});
    QVERIFY(v.isValid());
    QCOMPARE(v.dimension, 3);
    QVERIFY(v.matchesModel("m", 3));
    QVERIFY(!v.matchesModel("m", 4));
    QVERIFY(!v.matchesModel("other", 3));
}

void TestEmbeddingVector::testCompatibilityRequiresSameModelAndDims()
{
    const rp::EmbeddingVector a("model-a", {1.0f, 0.0f});
    const rp::EmbeddingVector b("model-b", {1.0f, 0.0f});
    const rp::EmbeddingVector c("model-a", {1.0f, 0.0f, 0.0f});

    QVERIFY(a.isCompatibleWith(a));
    QVERIFY(!a.isCompatibleWith(b));
    QVERIFY(!a.isCompatibleWith(c));
    QVERIFY(!rp::cosineSimilarity(a, b).has_value());
    QVERIFY(!rp::cosineSimilarity(a, c).has_value());
}

void TestEmbeddingVector::testCosineSimilarity()
{
    const rp::EmbeddingVector x("m", {1.0f, 0.0f});
    const rp::EmbeddingVector y("m", {0.0f, 2.0f});
    const rp::EmbeddingVector diag("m", {1.0f, 1.0f});
    const rp::EmbeddingVector neg("m", {-3.0f, 0.0f});

    QVERIFY(qAbs(*rp::cosineSimilarity(x, x) - 1.0) < 1e-9);
    QVERIFY(qAbs(*rp::cosineSimilarity(x, y)) < 1e-9);
    QVERIFY(qAbs(*rp::cosineSimilarity(x, diag) - std::sqrt(0.5)) < 1e-6);
    QVERIFY(qAbs(*rp::cosineSimilarity(x, neg) + 1.0) < 1e-9);
}

void TestEmbeddingVector::testCosineRejectsZeroVector()
{
    const rp::EmbeddingVector x("m", {1.0f, 0.0f});
    const rp::EmbeddingVector zero("m", {0.0f, 0.0f});
    QVERIFY(!rp::cosineSimilarity(x, zero).has_value());
}

void TestEmbeddingVector::testNormalize()
{
    const rp::EmbeddingVector v("m", {3.0f, 4.0f});
    const rp::EmbeddingVector n = v.normalized();
    QVERIFY(qAbs(n.norm() - 1.0) < 1e-6);
    QVERIFY(qAbs(n.values[0] - 0.6f) < 1e-6f);
    QCOMPARE(n.modelId, std::string("m"));

    std::vector<float> zero = {0.0f, 0.0f};
    rp::normalizeInPlace(zero);
    QCOMPARE(zero[0], 0.0f);
    QCOMPARE(zero[1], 0.0f);
}

void TestEmbeddingVector::testBlobRoundTrip()
{
    const std::vector<float> values = {0.25f, -1.5f, 3.0f};
    const QByteArray blob = rp::vectorToBlob(values);
    QCOMPARE(static_cast<size_t>(blob.size()), values.size() * sizeof(float));
    QCOMPARE(rp::vectorFromBlob(blob.constData(), blob.size()), values);
}

void TestEmbeddingVector::testBlobRejectsPartialFloat()
{
    const QByteArray blob(7, '\0');
    QVERIFY(rp::vectorFromBlob(blob.constData(), blob.size()).empty());
    QVERIFY(rp::vectorFromBlob(nullptr, 0).empty());
}

QTEST_MAIN(TestEmbeddingVector)
#include "test_embedding_vector.moc"
