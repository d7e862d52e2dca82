#include "core/ranking/diversity_selector.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rp {

namespace {

constexpr double kMinPenaltyWeight = 1e-6;
constexpr double kUnknownNetworkOverlap = 0.5;

QSet<QString> genreSet(const Candidate& candidate)
{
    QSet<QString> genres;
    for (const QString& genre : candidate.genres) {
        const QString key = genre.trimmed().toLower();
        if (!key.isEmpty()) {
            genres.insert(key);
        }
    }
    return genres;
}

double jaccard(const QSet<QString>& a, const QSet<QString>& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0.0;
    }
    int shared = 0;
    for (const QString& genre : a) {
        if (b.contains(genre)) {
            ++shared;
        }
    }
    const int unionSize = a.size() + b.size() - shared;
    return unionSize > 0 ? static_cast<double>(shared) / unionSize : 0.0;
}

QString networkKey(const Candidate& candidate)
{
    return candidate.network.trimmed().toLower();
}

double networkOverlap(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return kUnknownNetworkOverlap;
    }
    return a == b ? 1.0 : 0.0;
}

double blend(double genreOverlap, double netOverlap, double networkWeight)
{
    if (networkWeight <= 0.0) {
        return genreOverlap;
    }
    return (1.0 - networkWeight) * genreOverlap + networkWeight * netOverlap;
}

double clampWeight(double weight)
{
    return std::isfinite(weight) ? std::clamp(weight, 0.0, 1.0) : 0.0;
}

// True when (score, similarity, index) a ranks ahead of b.
bool ranksAhead(double scoreA, double simA, size_t indexA,
                double scoreB, double simB, size_t indexB)
{
    if (scoreA != scoreB) {
        return scoreA > scoreB;
    }
    if (simA != simB) {
        return simA > simB;
    }
    return indexA < indexB;
}

void markRejected(Candidate& candidate)
{
    candidate.isSelected = false;
    candidate.rank = 0;
    candidate.score.diversityPenalty = 0.0;
    candidate.score.final = candidate.score.base;
    candidate.diversityScore = 1.0;
}

} // namespace

DiversitySelector::DiversitySelector(double lambda, double networkWeight)
    : m_lambda(clampWeight(lambda))
    , m_networkWeight(clampWeight(networkWeight))
{
}

double DiversitySelector::overlap(const Candidate& a, const Candidate& b, double networkWeight)
{
    if (a.duplicateKey() == b.duplicateKey()) {
        return 1.0;
    }
    return blend(jaccard(genreSet(a), genreSet(b)),
                 networkOverlap(networkKey(a), networkKey(b)), clampWeight(networkWeight));
}

SelectionResult DiversitySelector::selectSimple(std::vector<Candidate> candidates, int k)
{
    SelectionResult result;
    if (k <= 0 || candidates.empty()) {
        for (Candidate& candidate : candidates) {
            markRejected(candidate);
        }
        result.rejected = std::move(candidates);
        return result;
    }

    std::vector<size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&candidates](size_t a, size_t b) {
        return ranksAhead(candidates[a].score.base, candidates[a].similarity, a,
                          candidates[b].score.base, candidates[b].similarity, b);
    });

    const size_t take = std::min(static_cast<size_t>(k), candidates.size());
    std::vector<bool> picked(candidates.size(), false);
    result.selected.reserve(take);
    for (size_t i = 0; i < take; ++i) {
        picked[order[i]] = true;
        Candidate candidate = candidates[order[i]];
        candidate.isSelected = true;
        candidate.rank = static_cast<int>(i) + 1;
        candidate.score.diversityPenalty = 0.0;
        candidate.score.final = candidate.score.base;
        candidate.diversityScore = 1.0;
        result.selected.push_back(std::move(candidate));
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!picked[i]) {
            markRejected(candidates[i]);
            result.rejected.push_back(std::move(candidates[i]));
        }
    }
    return result;
}

SelectionResult DiversitySelector::select(std::vector<Candidate> candidates, int k) const
{
    if (m_lambda <= 0.0) {
        return selectSimple(std::move(candidates), k);
    }

    SelectionResult result;
    if (k <= 0 || candidates.empty()) {
        for (Candidate& candidate : candidates) {
            markRejected(candidate);
        }
        result.rejected = std::move(candidates);
        return result;
    }

    const size_t n = candidates.size();
    std::vector<QSet<QString>> genres(n);
    std::vector<QString> keys(n);
    std::vector<QString> networks(n);
    for (size_t i = 0; i < n; ++i) {
        genres[i] = genreSet(candidates[i]);
        keys[i] = candidates[i].duplicateKey();
        networks[i] = networkKey(candidates[i]);
    }

    // Running weighted overlap against the selected set, per candidate
    std::vector<double> weightedOverlap(n, 0.0);
    double totalWeight = 0.0;
    std::vector<bool> picked(n, false);

    const size_t take = std::min(static_cast<size_t>(k), n);
    result.selected.reserve(take);

    for (size_t step = 0; step < take; ++step) {
        size_t best = n;
        double bestScore = 0.0;
        double bestPenalty = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (picked[i]) {
                continue;
            }
            const double penalty = totalWeight > 0.0 ? weightedOverlap[i] / totalWeight : 0.0;
            const double score = candidates[i].score.base - m_lambda * penalty;
            if (best == n
                || ranksAhead(score, candidates[i].similarity, i,
                              bestScore, candidates[best].similarity, best)) {
                best = i;
                bestScore = score;
                bestPenalty = penalty;
            }
        }

        picked[best] = true;
        Candidate chosen = candidates[best];
        chosen.isSelected = true;
        chosen.rank = static_cast<int>(step) + 1;
        chosen.score.diversityPenalty = bestPenalty;
        chosen.score.final = bestScore;
        chosen.diversityScore = 1.0 - bestPenalty;

        const double weight = std::max(chosen.similarity, kMinPenaltyWeight);
        totalWeight += weight;
        for (size_t i = 0; i < n; ++i) {
            if (picked[i]) {
                continue;
            }
            const double o = keys[i] == keys[best]
                ? 1.0
                : blend(jaccard(genres[i], genres[best]),
                        networkOverlap(networks[i], networks[best]), m_networkWeight);
            weightedOverlap[i] += weight * o;
        }
        result.selected.push_back(std::move(chosen));
    }

    for (size_t i = 0; i < n; ++i) {
        if (!picked[i]) {
            markRejected(candidates[i]);
            result.rejected.push_back(std::move(candidates[i]));
        }
    }

    LOG_DEBUG(rpRanking, "Selected %d of %d candidates (lambda %.2f)",
              static_cast<int>(result.selected.size()), static_cast<int>(n), m_lambda);
    return result;
}

} // namespace rp
