#pragma once

#include "core/shared/candidate.h"

#include <QSet>
#include <QString>

#include <vector>

namespace rp {

struct SelectionResult {
    std::vector<Candidate> selected;  // in pick order, rank 1..n
    std::vector<Candidate> rejected;  // input order
};

// Greedy marginal-relevance re-ranking. Each pick maximises
//   finalScore = baseScore - lambda * diversityPenalty
// where the penalty is the similarity-weighted mean overlap with the
// candidates picked so far. Overlap is genre Jaccard, blended with network
// overlap when networkWeight > 0 (series). Ties go to higher similarity,
// then to the earlier input position.
class DiversitySelector {
public:
    explicit DiversitySelector(double lambda, double networkWeight = 0.0);

    SelectionResult select(std::vector<Candidate> candidates, int k) const;

    // Sort by baseScore only (same tie-breaks). Used when lambda is 0.
    static SelectionResult selectSimple(std::vector<Candidate> candidates, int k);

    // Jaccard index of the genre sets, case-insensitive, mixed as
    //   (1 - networkWeight) * genres + networkWeight * network
    // where network is 1 for the same network, 0 for different ones and 0.5
    // when either is unknown. Candidates sharing a title|year key overlap
    // fully.
    static double overlap(const Candidate& a, const Candidate& b, double networkWeight = 0.0);

    double lambda() const { return m_lambda; }
    double networkWeight() const { return m_networkWeight; }

private:
    double m_lambda = 0.0;
    double m_networkWeight = 0.0;
};

} // namespace rp
