#include "core/taste/taste_aggregator.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>
#include <cmath>

namespace rp {

namespace {

constexpr double kSecondsPerDay = 86400.0;
constexpr double kSeriesBingeBoost = 1.5;    // completion > 0.9
constexpr double kSeriesPartialBoost = 1.2;  // completion > 0.5

// Franchise factor lookup. A media-specific preference wins over one
// targeting both types.
class FranchiseLookup {
public:
    FranchiseLookup(const std::vector<FranchisePreference>& prefs, MediaType type)
    {
        for (const FranchisePreference& pref : prefs) {
            const QString key = pref.franchiseName.trimmed().toLower();
            if (pref.mediaType.has_value() && *pref.mediaType != type) {
                continue;
            }
            if (!pref.mediaType.has_value() && m_specific.contains(key)) {
                continue;
            }
            m_scores.insert(key, std::clamp(pref.preferenceScore, -1.0, 1.0));
            if (pref.mediaType.has_value()) {
                m_specific.insert(key, true);
            }
        }
    }

    double factor(const QString& franchise) const
    {
        const QString key = franchise.trimmed().toLower();
        if (key.isEmpty()) {
            return 1.0;
        }
        return 1.0 + m_scores.value(key, 0.0);
    }

private:
    QHash<QString, double> m_scores;
    QHash<QString, bool> m_specific;
};

class GenreLookup {
public:
    explicit GenreLookup(const std::vector<GenreWeight>& weights)
    {
        for (const GenreWeight& weight : weights) {
            m_weights.insert(weight.genre.trimmed().toLower(), std::clamp(weight.weight, 0.0, 2.0));
        }
    }

    // Mean over the genres that carry a weight; neutral when none do.
    double factor(const QStringList& genres) const
    {
        double sum = 0.0;
        int count = 0;
        for (const QString& genre : genres) {
            auto it = m_weights.constFind(genre.trimmed().toLower());
            if (it != m_weights.cend()) {
                sum += it.value();
                ++count;
            }
        }
        return count > 0 ? sum / count : 1.0;
    }

private:
    QHash<QString, double> m_weights;
};

void accumulate(std::vector<double>& sum, const std::vector<float>& values, double weight)
{
    for (size_t i = 0; i < sum.size(); ++i) {
        sum[i] += static_cast<double>(values[i]) * weight;
    }
}

} // namespace

TasteAggregator::TasteAggregator(const AggregatorSettings& settings)
    : m_settings(settings)
{
}

double TasteAggregator::engagementWeight(const WatchedItem& item) const
{
    double weight = 1.0;
    if (item.mediaType == MediaType::Series) {
        if (item.episodesWatched >= 1) {
            weight = 1.0 + std::log10(static_cast<double>(item.episodesWatched));
        }
        if (item.completion > 0.9) {
            weight *= kSeriesBingeBoost;
        } else if (item.completion > 0.5) {
            weight *= kSeriesPartialBoost;
        }
    } else if (item.playCount >= 1) {
        weight = 1.0 + std::log10(static_cast<double>(item.playCount)) * 0.5;
    }

    if (item.isFavorite) {
        weight *= m_settings.favoriteMultiplier;
    }
    return weight;
}

double TasteAggregator::recencyWeight(double lastPlayedAt, double nowEpoch) const
{
    const double floor = std::clamp(m_settings.minRecencyWeight, 0.0, 1.0);
    if (lastPlayedAt <= 0.0) {
        return floor;
    }
    const double days = std::max(0.0, (nowEpoch - lastPlayedAt) / kSecondsPerDay);

    double weight = 1.0;
    if (m_settings.recencyMode == RecencyMode::Linear) {
        if (m_settings.linearWindowDays > 0.0) {
            weight = 1.0 - days / m_settings.linearWindowDays;
        }
    } else if (m_settings.recencyHalfLifeDays > 0.0) {
        weight = std::pow(0.5, days / m_settings.recencyHalfLifeDays);
    }
    return std::max(floor, weight);
}

double TasteAggregator::ratingWeight(const std::optional<double>& userRating)
{
    if (!userRating.has_value()) {
        return 1.0;
    }
    return 0.5 + (std::clamp(*userRating, 0.0, 10.0) / 10.0) * 0.75;
}

AggregationResult TasteAggregator::aggregate(const AggregatorInput& input) const
{
    AggregationResult result;
    if (input.modelId.empty() || input.dimensions <= 0) {
        result.error = RecError::make(RecErrorCode::InvalidConfig,
                                      QStringLiteral("no active embedding model"));
        return result;
    }

    const FranchiseLookup franchises(input.franchisePreferences, input.mediaType);
    const GenreLookup genres(input.genreWeights);

    std::vector<double> sum(static_cast<size_t>(input.dimensions), 0.0);
    double totalWeight = 0.0;

    for (const WatchedItem& item : input.watched) {
        auto it = input.watchedEmbeddings.find(item.itemId);
        if (it == input.watchedEmbeddings.end()
            || !it->second.matchesModel(input.modelId, input.dimensions)) {
            ++result.skippedIncompatible;
            continue;
        }

        const double weight = engagementWeight(item)
            * recencyWeight(item.lastPlayedAt, input.nowEpoch)
            * ratingWeight(item.userRating)
            * franchises.factor(item.franchise)
            * genres.factor(item.genres);
        if (!(weight > 0.0) || !std::isfinite(weight)) {
            continue;
        }

        accumulate(sum, it->second.values, weight);
        totalWeight += weight;
        ++result.watchedContributions;
    }

    for (const CustomInterest& interest : input.customInterests) {
        if (!interest.embedding.has_value()
            || !interest.embedding->matchesModel(input.modelId, input.dimensions)) {
            continue;
        }
        const double weight = std::max(interest.weight, 0.0) * m_settings.customInterestWeight;
        if (weight <= 0.0) {
            continue;
        }
        accumulate(sum, interest.embedding->values, weight);
        totalWeight += weight;
        ++result.interestContributions;
    }

    if (totalWeight <= 0.0) {
        result.error = RecError::make(
            RecErrorCode::InsufficientData,
            QStringLiteral("no watched items or interests with %1 embeddings")
                .arg(QString::fromStdString(input.modelId)));
        return result;
    }

    std::vector<float> mean(sum.size());
    for (size_t i = 0; i < sum.size(); ++i) {
        mean[i] = static_cast<float>(sum[i] / totalWeight);
    }

    EmbeddingVector embedding(input.modelId, std::move(mean));
    if (embedding.norm() <= 0.0) {
        result.error = RecError::make(RecErrorCode::InsufficientData,
                                      QStringLiteral("contributing vectors cancel out"));
        return result;
    }
    result.embedding = embedding.normalized();

    if (result.skippedIncompatible > 0) {
        LOG_DEBUG(rpTaste, "Skipped %d watched items without a compatible embedding",
                  result.skippedIncompatible);
    }
    return result;
}

} // namespace rp
