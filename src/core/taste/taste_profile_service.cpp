#include "core/taste/taste_profile_service.h"
#include "core/embedding/embedding_client.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"
#include "core/taste/preference_learner.h"
#include "core/taste/taste_aggregator.h"
#include "core/taste/taste_store.h"

#include <utility>

namespace rp {

TasteProfileService::TasteProfileService(SQLiteStore& store, TasteStore& tasteStore,
                                         EmbeddingClient* embeddingClient,
                                         const RecommendationSettings& settings)
    : m_store(store)
    , m_tasteStore(tasteStore)
    , m_embeddingClient(embeddingClient)
    , m_settings(settings)
{
}

void TasteProfileService::loadHistory(const QString& userId, MediaType type,
                                      TasteSnapshot& out)
{
    const int limit = m_settings.forMediaType(type).recentWatchLimit;
    out.recentWatched = m_store.watchedItems(userId, type, limit);

    std::vector<int64_t> ids;
    ids.reserve(out.recentWatched.size());
    for (const WatchedItem& item : out.recentWatched) {
        ids.push_back(item.itemId);
    }
    out.watchedEmbeddings =
        m_store.getItemEmbeddings(ids, m_settings.embeddingModelId.toStdString());
}

RecError TasteProfileService::ensureProfile(const QString& userId, MediaType type, bool force,
                                            double nowEpoch, TasteSnapshot& out)
{
    const std::string model = m_settings.embeddingModelId.toStdString();
    const int dims = m_settings.embeddingDimensions;

    TasteProfile stored = m_tasteStore.getProfile(userId, type).value_or(TasteProfile{});
    stored.userId = userId;
    stored.mediaType = type;
    const ProfileState state = stored.state(model, dims, nowEpoch);

    bool reuse = false;
    if (!force) {
        if (stored.isLocked) {
            if (state == ProfileState::Stale) {
                return RecError::make(
                    RecErrorCode::ProfileStale,
                    QStringLiteral("locked profile was built with %1; rebuild required")
                        .arg(QString::fromStdString(stored.embeddingModel())));
            }
            reuse = state != ProfileState::Missing;
        } else {
            reuse = state == ProfileState::Fresh;
        }
    }

    if (!reuse) {
        LOG_INFO(rpTaste, "Rebuilding %s profile for %s (state %s%s)",
                 qUtf8Printable(mediaTypeToString(type)), qUtf8Printable(userId),
                 qUtf8Printable(profileStateToString(state)), force ? ", forced" : "");
        return rebuild(userId, type, nowEpoch, out);
    }

    loadHistory(userId, type, out);
    out.profile = std::move(stored);
    out.rebuilt = false;
    return RecError::none();
}

RecError TasteProfileService::rebuild(const QString& userId, MediaType type, double nowEpoch,
                                      TasteSnapshot& out)
{
    TasteProfile profile = m_tasteStore.getProfile(userId, type).value_or(TasteProfile{});
    profile.userId = userId;
    profile.mediaType = type;

    loadHistory(userId, type, out);

    PreferenceLearner::Options learnerOptions;
    learnerOptions.minFranchiseItems = profile.minFranchiseItems;
    learnerOptions.minFranchiseSize = profile.minFranchiseSize;
    learnerOptions.decayHalfLifeDays = m_settings.preferenceDecayHalfLifeDays;
    const PreferenceLearner learner(learnerOptions);
    const PreferenceLearner::Result learned =
        learner.learn(userId, type, out.recentWatched, m_store.franchiseSizes(type), nowEpoch);

    if (!m_tasteStore.upsertAutoFranchisePreferences(learned.franchises, nowEpoch)
        || !m_tasteStore.upsertAutoGenreWeights(learned.genres, nowEpoch)) {
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("failed to store learned preferences"));
    }

    std::vector<CustomInterest> interests = m_tasteStore.customInterests(userId, type);
    const RecError embedError = embedMissingInterests(interests);
    if (embedError.isError()) {
        return embedError;
    }

    AggregatorInput input;
    input.mediaType = type;
    input.modelId = m_settings.embeddingModelId.toStdString();
    input.dimensions = m_settings.embeddingDimensions;
    input.nowEpoch = nowEpoch;
    input.watched = out.recentWatched;
    input.watchedEmbeddings = out.watchedEmbeddings;
    // Re-read so user-set rows take part alongside the learned ones
    input.franchisePreferences = m_tasteStore.franchisePreferences(userId, type);
    input.genreWeights = m_tasteStore.genreWeights(userId);
    input.customInterests = std::move(interests);

    const TasteAggregator aggregator(m_settings.aggregator);
    AggregationResult aggregated = aggregator.aggregate(input);
    if (aggregated.error.isError()) {
        LOG_INFO(rpTaste, "No profile for %s: %s", qUtf8Printable(userId),
                 qUtf8Printable(aggregated.error.message));
        return aggregated.error;
    }

    profile.embedding = std::move(*aggregated.embedding);
    if (!m_tasteStore.saveAutoProfile(profile, nowEpoch)) {
        return RecError::make(RecErrorCode::StorageFailure,
                              QStringLiteral("failed to save taste profile"));
    }
    profile.autoUpdatedAt = nowEpoch;

    LOG_DEBUG(rpTaste, "Profile for %s built from %d items and %d interests",
              qUtf8Printable(userId), aggregated.watchedContributions,
              aggregated.interestContributions);

    out.profile = std::move(profile);
    out.rebuilt = true;
    return RecError::none();
}

RecError TasteProfileService::embedMissingInterests(std::vector<CustomInterest>& interests)
{
    const std::string model = m_settings.embeddingModelId.toStdString();
    const int dims = m_settings.embeddingDimensions;

    std::vector<size_t> pending;
    std::vector<QString> texts;
    for (size_t i = 0; i < interests.size(); ++i) {
        const CustomInterest& interest = interests[i];
        if (interest.embedding.has_value() && interest.embedding->matchesModel(model, dims)) {
            continue;
        }
        pending.push_back(i);
        texts.push_back(interest.text);
    }
    if (pending.empty()) {
        return RecError::none();
    }
    if (!m_embeddingClient) {
        LOG_WARN(rpTaste, "Skipping %d custom interests: no embedding client",
                 static_cast<int>(pending.size()));
        return RecError::none();
    }

    EmbedResult result = m_embeddingClient->embedBatch(texts);
    if (!result.ok()) {
        return toRecError(*result.error);
    }

    for (size_t j = 0; j < pending.size(); ++j) {
        CustomInterest& interest = interests[pending[j]];
        interest.embedding = EmbeddingVector(model, std::move(result.vectors[j]));
        if (!m_tasteStore.updateInterestEmbedding(interest.id, *interest.embedding)) {
            LOG_WARN(rpTaste, "Failed to cache embedding for interest %lld",
                     static_cast<long long>(interest.id));
        }
    }
    return RecError::none();
}

} // namespace rp
