#include "core/vector/candidate_filter.h"

#include <QStringList>

#include <algorithm>
#include <utility>

namespace rp {

namespace {

QString placeholders(int count)
{
    QStringList marks;
    marks.reserve(count);
    for (int i = 0; i < count; ++i) {
        marks.append(QStringLiteral("?"));
    }
    return marks.join(QStringLiteral(", "));
}

} // namespace

CandidateFilter CandidateFilter::mediaType(MediaType type)
{
    CandidateFilter filter;
    Clause clause;
    clause.kind = Kind::MediaType;
    clause.mediaType = type;
    filter.m_clauses.push_back(std::move(clause));
    return filter;
}

CandidateFilter CandidateFilter::libraryScope(const std::vector<QString>& libraryIds)
{
    CandidateFilter filter;
    Clause clause;
    clause.kind = Kind::LibraryScope;
    clause.libraryIds = libraryIds;
    filter.m_clauses.push_back(std::move(clause));
    return filter;
}

CandidateFilter CandidateFilter::parentalCeiling(int maxValue)
{
    CandidateFilter filter;
    Clause clause;
    clause.kind = Kind::ParentalCeiling;
    clause.ceiling = maxValue;
    filter.m_clauses.push_back(std::move(clause));
    return filter;
}

CandidateFilter CandidateFilter::excludeItems(const std::unordered_set<int64_t>& itemIds)
{
    CandidateFilter filter;
    Clause clause;
    clause.kind = Kind::ExcludeItems;
    clause.excluded = std::make_shared<const std::unordered_set<int64_t>>(itemIds);
    filter.m_clauses.push_back(std::move(clause));
    return filter;
}

CandidateFilter CandidateFilter::operator&&(const CandidateFilter& other) const
{
    CandidateFilter combined = *this;
    combined.m_clauses.insert(combined.m_clauses.end(),
                              other.m_clauses.begin(), other.m_clauses.end());
    return combined;
}

bool CandidateFilter::clauseMatches(const Clause& clause, const CatalogItem& item)
{
    switch (clause.kind) {
    case Kind::MediaType:
        return item.mediaType == clause.mediaType;
    case Kind::LibraryScope:
        return std::find(clause.libraryIds.begin(), clause.libraryIds.end(), item.libraryId)
               != clause.libraryIds.end();
    case Kind::ParentalCeiling:
        return item.parentalRatingValue.value_or(0) <= clause.ceiling;
    case Kind::ExcludeItems:
        return !clause.excluded || clause.excluded->count(item.id) == 0;
    }
    return false;
}

bool CandidateFilter::matches(const CatalogItem& item) const
{
    return std::all_of(m_clauses.begin(), m_clauses.end(), [&item](const Clause& clause) {
        return clauseMatches(clause, item);
    });
}

CandidateFilter::SqlPredicate CandidateFilter::toSql(const QString& itemAlias,
                                                     const QString& ratingAlias) const
{
    SqlPredicate predicate;
    QStringList parts;

    for (const Clause& clause : m_clauses) {
        switch (clause.kind) {
        case Kind::MediaType:
            parts.append(QStringLiteral("%1.media_type = ?").arg(itemAlias));
            predicate.binds.append(mediaTypeToString(clause.mediaType));
            break;
        case Kind::LibraryScope:
            if (clause.libraryIds.empty()) {
                parts.append(QStringLiteral("0"));
                break;
            }
            parts.append(QStringLiteral("%1.library_id IN (%2)")
                             .arg(itemAlias,
                                  placeholders(static_cast<int>(clause.libraryIds.size()))));
            for (const QString& id : clause.libraryIds) {
                predicate.binds.append(id);
            }
            break;
        case Kind::ParentalCeiling:
            parts.append(QStringLiteral("COALESCE(%1.value, 0) <= ?").arg(ratingAlias));
            predicate.binds.append(clause.ceiling);
            break;
        case Kind::ExcludeItems: {
            if (!clause.excluded || clause.excluded->empty()) {
                break;
            }
            // Sorted so the rendered SQL is stable for identical inputs
            std::vector<int64_t> ids(clause.excluded->begin(), clause.excluded->end());
            std::sort(ids.begin(), ids.end());
            parts.append(QStringLiteral("%1.id NOT IN (%2)")
                             .arg(itemAlias, placeholders(static_cast<int>(ids.size()))));
            for (int64_t id : ids) {
                predicate.binds.append(static_cast<qlonglong>(id));
            }
            break;
        }
        }
    }

    predicate.sql = parts.isEmpty() ? QStringLiteral("1") : parts.join(QStringLiteral(" AND "));
    return predicate;
}

bool CandidateFilter::hasExclusion() const
{
    return std::any_of(m_clauses.begin(), m_clauses.end(), [](const Clause& clause) {
        return clause.kind == Kind::ExcludeItems && clause.excluded && !clause.excluded->empty();
    });
}

bool CandidateFilter::isExcluded(int64_t itemId) const
{
    for (const Clause& clause : m_clauses) {
        if (clause.kind == Kind::ExcludeItems && clause.excluded
            && clause.excluded->count(itemId) > 0) {
            return true;
        }
    }
    return false;
}

std::optional<MediaType> CandidateFilter::mediaTypeConstraint() const
{
    for (const Clause& clause : m_clauses) {
        if (clause.kind == Kind::MediaType) {
            return clause.mediaType;
        }
    }
    return std::nullopt;
}

CandidateFilter CandidateFilter::withoutExclusion() const
{
    CandidateFilter filter;
    for (const Clause& clause : m_clauses) {
        if (clause.kind != Kind::ExcludeItems) {
            filter.m_clauses.push_back(clause);
        }
    }
    return filter;
}

} // namespace rp
