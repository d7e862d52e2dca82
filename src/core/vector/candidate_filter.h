#pragma once

#include "core/shared/catalog.h"
#include "core/shared/types.h"

#include <QString>
#include <QVariantList>

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace rp {

// Composable retrieval predicate. Each clause can be rendered as a SQL
// predicate for pushdown into a catalog query, or evaluated in memory
// against a hydrated CatalogItem. A default-constructed filter matches
// every item.
//
//   auto filter = CandidateFilter::mediaType(MediaType::Movie)
//              && CandidateFilter::parentalCeiling(13);
class CandidateFilter {
public:
    struct SqlPredicate {
        QString sql;          // never empty; "1" when unconstrained
        QVariantList binds;   // positional, in order of appearance
    };

    CandidateFilter() = default;

    static CandidateFilter mediaType(MediaType type);

    // Restrict to the given libraries. An empty list matches nothing; the
    // open-world case is expressed by not adding this clause at all.
    static CandidateFilter libraryScope(const std::vector<QString>& libraryIds);

    // Items whose numeric parental rating is <= maxValue. Items with no
    // known rating value count as 0.
    static CandidateFilter parentalCeiling(int maxValue);

    static CandidateFilter excludeItems(const std::unordered_set<int64_t>& itemIds);

    CandidateFilter operator&&(const CandidateFilter& other) const;

    bool matches(const CatalogItem& item) const;

    // Columns are referenced through itemAlias (items) and ratingAlias
    // (parental_rating_values joined on official_rating).
    SqlPredicate toSql(const QString& itemAlias = QStringLiteral("i"),
                       const QString& ratingAlias = QStringLiteral("p")) const;

    bool isUnconstrained() const { return m_clauses.empty(); }
    bool hasExclusion() const;
    bool isExcluded(int64_t itemId) const;
    std::optional<MediaType> mediaTypeConstraint() const;

    // Same filter minus every excludeItems clause.
    CandidateFilter withoutExclusion() const;

private:
    enum class Kind {
        MediaType,
        LibraryScope,
        ParentalCeiling,
        ExcludeItems,
    };

    struct Clause {
        Kind kind = Kind::MediaType;
        MediaType mediaType = MediaType::Movie;
        std::vector<QString> libraryIds;
        int ceiling = 0;
        std::shared_ptr<const std::unordered_set<int64_t>> excluded;
    };

    static bool clauseMatches(const Clause& clause, const CatalogItem& item);

    std::vector<Clause> m_clauses;
};

} // namespace rp
