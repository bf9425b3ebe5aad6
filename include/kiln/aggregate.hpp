#pragma once

#include "kiln/domain.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief A configured aggregate: a predicate over the page set plus where its
 * output goes.
 *
 * Without a `key`, a Tag, Section or Menu family expands to one aggregate per
 * distinct value found on pages, and `output` must contain `{key}`.
 */
struct AggregateFamily {
    AggregateKind kind = AggregateKind::Sitemap;
    std::optional<std::string> key;
    std::string output;
};

struct AggregateInstance {
    std::string output;
    AggregateSpec spec;
    std::vector<std::string> members; ///< sorted page output ids
};

using PageIndex = std::map<std::string, PageMeta, std::less<>>;

/// @brief Lowercase, ASCII alphanumerics kept, runs of anything else collapsed to '-'.
std::string slugify(std::string_view text);

std::string expand_output(std::string_view pattern, std::string_view key);

bool matches(const AggregateSpec &spec, const PageMeta &meta);

/**
 * @brief Evaluates every family against the current pages.
 *
 * Drafts never belong to an aggregate. Instances come back ordered by output id.
 * A family with a fixed key produces its aggregate even when nothing matches, so
 * an emptied tag page is rendered empty rather than left stale.
 */
std::vector<AggregateInstance> evaluate_aggregates(const std::vector<AggregateFamily> &families,
                                                   const PageIndex &pages);

} // namespace kiln
