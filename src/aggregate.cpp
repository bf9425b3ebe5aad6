#include "kiln/aggregate.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace kiln {

std::string slugify(std::string_view text) {
    std::string slug;
    slug.reserve(text.size());
    bool pending_dash = false;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            if (pending_dash && !slug.empty())
                slug.push_back('-');
            pending_dash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

std::string expand_output(std::string_view pattern, std::string_view key) {
    static constexpr std::string_view PLACEHOLDER = "{key}";
    std::string out;
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t hit = pattern.find(PLACEHOLDER, pos);
        if (hit == std::string_view::npos) {
            out.append(pattern.substr(pos));
            break;
        }
        out.append(pattern.substr(pos, hit - pos));
        out.append(key);
        pos = hit + PLACEHOLDER.size();
    }
    return out;
}

bool matches(const AggregateSpec &spec, const PageMeta &meta) {
    if (meta.draft)
        return false;
    switch (spec.kind) {
    case AggregateKind::Tag:
        return std::ranges::any_of(meta.tags, [&](const std::string &t) { return slugify(t) == spec.key; });
    case AggregateKind::Section:
        return meta.section == spec.key;
    case AggregateKind::Menu:
        return std::ranges::find(meta.menus, spec.key) != meta.menus.end();
    case AggregateKind::Sitemap:
        return true;
    }
    return false;
}

namespace {

std::set<std::string> distinct_keys(AggregateKind kind, const PageIndex &pages) {
    std::set<std::string> keys;
    for (const auto &[_, meta] : pages) {
        if (meta.draft)
            continue;
        switch (kind) {
        case AggregateKind::Tag:
            for (const auto &t : meta.tags) {
                if (auto slug = slugify(t); !slug.empty())
                    keys.insert(std::move(slug));
            }
            break;
        case AggregateKind::Section:
            if (!meta.section.empty())
                keys.insert(meta.section);
            break;
        case AggregateKind::Menu:
            for (const auto &m : meta.menus) {
                if (!m.empty())
                    keys.insert(m);
            }
            break;
        case AggregateKind::Sitemap:
            break;
        }
    }
    return keys;
}

AggregateInstance instantiate(const AggregateFamily &family, std::string key, const PageIndex &pages) {
    AggregateInstance inst;
    inst.spec = {family.kind, std::move(key)};
    inst.output = expand_output(family.output, inst.spec.key);
    for (const auto &[id, meta] : pages) {
        if (matches(inst.spec, meta))
            inst.members.push_back(id);
    }
    return inst;
}

} // namespace

std::vector<AggregateInstance> evaluate_aggregates(const std::vector<AggregateFamily> &families,
                                                   const PageIndex &pages) {
    std::map<std::string, AggregateInstance> by_output;
    for (const auto &family : families) {
        if (family.kind == AggregateKind::Sitemap || family.key) {
            std::string key = family.key.value_or("");
            if (family.kind == AggregateKind::Tag)
                key = slugify(key);
            auto inst = instantiate(family, std::move(key), pages);
            by_output.try_emplace(inst.output, std::move(inst));
            continue;
        }
        for (const auto &key : distinct_keys(family.kind, pages)) {
            auto inst = instantiate(family, key, pages);
            by_output.try_emplace(inst.output, std::move(inst));
        }
    }

    std::vector<AggregateInstance> out;
    out.reserve(by_output.size());
    for (auto &[_, inst] : by_output)
        out.push_back(std::move(inst));
    return out;
}

} // namespace kiln
