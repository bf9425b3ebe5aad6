#include "kiln/domain.hpp"

#include <array>
#include <utility>

namespace kiln {

namespace {

constexpr std::array<std::pair<SourceKind, std::string_view>, 6> SOURCE_KINDS = {{
    {SourceKind::Content, "content"},
    {SourceKind::Template, "template"},
    {SourceKind::Partial, "partial"},
    {SourceKind::Data, "data"},
    {SourceKind::Config, "config"},
    {SourceKind::Asset, "asset"},
}};

constexpr std::array<std::pair<OutputKind, std::string_view>, 3> OUTPUT_KINDS = {{
    {OutputKind::Page, "page"},
    {OutputKind::Aggregate, "aggregate"},
    {OutputKind::Asset, "asset"},
}};

constexpr std::array<std::pair<AggregateKind, std::string_view>, 4> AGGREGATE_KINDS = {{
    {AggregateKind::Tag, "tag"},
    {AggregateKind::Section, "section"},
    {AggregateKind::Menu, "menu"},
    {AggregateKind::Sitemap, "sitemap"},
}};

template <typename Enum, size_t N>
std::string_view name_of(const std::array<std::pair<Enum, std::string_view>, N> &table, Enum value) {
    for (const auto &[k, name] : table) {
        if (k == value)
            return name;
    }
    return "unknown";
}

template <typename Enum, size_t N>
std::optional<Enum> value_of(const std::array<std::pair<Enum, std::string_view>, N> &table, std::string_view name) {
    for (const auto &[k, n] : table) {
        if (n == name)
            return k;
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(SourceKind kind) {
    return name_of(SOURCE_KINDS, kind);
}

std::string_view to_string(OutputKind kind) {
    return name_of(OUTPUT_KINDS, kind);
}

std::string_view to_string(AggregateKind kind) {
    return name_of(AGGREGATE_KINDS, kind);
}

std::optional<SourceKind> parse_source_kind(std::string_view name) {
    return value_of(SOURCE_KINDS, name);
}

std::optional<OutputKind> parse_output_kind(std::string_view name) {
    return value_of(OUTPUT_KINDS, name);
}

std::optional<AggregateKind> parse_aggregate_kind(std::string_view name) {
    return value_of(AGGREGATE_KINDS, name);
}

} // namespace kiln
