#include "kiln/process_renderer.hpp"

#include "kiln/atomic_file.hpp"
#include "kiln/cache_store.hpp"
#include "kiln/depfile.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/log.hpp"
#include "kiln/process_exec.hpp"

#include <format>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <system_error>
#include <unordered_map>

namespace kiln {

using json = nlohmann::json;

namespace {

constexpr std::string_view OUTPUT_PREFIX = "output:";

struct ScratchFiles {
    std::filesystem::path output;
    std::filesystem::path depfile;
    std::filesystem::path manifest;
    std::filesystem::path meta;

    void remove_all() const {
        std::error_code ec;
        for (const auto *p : {&output, &depfile, &manifest, &meta})
            std::filesystem::remove(*p, ec);
    }
};

ScratchFiles scratch_files(const std::filesystem::path &dir, std::string_view output_id) {
    // One set per output id, so concurrent renders never collide.
    auto stem = fingerprint_bytes(output_id).substr(0, 16);
    return {dir / (stem + ".out"), dir / (stem + ".d"), dir / (stem + ".manifest.json"), dir / (stem + ".meta.json")};
}

json manifest_for(const RenderRequest &request, const SiteSnapshot &site) {
    json m;
    m["output"] = request.output_id;
    m["kind"] = to_string(request.kind);
    m["source_root"] = site.source_root.string();
    m["output_root"] = site.output_root.string();
    if (!request.source_id.empty())
        m["source"] = request.source_id;
    if (request.aggregate) {
        m["aggregate"] = {{"kind", to_string(request.aggregate->kind)}, {"key", request.aggregate->key}};
        json members = json::array();
        for (const auto &id : request.members) {
            json entry = {{"output", id}};
            if (const auto *page = site.output(id)) {
                entry["source"] = page->source;
                entry["meta"] = to_json(page->meta);
            }
            members.push_back(std::move(entry));
        }
        m["members"] = std::move(members);
    }
    return m;
}

} // namespace

std::string substitute(std::string_view arg, const std::vector<std::pair<std::string_view, std::string>> &values) {
    std::string out;
    out.reserve(arg.size());
    size_t i = 0;
    while (i < arg.size()) {
        if (arg[i] == '{') {
            auto close = arg.find('}', i);
            if (close != std::string_view::npos) {
                auto name = arg.substr(i + 1, close - i - 1);
                auto it = std::find_if(values.begin(), values.end(), [&](const auto &kv) { return kv.first == name; });
                if (it != values.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += arg[i++];
    }
    return out;
}

std::optional<Dependency> dependency_from_depfile_entry(std::string_view entry,
                                                        const std::filesystem::path &source_root) {
    if (entry.starts_with(OUTPUT_PREFIX)) {
        auto id = entry.substr(OUTPUT_PREFIX.size());
        if (id.empty())
            return std::nullopt;
        return Dependency{DependencyKind::Output, std::string(id), {}};
    }

    std::filesystem::path p(entry);
    if (p.is_absolute()) {
        p = p.lexically_normal().lexically_relative(source_root.lexically_normal());
        if (p.empty())
            return std::nullopt;
    }
    p = p.lexically_normal();
    if (p.empty() || *p.begin() == ".." || p == ".")
        return std::nullopt;
    return Dependency{DependencyKind::Source, p.generic_string(), {}};
}

ProcessRenderer::ProcessRenderer(Options options) : options_(std::move(options)) {
}

Result<RenderOutput> ProcessRenderer::render(const RenderRequest &request, RenderContext &context) {
    if (options_.command.empty())
        return std::unexpected("render.command is empty");

    std::error_code ec;
    std::filesystem::create_directories(options_.scratch_dir, ec);
    if (ec)
        return std::unexpected(std::format("cannot create {}: {}", options_.scratch_dir.string(), ec.message()));

    auto files = scratch_files(options_.scratch_dir, request.output_id);
    files.remove_all();

    if (auto res = write_file_atomic(files.manifest, manifest_for(request, context.site).dump(), false); !res)
        return std::unexpected(res.error());

    std::string source;
    if (!request.source_id.empty())
        source = (context.site.source_root / request.source_id).string();

    const std::vector<std::pair<std::string_view, std::string>> values = {
        {"source", source},
        {"output", files.output.string()},
        {"depfile", files.depfile.string()},
        {"manifest", files.manifest.string()},
        {"meta", files.meta.string()},
    };
    std::vector<std::string> args;
    args.reserve(options_.command.size());
    for (const auto &arg : options_.command)
        args.push_back(substitute(arg, values));

    ProcessOptions popts;
    popts.working_dir = context.site.source_root.string();
    popts.env = std::unordered_map<std::string, std::string>{{"KILN_OUTPUT_ID", request.output_id}};
    popts.deadline = options_.timeout;

    auto status = process_exec(std::move(args), popts);
    if (!status) {
        files.remove_all();
        return std::unexpected(status.error());
    }
    if (*status != 0) {
        files.remove_all();
        return std::unexpected(std::format("renderer exited with code {}", *status));
    }

    auto bytes = read_file(files.output);
    if (!bytes) {
        files.remove_all();
        return std::unexpected(std::format("renderer produced no output: {}", bytes.error()));
    }

    RenderOutput out;
    out.bytes = std::move(*bytes);

    if (std::filesystem::exists(files.depfile, ec)) {
        auto dep = parse_depfile(files.depfile);
        if (!dep) {
            files.remove_all();
            return std::unexpected(dep.error());
        }
        for (const auto &entry : dep->dependencies) {
            if (auto d = dependency_from_depfile_entry(entry, context.site.source_root))
                out.dependencies.push_back(std::move(*d));
            else
                log_debug("{}: ignoring dependency outside the source root: {}", request.output_id, entry);
        }
    } else {
        log_debug("{}: renderer wrote no depfile", request.output_id);
    }

    if (std::filesystem::exists(files.meta, ec)) {
        auto text = read_file(files.meta);
        if (!text) {
            files.remove_all();
            return std::unexpected(text.error());
        }
        try {
            out.meta = page_meta_from_json(json::parse(*text));
        } catch (const json::exception &e) {
            files.remove_all();
            return std::unexpected(std::format("invalid metadata: {}", e.what()));
        }
    }

    files.remove_all();
    return out;
}

} // namespace kiln
