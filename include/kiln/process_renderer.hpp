#pragma once

#include "kiln/renderer.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kiln {

/**
 * @brief Renders each output by running an external command.
 *
 * Every argument of `command` may contain the placeholders `{source}`,
 * `{output}`, `{depfile}`, `{manifest}` and `{meta}`. The command runs in the
 * source root, writes the rendered bytes to `{output}`, lists what it consulted
 * in a Makefile-style depfile at `{depfile}` and may leave page metadata as
 * JSON at `{meta}`. `{manifest}` is a JSON description of the request.
 */
class ProcessRenderer : public Renderer {
public:
    struct Options {
        std::vector<std::string> command;
        std::chrono::milliseconds timeout{60000};
        std::filesystem::path scratch_dir;
    };

    explicit ProcessRenderer(Options options);

    Result<RenderOutput> render(const RenderRequest &request, RenderContext &context) override;

private:
    Options options_;
};

/// @brief Replaces every `{name}` in `arg` with its value; unknown names are left as is.
std::string substitute(std::string_view arg, const std::vector<std::pair<std::string_view, std::string>> &values);

/**
 * @brief Maps one depfile entry to a dependency.
 *
 * `output:<id>` names an output. Anything else is a path, relative to the
 * source root or absolute inside it. Paths outside the source root yield
 * nothing.
 */
std::optional<Dependency> dependency_from_depfile_entry(std::string_view entry,
                                                        const std::filesystem::path &source_root);

} // namespace kiln
