#include "kiln/depfile.hpp"

#include "kiln/atomic_file.hpp"

#include <format>
#include <cctype>

namespace kiln {

Depfile parse_depfile_content(std::string_view content) {
    Depfile result;
    std::string current_token;
    bool in_target = true;
    bool first_rule = true;
    bool escape = false;

    auto flush = [&] {
        if (current_token.empty())
            return;
        if (!in_target)
            result.dependencies.push_back(std::move(current_token));
        else if (first_rule)
            result.target = std::move(current_token);
        current_token.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (escape) {
            if (c == '\n') {
                // line continuation
            } else if (c == '\r') {
                if (i + 1 < content.size() && content[i + 1] == '\n') {
                    i++;
                }
            } else {
                current_token += c;
            }
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == ':' && in_target) {
            flush();
            in_target = false;
        } else if (c == '\n') {
            flush();
            if (!in_target) {
                in_target = true;
                first_rule = false;
            }
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current_token += c;
        }
    }
    flush();

    return result;
}

Result<Depfile> parse_depfile(const std::filesystem::path &path) {
    auto content = read_file(path);
    if (!content)
        return std::unexpected(std::format("Could not open depfile: {}", content.error()));
    return parse_depfile_content(*content);
}

} // namespace kiln
