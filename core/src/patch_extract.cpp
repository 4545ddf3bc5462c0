#include "patchbench/patch.h"

#include <algorithm>

namespace patchbench {

namespace {

bool starts_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

std::string ltrim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    return b == std::string::npos ? "" : s.substr(b);
}

bool looks_like_diff(const std::string& body) {
    return (body.find("--- ") != std::string::npos && body.find("+++ ") != std::string::npos) ||
           body.find("\n@@") != std::string::npos || starts_with(body, "@@") ||
           body.find("*** Begin Patch") != std::string::npos;
}

std::string join(const std::vector<std::string>& lines, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; i++) out += lines[i] + "\n";
    return out;
}

} // namespace

std::optional<std::string> extract_patch_from_text(const std::string& text) {
    std::vector<std::string> lines = split_lines(text, nullptr);

    // 1) Begin Patch envelope, verbatim.
    for (size_t i = 0; i < lines.size(); i++) {
        if (ltrim(lines[i]) != "*** Begin Patch") continue;
        size_t j = i + 1;
        while (j < lines.size() && ltrim(lines[j]) != "*** End Patch") j++;
        return join(lines, i, std::min(j + 1, lines.size()));
    }

    // 2) Fenced block tagged diff/patch, or an untagged fence holding a diff.
    for (size_t i = 0; i < lines.size(); i++) {
        std::string t = ltrim(lines[i]);
        if (!starts_with(t, "```")) continue;
        std::string tag = t.substr(3);
        // A fence closes only at the opener's indentation or less; a context
        // line " ```" is diff content.
        const size_t indent = lines[i].size() - t.size();
        size_t j = i + 1;
        while (j < lines.size()) {
            std::string tj = ltrim(lines[j]);
            if (starts_with(tj, "```") && lines[j].size() - tj.size() <= indent) break;
            j++;
        }
        std::string body = join(lines, i + 1, j);
        if (tag == "diff" || tag == "patch" || tag == "udiff" || (tag.empty() && looks_like_diff(body))) {
            if (looks_like_diff(body)) return body;
        }
        i = j;
    }

    // 3) Raw diff embedded in prose: from the first file header to the last
    //    line that still looks like diff content.
    for (size_t i = 0; i + 1 < lines.size(); i++) {
        bool header = (starts_with(lines[i], "--- ") && starts_with(lines[i + 1], "+++ ")) ||
                      starts_with(lines[i], "diff --git ");
        if (!header) continue;
        size_t end = i;
        for (size_t j = i; j < lines.size(); j++) {
            const std::string& l = lines[j];
            if (l.empty()) continue;
            char c = l[0];
            bool diffish = c == ' ' || c == '-' || c == '+' || c == '@' || c == '\\' ||
                           starts_with(l, "diff ") || starts_with(l, "index ") ||
                           starts_with(l, "new file mode") || starts_with(l, "deleted file mode");
            if (!diffish) break;
            end = j + 1;
        }
        return join(lines, i, end);
    }
    return std::nullopt;
}

} // namespace patchbench
