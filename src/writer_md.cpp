#include "writer_md.hpp"

#include <fstream>
#include <sstream>

bool write_markdown_ordering(
    const std::filesystem::path& out_path,
    const FragmentBatch& batch,
    const std::vector<Segment>& ordered,
    bool computed_order,
    std::string& error
) {
    if (ordered.size() != batch.segments.size()) {
        error = "Ordering size does not match fragment count for markdown writer";
        return false;
    }

    std::ofstream out(out_path);
    if (!out) {
        error = "Failed to open markdown output: " + out_path.string();
        return false;
    }

    out << "# " << batch.name << "\n\n";
    if (!computed_order) {
        out << "_Shown in upload order: no reading order could be computed._\n\n";
    }

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const auto& seg = ordered[i];

        out << "## " << (i + 1) << ". " << seg.id << "\n\n";

        // One paragraph line per extracted line keeps the panel's layout.
        std::istringstream lines(seg.text);
        std::string line;
        bool any = false;
        while (std::getline(lines, line)) {
            out << line << "  \n";
            any = true;
        }
        if (!any) {
            out << "_(no text)_\n";
        }
        out << "\n---\n\n";
    }

    if (!out) {
        error = "Failed to write markdown output: " + out_path.string();
        return false;
    }

    return true;
}
