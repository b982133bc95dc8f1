#include "writer_xml.hpp"

#include <sstream>

#include <pugixml.hpp>

bool write_ordered_manifest(
    const std::filesystem::path& out_path,
    const FragmentBatch& batch,
    const std::vector<Segment>& ordered,
    bool computed_order,
    std::string& error
) {
    if (ordered.size() != batch.segments.size()) {
        error = "Ordering size does not match fragment count for XML writer";
        return false;
    }

    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("fragments");
    root.append_attribute("name") = batch.name.c_str();
    root.append_attribute("ordered") = computed_order ? "true" : "false";

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const auto& seg = ordered[i];

        auto node = root.append_child("fragment");
        node.append_attribute("name") = seg.id.c_str();
        node.append_attribute("upload-index") = static_cast<unsigned long long>(seg.index);
        node.append_attribute("position") = static_cast<unsigned long long>(i);

        std::istringstream lines(seg.text);
        std::string line;
        while (std::getline(lines, line)) {
            node.append_child("line").text().set(line.c_str());
        }
    }

    if (!doc.save_file(out_path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        error = "Failed to write ordered manifest: " + out_path.string();
        return false;
    }

    return true;
}
