#include "fragment_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <pugixml.hpp>

namespace {

std::string local_name(const char* raw_name) {
    if (raw_name == nullptr) {
        return {};
    }
    std::string name(raw_name);
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

bool has_extension(const std::filesystem::path& path, const std::string& wanted) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == wanted;
}

std::string trim(const std::string& s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };

    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_ws(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && is_ws(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

void collect_text(const pugi::xml_node& node, std::string& out) {
    if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
        out.append(node.value());
        return;
    }

    if (node.type() != pugi::node_element) {
        return;
    }

    // <line> children are explicit line breaks.
    const bool is_line = local_name(node.name()) == "line";
    if (is_line) {
        out.push_back('\n');
    }
    for (const auto& child : node.children()) {
        collect_text(child, out);
    }
    if (is_line) {
        out.push_back('\n');
    }
}

bool is_under(const std::filesystem::path& candidate, const std::filesystem::path& root) {
    std::error_code ec;
    const auto candidate_abs = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return false;
    }
    const auto root_abs = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }
    const auto relative = candidate_abs.lexically_relative(root_abs);
    if (relative.empty()) {
        return false;
    }
    const auto first = *relative.begin();
    return first != "..";
}

}  // namespace

std::string normalize_extracted_text(const std::string& raw) {
    std::istringstream lines(raw);
    std::string line;
    std::string out;

    while (std::getline(lines, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += trimmed;
    }

    return out;
}

bool read_fragment_manifest(const std::filesystem::path& path, FragmentBatch& out_batch, std::string& error) {
    out_batch = FragmentBatch{};
    out_batch.source_path = path;
    out_batch.name = path.stem().string();

    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parse) {
        error = "Failed to parse XML " + path.string() + ": " + parse.description();
        return false;
    }

    const auto root = doc.document_element();
    if (!root || local_name(root.name()) != "fragments") {
        error = "Not a fragment manifest (expected <fragments> root): " + path.string();
        return false;
    }

    if (const auto attr = root.attribute("name")) {
        out_batch.name = attr.value();
    }

    for (const auto& node : root.children()) {
        if (node.type() != pugi::node_element || local_name(node.name()) != "fragment") {
            continue;
        }

        Segment segment;
        segment.index = out_batch.segments.size();
        if (const auto attr = node.attribute("name")) {
            segment.id = attr.value();
        } else {
            segment.id = "fragment-" + std::to_string(segment.index);
        }

        std::string raw_text;
        collect_text(node, raw_text);
        segment.text = normalize_extracted_text(raw_text);

        out_batch.segments.push_back(std::move(segment));
    }

    return true;
}

bool read_text_directory(const std::filesystem::path& dir, FragmentBatch& out_batch, std::string& error) {
    out_batch = FragmentBatch{};
    out_batch.source_path = dir;
    out_batch.name = dir.filename().empty() ? dir.parent_path().filename().string() : dir.filename().string();

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    std::filesystem::directory_iterator it(dir, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_extension(it->path(), ".txt")) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        error = "Failed to list directory " + dir.string() + ": " + ec.message();
        return false;
    }

    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            error = "Failed to open fragment text: " + file.string();
            return false;
        }
        std::ostringstream content;
        content << in.rdbuf();

        Segment segment;
        segment.index = out_batch.segments.size();
        segment.id = file.filename().string();
        segment.text = normalize_extracted_text(content.str());
        out_batch.segments.push_back(std::move(segment));
    }

    return true;
}

bool collect_fragment_batches(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<FragmentBatch>& out_batches,
    std::string& error
) {
    out_batches.clear();

    std::error_code ec;
    const auto status = std::filesystem::status(input, ec);
    if (!std::filesystem::exists(status)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(status)) {
        if (!has_extension(input, ".xml")) {
            error = "Input file is not an XML manifest: " + input.string();
            return false;
        }
        FragmentBatch batch;
        if (!read_fragment_manifest(input, batch, error)) {
            return false;
        }
        out_batches.push_back(std::move(batch));
        return true;
    }

    if (!std::filesystem::is_directory(status)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    const bool skip_output_subtree = !output_dir.empty() && is_under(output_dir, input);

    std::vector<std::filesystem::path> manifests;
    std::filesystem::recursive_directory_iterator it(input, ec);
    for (const std::filesystem::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !has_extension(it->path(), ".xml")) {
            continue;
        }
        if (skip_output_subtree && is_under(it->path(), output_dir)) {
            continue;
        }
        manifests.push_back(it->path());
    }
    if (ec) {
        error = "Failed to scan directory " + input.string() + ": " + ec.message();
        return false;
    }

    std::sort(manifests.begin(), manifests.end());

    if (manifests.empty()) {
        FragmentBatch batch;
        if (!read_text_directory(input, batch, error)) {
            return false;
        }
        if (batch.segments.empty()) {
            error = "No fragment manifests or text files found under: " + input.string();
            return false;
        }
        out_batches.push_back(std::move(batch));
        return true;
    }

    for (const auto& manifest : manifests) {
        FragmentBatch batch;
        if (!read_fragment_manifest(manifest, batch, error)) {
            return false;
        }
        out_batches.push_back(std::move(batch));
    }

    return true;
}
