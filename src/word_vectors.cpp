#include "word_vectors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

struct WordVectorTable::Data {
    std::size_t dimensions = 0;
    std::unordered_map<std::string, std::size_t> rows;
    std::vector<float> values;

    void add(std::string word, const float* vector) {
        if (rows.contains(word)) {
            return;
        }
        rows.emplace(std::move(word), rows.size());
        values.insert(values.end(), vector, vector + dimensions);
    }
};

namespace {

bool has_bin_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".bin";
}

void read_header(std::istream& in, const std::filesystem::path& path, std::size_t& count, std::size_t& dimensions) {
    std::string header;
    if (!std::getline(in, header)) {
        throw std::runtime_error("Empty word2vec file: " + path.string());
    }

    std::istringstream fields(header);
    if (!(fields >> count >> dimensions) || dimensions == 0) {
        throw std::runtime_error("Invalid word2vec header in " + path.string() + ": '" + header + "'");
    }
}

// Upper bound on the entries the rest of the file can hold: each needs at least
// one word byte plus a separator and a value per dimension.
std::size_t entries_that_fit(std::uintmax_t remaining, std::size_t dimensions, WordVectorFormat format) {
    const std::uintmax_t per_value = format == WordVectorFormat::Binary ? sizeof(float) : 2;
    if (dimensions > remaining / per_value) {
        return 0;
    }
    const std::uintmax_t per_entry = dimensions * per_value + 1;
    return static_cast<std::size_t>(
        std::min<std::uintmax_t>(remaining / per_entry, std::numeric_limits<std::size_t>::max())
    );
}

}  // namespace

WordVectorTable::WordVectorTable(std::shared_ptr<const Data> data) : data_(std::move(data)) {}

WordVectorTable WordVectorTable::load_word2vec(
    const std::filesystem::path& path,
    WordVectorFormat format,
    std::size_t limit
) {
    if (format == WordVectorFormat::Auto) {
        format = has_bin_extension(path) ? WordVectorFormat::Binary : WordVectorFormat::Text;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open word2vec file: " + path.string());
    }

    std::size_t count = 0;
    auto data = std::make_shared<Data>();
    read_header(in, path, count, data->dimensions);
    if (limit != 0) {
        count = std::min(count, limit);
    }

    if (count == 0) {
        return WordVectorTable(std::move(data));
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    const std::streamoff body_start = in.tellg();
    if (!ec && body_start >= 0) {
        const auto offset = static_cast<std::uintmax_t>(body_start);
        const std::uintmax_t remaining = file_size > offset ? file_size - offset : 0;
        const std::size_t fit = entries_that_fit(remaining, data->dimensions, format);
        if (fit == 0) {
            throw std::runtime_error(
                "word2vec header in " + path.string() + " declares " + std::to_string(count) +
                " vectors of dimension " + std::to_string(data->dimensions) + " but the file holds none"
            );
        }
        const std::size_t expected = std::min(count, fit);
        data->rows.reserve(expected);
        data->values.reserve(expected * data->dimensions);
    }
    std::vector<float> vector(data->dimensions);

    if (format == WordVectorFormat::Text) {
        std::string line;
        std::size_t line_no = 1;
        while (data->rows.size() < count && std::getline(in, line)) {
            ++line_no;
            std::istringstream fields(line);
            std::string word;
            if (!(fields >> word)) {
                continue;
            }
            for (std::size_t d = 0; d < data->dimensions; ++d) {
                if (!(fields >> vector[d])) {
                    throw std::runtime_error(
                        "Truncated vector for '" + word + "' at " + path.string() + ":" + std::to_string(line_no)
                    );
                }
            }
            data->add(std::move(word), vector.data());
        }
    } else {
        for (std::size_t entry = 0; entry < count; ++entry) {
            std::string word;
            char ch = 0;
            while (in.get(ch) && ch != ' ') {
                if (ch != '\n') {
                    word.push_back(ch);
                }
            }
            if (!in) {
                throw std::runtime_error(
                    "Unexpected end of word2vec file " + path.string() + " at entry " + std::to_string(entry)
                );
            }

            in.read(reinterpret_cast<char*>(vector.data()), static_cast<std::streamsize>(vector.size() * sizeof(float)));
            if (!in) {
                throw std::runtime_error(
                    "Truncated vector for '" + word + "' in " + path.string() + " at entry " + std::to_string(entry)
                );
            }
            data->add(std::move(word), vector.data());
        }
    }

    return WordVectorTable(std::move(data));
}

WordVectorTable WordVectorTable::from_entries(std::size_t dimensions, const std::vector<Entry>& entries) {
    auto data = std::make_shared<Data>();
    data->dimensions = dimensions;
    for (const auto& [word, vector] : entries) {
        if (vector.size() != dimensions) {
            throw std::invalid_argument(
                "Vector for '" + word + "' has " + std::to_string(vector.size()) + " dimensions, expected " +
                std::to_string(dimensions)
            );
        }
        data->add(word, vector.data());
    }
    return WordVectorTable(std::move(data));
}

std::unique_ptr<WordEmbedder> WordVectorTable::clone() const {
    return std::unique_ptr<WordEmbedder>(new WordVectorTable(data_));
}

bool WordVectorTable::embed(const std::string& word, std::vector<float>& out_vector) {
    const auto it = data_->rows.find(word);
    if (it == data_->rows.end()) {
        return false;
    }

    const auto begin = data_->values.begin() + static_cast<std::ptrdiff_t>(it->second * data_->dimensions);
    out_vector.assign(begin, begin + static_cast<std::ptrdiff_t>(data_->dimensions));
    return true;
}

std::size_t WordVectorTable::size() const {
    return data_->rows.size();
}

std::size_t WordVectorTable::dimensions() const {
    return data_->dimensions;
}

bool WordVectorTable::contains(const std::string& word) const {
    return data_->rows.contains(word);
}
