#include "chunk_store.hpp"
#include "../../include/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

const std::string CHUNK_PREFIX = "chunk_";
const std::string CHUNK_SUFFIX = ".bin";
const std::string TEMP_SUFFIX = ".tmp";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A listed entry that vanished since is skipped; any other status failure is a StorageError
bool is_regular_entry(const fs::directory_entry& entry) {
    std::error_code ec;
    bool regular = entry.is_regular_file(ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageError("Cannot stat " + entry.path().string() + ": " + ec.message());
    }
    return regular;
}

} // namespace

bool parse_chunk_filename(const std::string& filename, size_t& ordinal, bool& is_temp) {
    std::string name = filename;
    is_temp = ends_with(name, TEMP_SUFFIX);
    if (is_temp) name.resize(name.size() - TEMP_SUFFIX.size());

    if (name.compare(0, CHUNK_PREFIX.size(), CHUNK_PREFIX) != 0 || !ends_with(name, CHUNK_SUFFIX))
        return false;

    std::string digits = name.substr(CHUNK_PREFIX.size(), name.size() - CHUNK_PREFIX.size() - CHUNK_SUFFIX.size());
    if (digits.empty() || digits.size() > 19) return false;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }))
        return false;
    // reject "chunk_007.bin": chunk_path() never writes leading zeros
    if (digits.size() > 1 && digits[0] == '0') return false;

    ordinal = std::stoull(digits);
    return true;
}

ChunkStore::ChunkStore(const fs::path& root, std::shared_ptr<const ChunkCodec> codec)
    : root_(root), codec_(std::move(codec)) {
    if (!codec_) throw std::invalid_argument("ChunkStore requires a codec");

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("Cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

fs::path ChunkStore::chunk_path(size_t ordinal) const {
    return root_ / (CHUNK_PREFIX + std::to_string(ordinal) + CHUNK_SUFFIX);
}

RecordGroup ChunkStore::load(size_t ordinal) const {
    if (ordinal >= chunk_count_) {
        throw StorageError("chunk " + std::to_string(ordinal) + " does not exist (" +
                           std::to_string(chunk_count_) + " chunks stored)");
    }

    const fs::path path = chunk_path(ordinal);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Failed to open chunk file for reading: " + path.string());
    }

    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StorageError("Failed to read chunk file: " + path.string());
    }
    in.close();

    try {
        return codec_->decode(bytes);
    } catch (const DecodeError& e) {
        throw DecodeError("Corrupt chunk file " + path.string() + ": " + e.what());
    }
}

void ChunkStore::save(size_t ordinal, const RecordGroup& records) {
    if (ordinal > chunk_count_) {
        throw std::invalid_argument("cannot save chunk " + std::to_string(ordinal) + " past the end (" +
                                    std::to_string(chunk_count_) + " chunks stored)");
    }

    // encode first so a failing record leaves the old file untouched
    std::string bytes = codec_->encode(records);

    const fs::path path = chunk_path(ordinal);
    fs::path temp_path = path;
    temp_path += TEMP_SUFFIX;

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Failed to open chunk file for writing: " + temp_path.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw StorageError("Failed to write chunk file: " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StorageError("Failed to replace chunk file " + path.string() + ": " + ec.message());
    }

    if (ordinal == chunk_count_) ++chunk_count_;
}

size_t ChunkStore::delete_all() {
    size_t removed = 0;
    std::error_code ec;

    if (!fs::exists(root_, ec)) {
        chunk_count_ = 0;
        return 0;
    }

    std::vector<fs::path> victims;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        size_t ordinal = 0;
        bool is_temp = false;
        if (is_regular_entry(*it) && parse_chunk_filename(it->path().filename().string(), ordinal, is_temp)) {
            victims.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageError("Cannot list storage root " + root_.string() + ": " + ec.message());
    }

    for (const auto& f : victims) {
        bool existed = fs::remove(f, ec);
        if (ec) {
            throw StorageError("Failed to delete chunk file " + f.string() + ": " + ec.message());
        }
        if (existed) ++removed;
    }

    chunk_count_ = 0;
    return removed;
}

size_t ChunkStore::scan_chunk_count() {
    size_t count = 0;
    std::error_code ec;
    while (fs::is_regular_file(chunk_path(count), ec)) {
        ++count;
    }
    chunk_count_ = count;
    return count;
}

std::vector<fs::path> ChunkStore::existing_chunk_files() const {
    std::vector<std::pair<size_t, fs::path>> found;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        size_t ordinal = 0;
        bool is_temp = false;
        if (is_regular_entry(*it) && parse_chunk_filename(it->path().filename().string(), ordinal, is_temp) && !is_temp) {
            found.emplace_back(ordinal, it->path());
        }
    }
    if (ec) {
        throw StorageError("Cannot list storage root " + root_.string() + ": " + ec.message());
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<fs::path> files;
    files.reserve(found.size());
    for (auto& entry : found) files.push_back(std::move(entry.second));
    return files;
}
