#include "docx/ooxml_package.hpp"
#include "core/utils.hpp"

#include <minizip-ng/mz.h>
#include <minizip-ng/mz_strm.h>
#include <minizip-ng/mz_strm_mem.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>

#include <algorithm>
#include <format>

namespace docredact::docx {

namespace {

// ---- RAII holders for minizip-ng handles ------------------------------------

class MemStream {
public:
    MemStream() : handle_(mz_stream_mem_create()) {}
    ~MemStream() {
        if (!handle_) return;
        if (opened_) mz_stream_close(handle_);
        mz_stream_mem_delete(&handle_);
    }
    MemStream(const MemStream&) = delete;
    MemStream& operator=(const MemStream&) = delete;

    [[nodiscard]] void* get() const { return handle_; }
    [[nodiscard]] int32_t open(int32_t mode) {
        const int32_t rc = mz_stream_open(handle_, nullptr, mode);
        opened_ = rc == MZ_OK;
        return rc;
    }

private:
    void* handle_;
    bool opened_ = false;
};

class ZipReader {
public:
    ZipReader() : handle_(mz_zip_reader_create()) {}
    ~ZipReader() {
        if (!handle_) return;
        if (opened_) mz_zip_reader_close(handle_);
        mz_zip_reader_delete(&handle_);
    }
    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    [[nodiscard]] void* get() const { return handle_; }
    [[nodiscard]] int32_t open(void* stream) {
        const int32_t rc = mz_zip_reader_open(handle_, stream);
        opened_ = rc == MZ_OK;
        return rc;
    }

private:
    void* handle_;
    bool opened_ = false;
};

class ZipWriter {
public:
    ZipWriter() : handle_(mz_zip_writer_create()) {}
    ~ZipWriter() {
        if (!handle_) return;
        if (opened_) mz_zip_writer_close(handle_);
        mz_zip_writer_delete(&handle_);
    }
    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    [[nodiscard]] void* get() const { return handle_; }
    [[nodiscard]] int32_t open(void* stream) {
        const int32_t rc = mz_zip_writer_open(handle_, stream, 0);
        opened_ = rc == MZ_OK;
        return rc;
    }
    // Flushes the central directory; must happen before the buffer is read
    [[nodiscard]] int32_t close() {
        opened_ = false;
        return mz_zip_writer_close(handle_);
    }

private:
    void* handle_;
    bool opened_ = false;
};

bool matches_numbered(std::string_view name, std::string_view prefix, std::string_view suffix) {
    if (!name.starts_with(prefix) || !name.ends_with(suffix)) return false;
    if (name.size() < prefix.size() + suffix.size()) return false;
    const auto middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    return std::all_of(middle.begin(), middle.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

Result<OoxmlPackage> OoxmlPackage::open(std::string_view bytes) {
    using R = Result<OoxmlPackage>;
    if (bytes.empty()) {
        return R::error(ErrorCategory::PARSE_ERROR, "Archive is empty");
    }

    MemStream stream;
    if (!stream.get()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "minizip: cannot create memory stream");
    }
    mz_stream_mem_set_buffer(stream.get(), const_cast<char*>(bytes.data()),
                             static_cast<int32_t>(bytes.size()));
    if (const int32_t rc = stream.open(MZ_OPEN_MODE_READ); rc != MZ_OK) {
        return R::error(ErrorCategory::PARSE_ERROR, std::format("minizip: stream open failed rc={}", rc));
    }
    mz_stream_seek(stream.get(), 0, MZ_SEEK_SET);

    ZipReader reader;
    if (!reader.get()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "minizip: cannot create zip reader");
    }
    if (const int32_t rc = reader.open(stream.get()); rc != MZ_OK) {
        return R::error(ErrorCategory::PARSE_ERROR, std::format("Not a readable ZIP archive (rc={})", rc));
    }

    OoxmlPackage package;
    if (mz_zip_reader_goto_first_entry(reader.get()) != MZ_OK) {
        return R::error(ErrorCategory::PARSE_ERROR, "ZIP archive has no entries");
    }

    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(reader.get(), &info) != MZ_OK || !info || !info->filename) {
            return R::error(ErrorCategory::PARSE_ERROR, "Unreadable ZIP entry header");
        }

        std::string name = info->filename;
        std::replace(name.begin(), name.end(), '\\', '/');

        if (mz_zip_reader_entry_is_dir(reader.get()) == MZ_OK || name.ends_with('/')) {
            continue;
        }
        if (!is_safe_entry_name(name)) {
            return R::error(ErrorCategory::PARSE_ERROR, std::format("Unsafe ZIP entry name: {}", name));
        }
        if (info->uncompressed_size < 0 || info->uncompressed_size > kMaxEntrySize) {
            return R::error(ErrorCategory::PARSE_ERROR,
                std::format("ZIP entry {} has unreasonable size {}", name, info->uncompressed_size));
        }

        Entry entry{std::move(name), std::string(static_cast<size_t>(info->uncompressed_size), '\0')};
        if (!entry.data.empty()) {
            if (const int32_t rc = mz_zip_reader_entry_open(reader.get()); rc != MZ_OK) {
                return R::error(ErrorCategory::PARSE_ERROR,
                    std::format("Cannot open ZIP entry {} (rc={})", entry.name, rc));
            }
            const int32_t rc = mz_zip_reader_entry_save_buffer(
                reader.get(), entry.data.data(), static_cast<int32_t>(entry.data.size()));
            mz_zip_reader_entry_close(reader.get());
            if (rc != MZ_OK) {
                return R::error(ErrorCategory::PARSE_ERROR,
                    std::format("Cannot inflate ZIP entry {} (rc={})", entry.name, rc));
            }
        }
        package.entries_.push_back(std::move(entry));
    } while (mz_zip_reader_goto_next_entry(reader.get()) == MZ_OK);

    return R::ok(std::move(package));
}

// ============================================================================
// Writing
// ============================================================================

Result<std::string> OoxmlPackage::to_bytes() const {
    using R = Result<std::string>;

    MemStream stream;
    if (!stream.get()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "minizip: cannot create memory stream");
    }
    mz_stream_mem_set_grow_size(stream.get(), 64 * 1024);
    if (const int32_t rc = stream.open(MZ_OPEN_MODE_CREATE); rc != MZ_OK) {
        return R::error(ErrorCategory::IO_ERROR, std::format("minizip: stream create failed rc={}", rc));
    }

    ZipWriter writer;
    if (!writer.get()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "minizip: cannot create zip writer");
    }
    if (const int32_t rc = writer.open(stream.get()); rc != MZ_OK) {
        return R::error(ErrorCategory::IO_ERROR, std::format("minizip: writer open failed rc={}", rc));
    }
    mz_zip_writer_set_compress_method(writer.get(), MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(writer.get(), MZ_COMPRESS_LEVEL_DEFAULT);

    for (const auto& entry : entries_) {
        mz_zip_file info = {};
        info.filename = entry.name.c_str();
        info.flag |= MZ_ZIP_FLAG_UTF8;
        info.uncompressed_size = static_cast<int64_t>(entry.data.size());
        info.compression_method = MZ_COMPRESS_METHOD_DEFLATE;

        const int32_t rc = mz_zip_writer_add_buffer(
            writer.get(),
            entry.data.empty() ? nullptr : const_cast<char*>(entry.data.data()),
            static_cast<int32_t>(entry.data.size()),
            &info);
        if (rc != MZ_OK) {
            return R::error(ErrorCategory::IO_ERROR,
                std::format("minizip: cannot add {} (rc={})", entry.name, rc));
        }
    }

    if (const int32_t rc = writer.close(); rc != MZ_OK) {
        return R::error(ErrorCategory::IO_ERROR, std::format("minizip: writer close failed rc={}", rc));
    }

    const void* buffer = nullptr;
    int32_t length = 0;
    mz_stream_mem_get_buffer(stream.get(), &buffer);
    mz_stream_mem_get_buffer_length(stream.get(), &length);
    if (!buffer || length <= 0) {
        return R::error(ErrorCategory::IO_ERROR, "minizip: output archive is empty");
    }

    // Copy while the stream still owns the buffer
    return R::ok(std::string(static_cast<const char*>(buffer), static_cast<size_t>(length)));
}

// ============================================================================
// Entry access
// ============================================================================

bool OoxmlPackage::contains(std::string_view name) const {
    return find(name) != nullptr;
}

const std::string* OoxmlPackage::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) return &entry.data;
    }
    return nullptr;
}

void OoxmlPackage::put(std::string_view name, std::string data) {
    for (auto& entry : entries_) {
        if (entry.name == name) {
            entry.data = std::move(data);
            return;
        }
    }
    entries_.push_back({std::string(name), std::move(data)});
}

bool OoxmlPackage::remove(std::string_view name) {
    const auto before = entries_.size();
    std::erase_if(entries_, [name](const Entry& e) { return e.name == name; });
    return entries_.size() != before;
}

std::vector<std::string> OoxmlPackage::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(entry.name);
    return out;
}

// ============================================================================
// Part classification
// ============================================================================

bool is_safe_entry_name(std::string_view name) {
    if (name.empty() || name.front() == '/') return false;
    if (name.size() >= 2 && name[1] == ':') return false;

    size_t start = 0;
    while (start <= name.size()) {
        const size_t slash = name.find('/', start);
        const auto segment = name.substr(start, slash == std::string_view::npos ? std::string_view::npos
                                                                                 : slash - start);
        if (segment == "..") return false;
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return true;
}

bool is_wordprocessing_part(std::string_view name) {
    return name == kDocumentPart ||
           name == "word/footnotes.xml" ||
           name == "word/endnotes.xml" ||
           name == "word/comments.xml" ||
           matches_numbered(name, "word/header", ".xml") ||
           matches_numbered(name, "word/footer", ".xml");
}

bool is_custom_xml_part(std::string_view name) {
    return matches_numbered(name, "customXml/item", ".xml");
}

bool is_xml_part(std::string_view name) {
    return name.ends_with(".xml") || name.ends_with(".rels");
}

std::vector<std::string> wordprocessing_parts(const OoxmlPackage& package) {
    std::vector<std::string> parts;
    if (package.contains(kDocumentPart)) parts.emplace_back(kDocumentPart);
    for (const auto& entry : package.entries()) {
        if (entry.name != kDocumentPart && is_wordprocessing_part(entry.name)) {
            parts.push_back(entry.name);
        }
    }
    return parts;
}

} // namespace docredact::docx
