#include "cdjmeta/data/ZipArchive.hpp"

#include <fmt/format.h>
#include <miniz.h>

#include <cstring>
#include <stdexcept>

namespace cdjmeta::data {

namespace {

std::string describeError(mz_zip_archive& zip) {
    const mz_zip_error error = mz_zip_peek_last_error(&zip);
    return mz_zip_get_error_string(error);
}

} // namespace

// =============================================================================
// Implementation structs using miniz
// =============================================================================

struct ZipArchive::Impl {
    mz_zip_archive zip{};
    bool isOpen = false;

    ~Impl() {
        if (isOpen) {
            mz_zip_reader_end(&zip);
        }
    }
};

struct ZipWriter::Impl {
    mz_zip_archive zip{};
    bool isOpen = false;

    ~Impl() {
        if (isOpen) {
            mz_zip_writer_end(&zip);
        }
    }
};

// =============================================================================
// ZipArchive
// =============================================================================

ZipArchive::ZipArchive() : impl_(std::make_unique<Impl>()) {}

ZipArchive::~ZipArchive() = default;

ZipArchive::ZipArchive(ZipArchive&& other) noexcept
    : impl_(std::move(other.impl_)), path_(std::move(other.path_)) {}

ZipArchive& ZipArchive::operator=(ZipArchive&& other) noexcept {
    if (this != &other) {
        impl_ = std::move(other.impl_);
        path_ = std::move(other.path_);
    }
    return *this;
}

bool ZipArchive::open(const std::string& path) {
    close();

    impl_ = std::make_unique<Impl>();
    std::memset(&impl_->zip, 0, sizeof(impl_->zip));

    if (!mz_zip_reader_init_file(&impl_->zip, path.c_str(), 0)) {
        return false;
    }

    impl_->isOpen = true;
    path_ = path;
    return true;
}

void ZipArchive::close() {
    if (impl_ && impl_->isOpen) {
        mz_zip_reader_end(&impl_->zip);
        impl_->isOpen = false;
    }
    path_.clear();
}

bool ZipArchive::isOpen() const {
    return impl_ && impl_->isOpen;
}

size_t ZipArchive::getEntryCount() const {
    if (!isOpen()) return 0;
    return mz_zip_reader_get_num_files(&impl_->zip);
}

bool ZipArchive::exists(const std::string& filename) const {
    if (!isOpen()) return false;
    return mz_zip_reader_locate_file(&impl_->zip, filename.c_str(), nullptr, 0) >= 0;
}

std::optional<std::vector<uint8_t>> ZipArchive::extractToMemory(const std::string& filename) const {
    if (!isOpen()) return std::nullopt;

    const int index = mz_zip_reader_locate_file(&impl_->zip, filename.c_str(), nullptr, 0);
    if (index < 0) return std::nullopt;

    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(&impl_->zip, static_cast<mz_uint>(index), &stat)) {
        throw std::runtime_error(fmt::format("Unable to extract {} from {}: {}", filename, path_, describeError(impl_->zip)));
    }

    std::vector<uint8_t> data(static_cast<size_t>(stat.m_uncomp_size));
    if (!data.empty() &&
        !mz_zip_reader_extract_to_mem(&impl_->zip, static_cast<mz_uint>(index), data.data(), data.size(), 0)) {
        throw std::runtime_error(fmt::format("Unable to extract {} from {}: {}", filename, path_, describeError(impl_->zip)));
    }

    return data;
}

std::vector<std::string> ZipArchive::listFiles() const {
    std::vector<std::string> files;
    if (!isOpen()) return files;

    const size_t count = getEntryCount();
    files.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        if (mz_zip_reader_is_file_a_directory(&impl_->zip, static_cast<mz_uint>(i))) continue;

        mz_zip_archive_file_stat stat;
        if (mz_zip_reader_file_stat(&impl_->zip, static_cast<mz_uint>(i), &stat)) {
            files.emplace_back(stat.m_filename);
        }
    }

    return files;
}

std::string ZipArchive::lastError() const {
    return impl_ ? describeError(impl_->zip) : std::string("archive not open");
}

// =============================================================================
// ZipWriter
// =============================================================================

ZipWriter::ZipWriter() : impl_(std::make_unique<Impl>()) {}

ZipWriter::~ZipWriter() = default;

bool ZipWriter::open(const std::string& path) {
    abandon();

    impl_ = std::make_unique<Impl>();
    std::memset(&impl_->zip, 0, sizeof(impl_->zip));

    if (!mz_zip_writer_init_file(&impl_->zip, path.c_str(), 0)) {
        return false;
    }

    impl_->isOpen = true;
    path_ = path;
    return true;
}

bool ZipWriter::isOpen() const {
    return impl_ && impl_->isOpen;
}

bool ZipWriter::addEntry(const std::string& name, std::span<const uint8_t> data) {
    if (!isOpen()) return false;
    return mz_zip_writer_add_mem(&impl_->zip, name.c_str(), data.data(), data.size(),
                                 MZ_DEFAULT_COMPRESSION);
}

bool ZipWriter::finish() {
    if (!isOpen()) return false;
    const bool finalized = mz_zip_writer_finalize_archive(&impl_->zip);
    const bool ended = mz_zip_writer_end(&impl_->zip);
    impl_->isOpen = false;
    return finalized && ended;
}

void ZipWriter::abandon() {
    if (impl_ && impl_->isOpen) {
        mz_zip_writer_end(&impl_->zip);
        impl_->isOpen = false;
    }
}

std::string ZipWriter::lastError() const {
    return impl_ ? describeError(impl_->zip) : std::string("archive not open");
}

} // namespace cdjmeta::data
