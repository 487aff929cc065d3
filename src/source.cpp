// ============================================================================
// source.cpp: implementation for source.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "chunkwire/source.hpp"

#include <fcntl.h>         // ::open flags
#include <sys/stat.h>      // fstat for file size
#include <unistd.h>        // ::pread, ::close
#include <cerrno>
#include <cstddef>
#include <cstring>         // strerror
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace chunkwire {

// ---------- FileRangeReader ----------

FileRangeReader::~FileRangeReader() {
  if (fd_ >= 0) ::close(fd_);
}

bool FileRangeReader::open(const std::string& path, std::string& err) {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) { err = "open " + path + ": " + std::strerror(errno); return false; }

  struct stat st{};
  if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
    err = "not a regular file: " + path;
    ::close(fd);
    return false;
  }
  fd_   = fd;
  size_ = static_cast<uint64_t>(st.st_size);
  return true;
}

// -----------------------------------------------------------------------------
// read()
// POLICY:
//   - Loop until len bytes or EOF; pread may return short counts.
//   - EINTR is retried, anything else is reported with strerror.
// -----------------------------------------------------------------------------
bool FileRangeReader::read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string& err) {
  if (fd_ < 0) { err = "reader not open"; return false; }

  out.resize(len);
  size_t got = 0;
  while (got < len) {
    const ssize_t n = ::pread(fd_, out.data() + got, len - got, static_cast<off_t>(offset + got));
    if (n < 0) {
      if (errno == EINTR) continue;
      err = std::string("pread: ") + std::strerror(errno);
      out.clear();
      return false;
    }
    if (n == 0) break;                    // EOF
    got += static_cast<size_t>(n);
  }
  out.resize(got);
  return true;
}

// ---------- MemoryRangeReader ----------

bool MemoryRangeReader::read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string& err) {
  (void)err;
  if (offset >= bytes_.size()) { out.clear(); return true; }
  const size_t avail = static_cast<size_t>(bytes_.size() - offset);
  const size_t n = len < avail ? len : avail;
  out.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(offset),
             bytes_.begin() + static_cast<std::ptrdiff_t>(offset + n));
  return true;
}

// ---------- StreamSource ----------

StreamSource::StreamSource(std::unique_ptr<std::istream> in, uint64_t total_size, size_t block_size)
: in_(std::move(in)), total_(total_size), block_(block_size ? block_size : DEFAULT_BLOCK) {}

ReadStatus StreamSource::next(std::vector<uint8_t>& out, std::string& err) {
  out.clear();
  if (!in_) { err = "no input stream"; return ReadStatus::Error; }
  if (in_->bad()) { err = "input stream failed"; return ReadStatus::Error; }
  if (in_->eof()) return ReadStatus::End;

  out.resize(block_);
  in_->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(block_));
  const std::streamsize got = in_->gcount();

  if (in_->bad()) { out.clear(); err = "input stream read error"; return ReadStatus::Error; }
  out.resize(static_cast<size_t>(got));
  return got > 0 ? ReadStatus::Chunk : ReadStatus::End;
}

// ---------- SliceSource ----------

SliceSource::SliceSource(std::unique_ptr<IRangeReader> reader, size_t chunk_size)
: reader_(std::move(reader)), chunk_(chunk_size ? chunk_size : 1) {}

ReadStatus SliceSource::next(std::vector<uint8_t>& out, std::string& err) {
  out.clear();
  if (!reader_) { err = "no range reader"; return ReadStatus::Error; }

  const uint64_t total = reader_->size();
  if (offset_ >= total) return ReadStatus::End;

  const uint64_t left = total - offset_;
  const size_t want = left < chunk_ ? static_cast<size_t>(left) : chunk_;
  if (!reader_->read(offset_, want, out, err)) return ReadStatus::Error;
  if (out.empty()) {
    err = "range reader returned no bytes before declared end";   // file shrank under us
    return ReadStatus::Error;
  }
  offset_ += out.size();
  return ReadStatus::Chunk;
}

// ---------- factory ----------

bool open_file_source(const std::string& path, SourceMode mode, size_t chunk_size,
                      std::unique_ptr<ISource>& out, std::string& err) {
  if (mode == SourceMode::Slice) {
    auto reader = std::make_unique<FileRangeReader>();
    if (!reader->open(path, err)) return false;
    out = std::make_unique<SliceSource>(std::move(reader), chunk_size);
    return true;
  }

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) { err = "not a regular file: " + path; return false; }
  const uintmax_t size = fs::file_size(path, ec);
  if (ec) { err = "stat " + path + ": " + ec.message(); return false; }

  auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*in) { err = "open " + path + ": " + std::strerror(errno); return false; }

  out = std::make_unique<StreamSource>(std::move(in), static_cast<uint64_t>(size), chunk_size);
  return true;
}

} // namespace chunkwire
