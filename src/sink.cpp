// ============================================================================
// sink.cpp: implementation for sink.hpp
// For the provider chain and writer contract see the matching .hpp.
// ============================================================================
#include "chunkwire/sink.hpp"

#include <fcntl.h>         // ::open flags (O_WRONLY, O_CREAT, O_TRUNC)
#include <unistd.h>        // ::write, ::fsync, ::close, ::unlink
#include <cerrno>
#include <cstring>         // strerror
#include <filesystem>

#include "chunkwire/log.hpp"

namespace fs = std::filesystem;

namespace chunkwire {

static std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

std::string sanitize_file_name(const std::string& name) {
  // Strip any directory part a peer sent ("../../etc/x" -> "x").
  std::string base = fs::path(name).filename().string();
  const size_t slash = base.find_last_of("\\");
  if (slash != std::string::npos) base = base.substr(slash + 1);

  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    const unsigned char u = static_cast<unsigned char>(c);
    out.push_back(u < 0x20 || u == 0x7F ? '_' : c);      // no control chars in names
  }
  if (out.empty() || out == "." || out == "..") return "download.bin";
  return out;
}

// ============================================================================
// File writer (fd-backed)
// ============================================================================

namespace {

class FileWriter : public IWriter {
public:
  FileWriter(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~FileWriter() override {
    if (fd_ >= 0) {
      std::string ignored;
      (void)abort(ignored);             // destroyed mid-transfer: drop the partial file
    }
  }

  // ---------------------------------------------------------------------------
  // write()
  // POLICY: loop over short writes; EINTR retried; other errno is fatal.
  // ---------------------------------------------------------------------------
  bool write(const uint8_t* data, size_t len, std::string& err) override {
    if (fd_ < 0) { err = "writer closed"; return false; }
    size_t done = 0;
    while (done < len) {
      const ssize_t n = ::write(fd_, data + done, len - done);
      if (n < 0) {
        if (errno == EINTR) continue;
        err = errno_text("write");
        return false;
      }
      done += static_cast<size_t>(n);
    }
    return true;
  }

  bool close(std::string& err) override {
    if (fd_ < 0) { err = "writer closed"; return false; }
    const bool synced = (::fsync(fd_) == 0);
    if (!synced) err = errno_text("fsync");
    const bool closed = (::close(fd_) == 0);
    if (!closed && synced) err = errno_text("close");
    fd_ = -1;
    return synced && closed;
  }

  bool abort(std::string& err) override {
    bool ok = true;
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      err = errno_text("unlink");
      ok = false;
    }
    return ok;
  }

  const char* kind() const override { return "file"; }

private:
  int         fd_;
  std::string path_;
};

// ============================================================================
// Stream writer (host ostream)
// ============================================================================

class StreamWriter : public IWriter {
public:
  explicit StreamWriter(std::ostream& os) : os_(os) {}

  bool write(const uint8_t* data, size_t len, std::string& err) override {
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!os_) { err = "stream write failed"; return false; }
    return true;
  }

  bool close(std::string& err) override {
    os_.flush();
    if (!os_) { err = "stream flush failed"; return false; }
    return true;
  }

  // Bytes already handed to a stream cannot be taken back.
  bool abort(std::string& err) override {
    (void)err;
    os_.flush();
    return true;
  }

  const char* kind() const override { return "stream"; }

private:
  std::ostream& os_;
};

} // namespace

// ============================================================================
// Providers
// ============================================================================

FileSinkProvider::FileSinkProvider(std::string directory, std::string fixed_path)
: directory_(std::move(directory)), fixed_path_(std::move(fixed_path)) {}

OpenStatus FileSinkProvider::open(const std::string& file_name, uint64_t total_size,
                                  std::unique_ptr<IWriter>& out, std::string& err) {
  (void)total_size;
  std::error_code ec;

  fs::path target;
  if (!fixed_path_.empty()) {
    target = fs::path(fixed_path_);
    const fs::path parent = target.has_parent_path() ? target.parent_path() : fs::path(".");
    if (!fs::is_directory(parent, ec)) { err = "no directory " + parent.string(); return OpenStatus::Unavailable; }
  } else {
    if (directory_.empty() || !fs::is_directory(directory_, ec)) {
      err = "no directory " + directory_;
      return OpenStatus::Unavailable;
    }
    target = fs::path(directory_) / sanitize_file_name(file_name);
  }

  const int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    err = errno_text(("open " + target.string()).c_str());
    return OpenStatus::Failed;
  }
  out = std::make_unique<FileWriter>(fd, target.string());
  return OpenStatus::Ready;
}

OpenStatus StreamSinkProvider::open(const std::string& file_name, uint64_t total_size,
                                    std::unique_ptr<IWriter>& out, std::string& err) {
  (void)file_name;
  (void)total_size;
  if (os_ == nullptr) { err = "no output stream"; return OpenStatus::Unavailable; }
  if (!*os_)          { err = "output stream in error state"; return OpenStatus::Failed; }
  out = std::make_unique<StreamWriter>(*os_);
  return OpenStatus::Ready;
}

OpenStatus MemorySinkProvider::open(const std::string& file_name, uint64_t total_size,
                                    std::unique_ptr<IWriter>& out, std::string& err) {
  if (!save_) { err = "no save handler"; return OpenStatus::Unavailable; }
  if (max_bytes_ != 0 && total_size > max_bytes_) {
    err = "file larger than memory limit";
    return OpenStatus::Unavailable;
  }
  out = std::make_unique<MemoryWriter>(sanitize_file_name(file_name), save_);
  return OpenStatus::Ready;
}

// ============================================================================
// MemoryWriter
// ============================================================================

void MemoryWriter::accumulate(const uint8_t* data, size_t len) {
  parts_.emplace_back(data, data + len);
  size_ += len;
}

bool MemoryWriter::write(const uint8_t* data, size_t len, std::string& err) {
  if (done_) { err = "writer closed"; return false; }
  accumulate(data, len);
  return true;
}

// -----------------------------------------------------------------------------
// finalize(): concatenate parts once, release them, hand the blob to save_.
// -----------------------------------------------------------------------------
bool MemoryWriter::finalize(std::string& err) {
  if (done_) { err = "writer closed"; return false; }
  done_ = true;

  std::vector<uint8_t> blob;
  blob.reserve(static_cast<size_t>(size_));
  for (const auto& p : parts_) blob.insert(blob.end(), p.begin(), p.end());
  parts_.clear();
  parts_.shrink_to_fit();

  if (!save_) { err = "no save handler"; return false; }
  return save_(file_name_, blob, err);
}

bool MemoryWriter::abort(std::string& err) {
  (void)err;
  done_ = true;
  parts_.clear();
  size_ = 0;
  return true;
}

// ============================================================================
// SinkChain
// ============================================================================

SinkChain& SinkChain::add(std::unique_ptr<ISinkProvider> provider) {
  if (provider) providers_.push_back(std::move(provider));
  return *this;
}

// -----------------------------------------------------------------------------
// poll()
// POLICY:
//   - Pending keeps index_ where it is; the same provider is asked next time.
//   - Unavailable/Failed are logged and the next provider is tried at once,
//     so one poll can walk the whole chain.
// -----------------------------------------------------------------------------
OpenStatus SinkChain::poll(const std::string& file_name, uint64_t total_size,
                           std::unique_ptr<IWriter>& out, std::string& err) {
  while (index_ < providers_.size()) {
    ISinkProvider& p = *providers_[index_];
    std::string why;
    const OpenStatus st = p.open(file_name, total_size, out, why);

    if (st == OpenStatus::Ready && out) {
      selected_ = p.name();
      return OpenStatus::Ready;
    }
    if (st == OpenStatus::Pending) return OpenStatus::Pending;

    if (why.empty()) why = "declined";
    log_line(LogLevel::Info, "sink",
             std::string("event=sink_fallback provider=") + p.name() + " reason=\"" + why + "\"");
    if (!declined_.empty()) declined_ += "; ";
    declined_ += std::string(p.name()) + ": " + why;
    ++index_;
  }

  err = declined_.empty() ? "no sink providers" : declined_;
  return OpenStatus::Failed;
}

} // namespace chunkwire
