/**
 * @file source.hpp
 * @brief Where a sender's bytes come from.
 *
 * @details
 * A source is a finite, non-restartable sequence of byte blocks. Two shapes
 * are supported and look the same to the sender:
 *
 * - **StreamSource** pulls blocks from a `std::istream` (a file opened for
 *   streaming, a pipe). Its block size is independent of the packet chunk
 *   size; the sender re-slices large blocks.
 * - **SliceSource** slices an `IRangeReader` (random access + known size)
 *   at fixed offsets. Used where streaming reads are unavailable.
 *
 * `next()` may return `Pending` to mean "nothing yet, ask again on a later
 * tick"; the built-in sources never do, but host adapters over async I/O may.
 */
#ifndef CHUNKWIRE_SOURCE_HPP
#define CHUNKWIRE_SOURCE_HPP

#include <stddef.h>
#include <stdint.h>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chunkwire {

enum class ReadStatus : uint8_t { Chunk = 0, Pending, End, Error };

class ISource {
public:
  virtual ~ISource() = default;

  /**
   * @brief Produce the next block.
   * @retval Chunk   @p out holds at least one byte.
   * @retval Pending no data yet; call again later.
   * @retval End     exhausted; @p out is empty.
   * @retval Error   @p err says why; the source is unusable.
   */
  virtual ReadStatus next(std::vector<uint8_t>& out, std::string& err) = 0;

  /// Declared total size in bytes.
  virtual uint64_t total_size() const = 0;

  virtual const char* kind() const = 0;
};

// ---------- random access ----------

class IRangeReader {
public:
  virtual ~IRangeReader() = default;

  /// Read up to @p len bytes at @p offset into @p out (resized to what was read).
  virtual bool read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string& err) = 0;
  virtual uint64_t size() const = 0;
};

/// pread(2) over a regular file. Closes the descriptor on destruction.
class FileRangeReader : public IRangeReader {
public:
  FileRangeReader() = default;
  ~FileRangeReader() override;
  FileRangeReader(const FileRangeReader&) = delete;
  FileRangeReader& operator=(const FileRangeReader&) = delete;

  bool open(const std::string& path, std::string& err);

  bool read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string& err) override;
  uint64_t size() const override { return size_; }

private:
  int      fd_{-1};
  uint64_t size_{0};
};

class MemoryRangeReader : public IRangeReader {
public:
  explicit MemoryRangeReader(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  bool read(uint64_t offset, size_t len, std::vector<uint8_t>& out, std::string& err) override;
  uint64_t size() const override { return bytes_.size(); }

private:
  std::vector<uint8_t> bytes_;
};

// ---------- sources ----------

class StreamSource : public ISource {
public:
  static constexpr size_t DEFAULT_BLOCK = 64 * 1024;

  /**
   * @param in          Owned stream, read from its current position.
   * @param total_size  Bytes the stream is expected to yield.
   * @param block_size  Bytes per read() call.
   */
  StreamSource(std::unique_ptr<std::istream> in, uint64_t total_size, size_t block_size = DEFAULT_BLOCK);

  ReadStatus  next(std::vector<uint8_t>& out, std::string& err) override;
  uint64_t    total_size() const override { return total_; }
  const char* kind() const override { return "stream"; }

private:
  std::unique_ptr<std::istream> in_;
  uint64_t                      total_;
  size_t                        block_;
};

class SliceSource : public ISource {
public:
  SliceSource(std::unique_ptr<IRangeReader> reader, size_t chunk_size);

  ReadStatus  next(std::vector<uint8_t>& out, std::string& err) override;
  uint64_t    total_size() const override { return reader_->size(); }
  const char* kind() const override { return "slice"; }

private:
  std::unique_ptr<IRangeReader> reader_;
  size_t                        chunk_;
  uint64_t                      offset_{0};
};

enum class SourceMode : uint8_t { Stream = 0, Slice };

/**
 * @brief Open @p path as a source of the requested shape.
 * @param chunk_size Slice width (Slice mode) or stream block size (Stream mode).
 */
bool open_file_source(const std::string& path, SourceMode mode, size_t chunk_size,
                      std::unique_ptr<ISource>& out, std::string& err);

} // namespace chunkwire

#endif // CHUNKWIRE_SOURCE_HPP
