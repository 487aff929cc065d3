/**
 * @file sink.hpp
 * @brief Where a receiver's bytes go, and how it picks a destination.
 *
 * @details
 * A receiver asks a SinkChain for a writer. The chain holds providers in
 * preference order and tries them one at a time:
 *
 * ```
 *   FileSinkProvider     native handle on disk (fd, fsync on close)
 *        │ Unavailable / Failed
 *        ▼
 *   StreamSinkProvider   streaming writer over a host std::ostream
 *        │ Unavailable / Failed
 *        ▼
 *   MemorySinkProvider   accumulate in RAM, assemble + save at the end
 * ```
 *
 * A provider may answer `Pending` (e.g. a save-location prompt is still
 * open); the chain asks the same provider again on the next poll. Providers
 * are tried only through this interface; no capability sniffing elsewhere.
 *
 * WRITER CONTRACT
 * ---------------
 * - write() appends in call order; false + reason on failure.
 * - close() finishes the file (flush, fsync, or assemble-and-save).
 * - abort() drops whatever was written, best effort. A false return is for
 *   logging only.
 * - A writer destroyed without close() behaves as if aborted.
 */
#ifndef CHUNKWIRE_SINK_HPP
#define CHUNKWIRE_SINK_HPP

#include <stddef.h>
#include <stdint.h>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace chunkwire {

class IWriter {
public:
  virtual ~IWriter() = default;
  virtual bool write(const uint8_t* data, size_t len, std::string& err) = 0;
  virtual bool close(std::string& err) = 0;
  virtual bool abort(std::string& err) = 0;
  virtual const char* kind() const = 0;
};

enum class OpenStatus : uint8_t { Ready = 0, Pending, Unavailable, Failed };

class ISinkProvider {
public:
  virtual ~ISinkProvider() = default;
  virtual const char* name() const = 0;

  /**
   * @brief Try to open a writer for @p file_name of @p total_size bytes.
   * @retval Ready        @p out is set.
   * @retval Pending      not decided yet; ask again later.
   * @retval Unavailable  this provider cannot serve here; try the next one.
   * @retval Failed       it tried and failed; @p err says why.
   */
  virtual OpenStatus open(const std::string& file_name, uint64_t total_size,
                          std::unique_ptr<IWriter>& out, std::string& err) = 0;
};

/// Reduce a peer-supplied name to one safe path component ("download.bin" if nothing is left).
std::string sanitize_file_name(const std::string& name);

// ---------- native file ----------

/**
 * @brief Writes into a directory (or one fixed path) through a POSIX fd.
 *
 * Unavailable when the directory does not exist. The partial file is
 * unlinked on abort.
 */
class FileSinkProvider : public ISinkProvider {
public:
  explicit FileSinkProvider(std::string directory, std::string fixed_path = std::string());

  const char* name() const override { return "file"; }
  OpenStatus  open(const std::string& file_name, uint64_t total_size,
                   std::unique_ptr<IWriter>& out, std::string& err) override;

private:
  std::string directory_;
  std::string fixed_path_;
};

// ---------- host stream ----------

/// Streams into a caller-owned std::ostream. Unavailable when given nullptr.
class StreamSinkProvider : public ISinkProvider {
public:
  explicit StreamSinkProvider(std::ostream* os) : os_(os) {}

  const char* name() const override { return "stream"; }
  OpenStatus  open(const std::string& file_name, uint64_t total_size,
                   std::unique_ptr<IWriter>& out, std::string& err) override;

private:
  std::ostream* os_;
};

// ---------- memory fallback ----------

/// Receives the assembled file. Return false + reason if it could not be saved.
using SaveFn = std::function<bool(const std::string& file_name,
                                  const std::vector<uint8_t>& blob,
                                  std::string& err)>;

/**
 * @brief Accumulates chunks in memory; finalize() assembles one blob and saves it.
 */
class MemoryWriter : public IWriter {
public:
  MemoryWriter(std::string file_name, SaveFn save) : file_name_(std::move(file_name)), save_(std::move(save)) {}

  void accumulate(const uint8_t* data, size_t len);
  bool finalize(std::string& err);

  bool write(const uint8_t* data, size_t len, std::string& err) override;
  bool close(std::string& err) override { return finalize(err); }
  bool abort(std::string& err) override;
  const char* kind() const override { return "memory"; }

  uint64_t size() const { return size_; }

private:
  std::string                       file_name_;
  SaveFn                            save_;
  std::vector<std::vector<uint8_t>> parts_;
  uint64_t                          size_{0};
  bool                              done_{false};
};

/// Last resort. Unavailable when the file is larger than @p max_bytes (0 = no limit).
class MemorySinkProvider : public ISinkProvider {
public:
  explicit MemorySinkProvider(SaveFn save, uint64_t max_bytes = 0)
  : save_(std::move(save)), max_bytes_(max_bytes) {}

  const char* name() const override { return "memory"; }
  OpenStatus  open(const std::string& file_name, uint64_t total_size,
                   std::unique_ptr<IWriter>& out, std::string& err) override;

private:
  SaveFn   save_;
  uint64_t max_bytes_;
};

// ---------- chain ----------

class SinkChain {
public:
  SinkChain() = default;
  SinkChain(SinkChain&&) = default;
  SinkChain& operator=(SinkChain&&) = default;

  SinkChain& add(std::unique_ptr<ISinkProvider> provider);

  /**
   * @brief Advance through the providers.
   * @retval Ready    @p out is set; selected() names the provider.
   * @retval Pending  the current provider is still deciding.
   * @retval Failed   every provider declined; @p err lists their reasons.
   */
  OpenStatus poll(const std::string& file_name, uint64_t total_size,
                  std::unique_ptr<IWriter>& out, std::string& err);

  size_t      size() const { return providers_.size(); }
  const char* selected() const { return selected_; }

private:
  std::vector<std::unique_ptr<ISinkProvider>> providers_;
  size_t                                      index_{0};
  const char*                                 selected_{nullptr};
  std::string                                 declined_;
};

} // namespace chunkwire

#endif // CHUNKWIRE_SINK_HPP
