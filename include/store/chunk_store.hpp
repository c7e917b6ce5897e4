#ifndef DFP_STORE_CHUNK_STORE_HPP
#define DFP_STORE_CHUNK_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace dfp::store {

using Bytes = std::vector<uint8_t>;

class ChunkStorageError : public std::runtime_error {
public:
  explicit ChunkStorageError(const std::string& message) : std::runtime_error(message) {}
};

// Scratch storage for the chunks of one session, addressed by chunk index
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // Stores bytes under index, replacing any previous content. Returns the
  // location of the stored chunk.
  virtual std::string put_chunk(uint32_t index, const Bytes& data) = 0;
  // Throws ChunkStorageError if the chunk is absent or unreadable
  virtual Bytes get_chunk(uint32_t index) const = 0;
  virtual std::set<uint32_t> list_indices() const = 0;
  // Removes every chunk and the store's own location
  virtual void delete_all() = 0;
  // Human-readable location of the store (directory for filesystem stores)
  virtual std::string location() const = 0;
};

// Zero-padded chunk name, e.g. chunk_000042
std::string chunk_name(uint32_t index);

// One directory per session, one file per chunk
class FileChunkStore : public ChunkStore {
public:

  // ---- CONSTRUCTOR ----
  // Creates the directory if it does not exist
  explicit FileChunkStore(const std::filesystem::path& directory);


  // ---- CHUNK OPERATIONS ----
  // Writes to a temporary file first and renames it into place
  std::string put_chunk(uint32_t index, const Bytes& data) override;
  Bytes get_chunk(uint32_t index) const override;
  std::set<uint32_t> list_indices() const override;
  void delete_all() override;
  std::string location() const override { return directory_.string(); }

private:
  std::filesystem::path path_for(uint32_t index) const;

  std::filesystem::path directory_;
};

// Process-local store used by tests and tooling
class MemoryChunkStore : public ChunkStore {
public:
  explicit MemoryChunkStore(std::string name = "memory");

  std::string put_chunk(uint32_t index, const Bytes& data) override;
  Bytes get_chunk(uint32_t index) const override;
  std::set<uint32_t> list_indices() const override;
  void delete_all() override;
  std::string location() const override { return "memory://" + name_; }

private:
  std::string name_;
  mutable std::mutex mutex_;
  std::map<uint32_t, Bytes> chunks_;
};

} // namespace dfp::store

#endif // DFP_STORE_CHUNK_STORE_HPP
