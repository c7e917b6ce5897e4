#include "store/chunk_store.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace dfp::store {

std::string chunk_name(uint32_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%06u", index);
  return name;
}

//==============================================
// FILE CHUNK STORE
//==============================================

// Initialize store with its session directory and ensure it exists
FileChunkStore::FileChunkStore(const std::filesystem::path& directory) : directory_(directory) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create directory " << directory_.string() << ": " << ec.message();
    throw ChunkStorageError("Chunk store: Failed to create directory: " + directory_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Directory created/verified at: " << directory_.string();
}

std::string FileChunkStore::put_chunk(uint32_t index, const Bytes& data) {
  const std::filesystem::path final_path = path_for(index);

  // Unique temp name so concurrent writes of the same index never share a file
  std::ostringstream temp_name;
  temp_name << "." << chunk_name(index) << "." << std::this_thread::get_id() << ".tmp";
  const std::filesystem::path temp_path = directory_ / temp_name.str();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw ChunkStorageError("Chunk store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw ChunkStorageError("Chunk store: Failed to write data to file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw ChunkStorageError("Chunk store: Failed to publish chunk " + final_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "Chunk store: Stored " << data.size() << " bytes at " << final_path.string();
  return final_path.string();
}

Bytes FileChunkStore::get_chunk(uint32_t index) const {
  const std::filesystem::path file_path = path_for(index);
  if (!std::filesystem::exists(file_path)) {
    throw ChunkStorageError("Chunk store: Chunk not found: " + file_path.string());
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw ChunkStorageError("Chunk store: Failed to open file: " + file_path.string());
  }

  Bytes data(static_cast<size_t>(std::filesystem::file_size(file_path)));
  file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (static_cast<size_t>(file.gcount()) != data.size()) {
    throw ChunkStorageError("Chunk store: Short read from " + file_path.string());
  }
  return data;
}

std::set<uint32_t> FileChunkStore::list_indices() const {
  std::set<uint32_t> indices;
  if (!std::filesystem::exists(directory_)) {
    return indices;
  }
  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    const std::string name = entry.path().filename().string();
    unsigned int index = 0;
    char tail = 0;
    // Exactly "chunk_<digits>", temp files start with '.'
    if (std::sscanf(name.c_str(), "chunk_%u%c", &index, &tail) == 1) {
      indices.insert(index);
    }
  }
  return indices;
}

void FileChunkStore::delete_all() {
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Removing " << directory_.string();
  std::error_code ec;
  std::filesystem::remove_all(directory_, ec);
  if (ec) {
    throw ChunkStorageError("Chunk store: Failed to remove " + directory_.string() + ": " + ec.message());
  }
}

std::filesystem::path FileChunkStore::path_for(uint32_t index) const {
  return directory_ / chunk_name(index);
}

//==============================================
// MEMORY CHUNK STORE
//==============================================

MemoryChunkStore::MemoryChunkStore(std::string name) : name_(std::move(name)) {}

std::string MemoryChunkStore::put_chunk(uint32_t index, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_[index] = data;
  return location() + "/" + chunk_name(index);
}

Bytes MemoryChunkStore::get_chunk(uint32_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(index);
  if (it == chunks_.end()) {
    throw ChunkStorageError("Chunk store: Chunk not found: " + chunk_name(index));
  }
  return it->second;
}

std::set<uint32_t> MemoryChunkStore::list_indices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<uint32_t> indices;
  for (const auto& entry : chunks_) {
    indices.insert(entry.first);
  }
  return indices;
}

void MemoryChunkStore::delete_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.clear();
}

} // namespace dfp::store
