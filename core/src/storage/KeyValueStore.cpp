#include "cm/storage/KeyValueStore.hpp"

#include <cstdio>

namespace cm {

// -------------------- MemoryKeyValueStore --------------------

bool MemoryKeyValueStore::get(const std::string& key, std::string& out) const {
  auto it = values_.find(key);
  if (it == values_.end()) return false;
  out = it->second;
  return true;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
  if (failWrites_) return false;
  values_[key] = value;
  writes_++;
  return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
  if (failWrites_) return false;
  values_.erase(key);
  writes_++;
  return true;
}

// -------------------- FileKeyValueStore --------------------

FileKeyValueStore::FileKeyValueStore(std::string directory)
  : dir_(std::move(directory)) {}

std::string FileKeyValueStore::pathFor(const std::string& key) const {
  std::string name;
  name.reserve(key.size() + 5);
  for (char c : key) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    name.push_back(ok ? c : '_');
  }
  name += ".json";
  if (dir_.empty()) return name;
  if (dir_.back() == '/') return dir_ + name;
  return dir_ + "/" + name;
}

bool FileKeyValueStore::get(const std::string& key, std::string& out) const {
  std::string path = pathFor(key);
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string data;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    data.append(buf, n);
  }
  bool ok = std::ferror(f) == 0;
  std::fclose(f);
  if (!ok) return false;

  out = std::move(data);
  return true;
}

bool FileKeyValueStore::set(const std::string& key, const std::string& value) {
  std::string path = pathFor(key);
  std::string tmp = path + ".tmp";

  std::FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "[FileKeyValueStore] cannot open %s\n", tmp.c_str());
    return false;
  }
  std::size_t written = std::fwrite(value.data(), 1, value.size(), f);
  bool ok = written == value.size();
  if (std::fclose(f) != 0) ok = false;
  if (!ok) {
    std::remove(tmp.c_str());
    std::fprintf(stderr, "[FileKeyValueStore] short write to %s\n", tmp.c_str());
    return false;
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    std::fprintf(stderr, "[FileKeyValueStore] cannot replace %s\n", path.c_str());
    return false;
  }
  return true;
}

bool FileKeyValueStore::remove(const std::string& key) {
  std::string path = pathFor(key);
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return true; // already absent
  std::fclose(f);
  return std::remove(path.c_str()) == 0;
}

} // namespace cm
