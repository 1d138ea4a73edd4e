#pragma once
#include <string>
#include <unordered_map>

namespace cm {

// Durable string -> string storage, one record per annotation context.
// Writes are synchronous; a false return means the write did not land.
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  // Returns false when the key is absent or unreadable.
  virtual bool get(const std::string& key, std::string& out) const = 0;
  virtual bool set(const std::string& key, const std::string& value) = 0;
  virtual bool remove(const std::string& key) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;

  bool contains(const std::string& key) const { return values_.count(key) != 0; }
  std::size_t size() const { return values_.size(); }
  std::size_t writeCount() const { return writes_; }

  // While set, every set()/remove() fails (storage full, private mode...).
  void setFailWrites(bool fail) { failWrites_ = fail; }

private:
  std::unordered_map<std::string, std::string> values_;
  std::size_t writes_{0};
  bool failWrites_{false};
};

// One file per key under `directory`. Key characters outside [A-Za-z0-9._-]
// are replaced with '_' in the file name.
class FileKeyValueStore : public KeyValueStore {
public:
  explicit FileKeyValueStore(std::string directory);

  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;

  std::string pathFor(const std::string& key) const;

private:
  std::string dir_;
};

} // namespace cm
