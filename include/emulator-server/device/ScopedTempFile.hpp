#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace emuserver {
namespace device {

/// A uniquely named file in a staging directory, removed on destruction.
///
/// The file is created empty (mkstemps) so the name cannot be raced; the
/// bridge tool then overwrites it in place.
class ScopedTempFile {
public:
  ScopedTempFile(const std::string &directory, const std::string &prefix,
                 const std::string &suffix = "");
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  const std::string &path() const { return path_; }

  uint64_t size() const;

  void write(const std::vector<uint8_t> &bytes) const;

  /// Read the whole file; throws ArtifactTooLargeError past max_bytes
  /// without reading it.
  std::vector<uint8_t> read_all(uint64_t max_bytes) const;

private:
  std::string path_;
};

} // namespace device
} // namespace emuserver
