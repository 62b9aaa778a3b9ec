#include "emulator-server/device/ScopedTempFile.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace emuserver {
namespace device {

namespace fs = std::filesystem;

ScopedTempFile::ScopedTempFile(const std::string &directory,
                               const std::string &prefix,
                               const std::string &suffix) {
  std::string pattern =
      (fs::path(directory) / (prefix + "XXXXXX" + suffix)).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw InternalError(fmt::format("cannot create temporary file in {}: {}",
                                    directory, std::strerror(errno)));
  }
  ::close(fd);
  path_ = buf.data();
  LOG_TRACE("ARTIFACT", "TEMP", "Created {}", path_);
}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("ARTIFACT", "TEMP", "Failed to remove {}: {}", path_,
             ec.message());
  } else {
    LOG_TRACE("ARTIFACT", "TEMP", "Removed {}", path_);
  }
}

uint64_t ScopedTempFile::size() const {
  std::error_code ec;
  auto bytes = fs::file_size(path_, ec);
  if (ec) {
    throw InternalError(
        fmt::format("cannot stat {}: {}", path_, ec.message()));
  }
  return bytes;
}

void ScopedTempFile::write(const std::vector<uint8_t> &bytes) const {
  std::ofstream ofs(path_, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw InternalError("cannot open " + path_ + " for writing");
  }
  ofs.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!ofs) {
    throw InternalError("short write to " + path_);
  }
}

std::vector<uint8_t> ScopedTempFile::read_all(uint64_t max_bytes) const {
  uint64_t bytes = size();
  if (bytes > max_bytes) {
    throw ArtifactTooLargeError(bytes, max_bytes);
  }

  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) {
    throw InternalError("cannot open " + path_ + " for reading");
  }
  std::vector<uint8_t> data(static_cast<size_t>(bytes));
  ifs.read(reinterpret_cast<char *>(data.data()),
           static_cast<std::streamsize>(data.size()));
  if (static_cast<uint64_t>(ifs.gcount()) != bytes) {
    throw InternalError("short read from " + path_);
  }
  return data;
}

} // namespace device
} // namespace emuserver
