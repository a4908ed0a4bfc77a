#include "stackfly/fs.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace stackfly::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  const auto st = std::filesystem::status(p, ec);
  if (st.type() == std::filesystem::file_type::not_found)
    return false;
  if (ec)
    throw std::runtime_error("cannot stat " + p.string() + ": " + ec.message());
  return true;
}

std::string read_text(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("open for read failed: " + p.string());
  std::string text{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad())
    throw std::runtime_error("read failed: " + p.string());
  return text;
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  std::error_code ec;
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec)
      throw std::runtime_error("mkdir -p " + p.parent_path().string() + ": " + ec.message());
  }

  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("write failed: " + tmp.string());
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string());
  }
}

std::filesystem::path executable_dir() {
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec)
    throw std::runtime_error("cannot locate executable: " + ec.message());
  return self.parent_path();
}

} // namespace stackfly::fs
