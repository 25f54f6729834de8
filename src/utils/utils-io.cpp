// utils-io.cpp - I/O Utilities Implementation

// lib includes
#include <boost/filesystem.hpp>

// local includes
#include "whisperserve/utils.hpp"


namespace whisperserve {

std::string join_path(std::string a, std::string b) {
  boost::filesystem::path fs_a(a);
  boost::filesystem::path fs_b(b);
  return (fs_a / fs_b).string();
}

bool exists(std::string path) {
  boost::system::error_code ec;
  return boost::filesystem::exists(boost::filesystem::path(path), ec);
}

std::string absolute_path(std::string path) {
  boost::system::error_code ec;
  boost::filesystem::path resolved = boost::filesystem::absolute(boost::filesystem::path(path), ec);
  return ec ? path : resolved.lexically_normal().string();
}

} // namespace whisperserve
