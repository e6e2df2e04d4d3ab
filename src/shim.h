#ifndef RUNBOX_SHIM_H
#define RUNBOX_SHIM_H

#include <glog/logging.h>
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace runbox {

// Base.
template <typename Key, typename Value>
using HashMap = std::unordered_map<Key, Value>;

template <typename Key, typename Value>
using OrderedMap = std::map<Key, Value>;

template <typename Type>
using Optional = boost::optional<Type>;

using String = std::string;
using StringView = boost::string_view;

template <typename Element>
using Vector = std::vector<Element>;

// File
using DirIterator = boost::filesystem::directory_iterator;
using FileType = boost::filesystem::file_type;
using Path = boost::filesystem::path;

inline Path TempPath() {
  return boost::filesystem::temp_directory_path();
}

inline Path RandomPath(const Path& model) {
  return boost::filesystem::unique_path(model);
}

inline bool Exists(const Path& path) {
  boost::system::error_code ignored;
  return boost::filesystem::exists(path, ignored);
}

inline bool IsDirectory(const Path& path) {
  boost::system::error_code ignored;
  return boost::filesystem::is_directory(path, ignored);
}

inline bool IsRegularFile(const Path& path) {
  boost::system::error_code ignored;
  return boost::filesystem::is_regular_file(path, ignored);
}

inline void MakeDirs(const Path& path) {
  boost::filesystem::create_directories(path);
}

inline void RemoveAll(const Path& path) {
  boost::filesystem::remove_all(path);
}

// I/O
using EventLoop = boost::asio::io_service;
using ErrorCode = boost::system::error_code;
using SystemError = boost::system::system_error;

}  // namespace runbox

#endif  // RUNBOX_SHIM_H
