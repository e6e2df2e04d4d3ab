#include "util.h"

#include <fcntl.h>
#include <openssl/evp.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <boost/filesystem/fstream.hpp>
#include <cstring>
#include <iterator>

namespace runbox {

void WriteFile(const Path& file, StringView content) {
  if (file.has_parent_path()) {
    MakeDirs(file.parent_path());
  }
  boost::filesystem::ofstream sink(file, std::ios::binary | std::ios::trunc);
  sink.write(content.data(), content.size());
  sink.close();
  if (!sink) {
    throw boost::filesystem::filesystem_error(
        "write failed", file,
        ErrorCode(errno, boost::system::system_category()));
  }
}

String ReadFile(const Path& file) {
  boost::filesystem::ifstream source(file, std::ios::binary);
  if (!source) {
    throw boost::filesystem::filesystem_error(
        "open failed", file,
        ErrorCode(errno, boost::system::system_category()));
  }
  return String(std::istreambuf_iterator<char>(source),
                std::istreambuf_iterator<char>());
}

Path CreateTempPath(const Path& model, int num_attempts) {
  Path path;
  do {
    CHECK(num_attempts--) << "unable to create temp path from " << model;
    path = model.has_parent_path() ? model.parent_path() /
                                         RandomPath(model.filename())
                                   : TempPath() / RandomPath(model);
  } while (!boost::filesystem::create_directory(path));
  return path;
}

bool CopyTree(const Path& from_dir, const Path& to_dir,
              const CancelFlag& cancel) {
  if (boost::filesystem::symlink_status(from_dir).type() !=
      FileType::directory_file) {
    throw boost::filesystem::filesystem_error(
        "not a directory", from_dir,
        ErrorCode(ENOTDIR, boost::system::system_category()));
  }
  MakeDirs(to_dir);
  for (DirIterator iter(from_dir); iter != DirIterator(); ++iter) {
    if (IsCancelled(cancel)) {
      return false;
    }
    Path name = iter->path().filename();
    switch (iter->symlink_status().type()) {
      case FileType::regular_file:
        boost::filesystem::copy_file(
            iter->path(), to_dir / name,
            boost::filesystem::copy_option::overwrite_if_exists);
        break;
      case FileType::directory_file:
        if (!CopyTree(iter->path(), to_dir / name, cancel)) {
          return false;
        }
        break;
      case FileType::symlink_file:
        boost::filesystem::remove(to_dir / name);
        boost::filesystem::copy_symlink(iter->path(), to_dir / name);
        break;
      default:
        LOG(WARNING) << "File " << iter->path() << " has special type "
                     << iter->symlink_status().type();
    }
  }
  return true;
}

String Sha256Hex(StringView data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  CHECK(context);
  CHECK_EQ(EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr), 1);
  CHECK_EQ(EVP_DigestUpdate(context.get(), data.data(), data.size()), 1);
  CHECK_EQ(EVP_DigestFinal_ex(context.get(), digest, &length), 1);
  static const char kHexDigits[] = "0123456789abcdef";
  String hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; i++) {
    hex.push_back(kHexDigits[digest[i] >> 4]);
    hex.push_back(kHexDigits[digest[i] & 0xf]);
  }
  return hex;
}

String ShellQuote(StringView arg) {
  String quoted;
  quoted.reserve(arg.size() + 2);
  quoted.push_back('\'');
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

int MountTmpfs(const char* dir, const char* options) {
  return mount("tmpfs", dir, "tmpfs", MS_NOSUID | MS_NODEV, options);
}

int MakeBindMount(const char* from, const char* to, bool read_only) {
  if (mkdir(to, 0755) < 0 && errno != EEXIST) {
    return -1;
  }
  if (mount(from, to, nullptr, MS_BIND | MS_REC, nullptr) < 0) {
    return -1;
  }
  if (!read_only) {
    return 0;
  }
  // Locked flags of the source mount must be kept or the remount fails
  // inside a user namespace.
  struct statvfs info;
  if (statvfs(to, &info) < 0) {
    return -1;
  }
  unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY;
  if (info.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  return mount(from, to, nullptr, flags, nullptr);
}

int PivotRoot(const char* new_root, const char* old_root) {
  if (chdir(new_root) < 0) {
    return -1;
  }
  if (mkdir(old_root, 0700) < 0) {
    return -1;
  }
  if (syscall(SYS_pivot_root, ".", old_root) < 0) {
    return -1;
  }
  if (chdir("/") < 0) {
    return -1;
  }
  if (umount2(old_root, MNT_DETACH) < 0) {
    return -1;
  }
  return rmdir(old_root);
}

int WriteProcFile(const char* file, const char* content) {
  int fd = open(file, O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    return -1;
  }
  size_t length = strlen(content);
  ssize_t written = write(fd, content, length);
  int saved_errno = errno;
  close(fd);
  if (written != static_cast<ssize_t>(length)) {
    errno = written < 0 ? saved_errno : EIO;
    return -1;
  }
  return 0;
}

int MapRootToSelf(const char* uid_map, const char* gid_map) {
  // Required before an unprivileged process may write gid_map. Kernels
  // older than 3.19 have no such file.
  if (WriteProcFile("/proc/self/setgroups", "deny") < 0 && errno != ENOENT) {
    return -1;
  }
  if (WriteProcFile("/proc/self/uid_map", uid_map) < 0) {
    return -1;
  }
  return WriteProcFile("/proc/self/gid_map", gid_map);
}

}  // namespace runbox
