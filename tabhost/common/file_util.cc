// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/common/file_util.h"

#include <errno.h>
#include <pwd.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tabhost::file_util {

const char kPathSep = '/';

std::string JoinPath(const std::string& path1, const std::string& path2) {
  if (path1.empty() && path2.empty()) {
    return std::string();
  }
  if (path1.empty()) {
    return path2;
  }
  if (path2.empty()) {
    return path1;
  }

  std::string result = path1;
  if (result[result.size() - 1] != kPathSep) {
    result += kPathSep;
  }
  if (path2[0] == kPathSep) {
    result += path2.substr(1);
  } else {
    result += path2;
  }
  return result;
}

std::string GetBaseName(const std::string& path) {
  const size_t sep = path.find_last_of(kPathSep);
  if (sep == std::string::npos) {
    return path;
  }
  return path.substr(sep + 1);
}

std::string GetFileExtension(const std::string& path) {
  const std::string name = GetBaseName(path);
  const size_t sep = name.find_last_of('.');
  if (sep == std::string::npos || sep == 0) {
    return std::string();
  }
  return name.substr(sep + 1);
}

std::string RemoveFileExtension(const std::string& name) {
  const std::string ext = GetFileExtension(name);
  if (ext.empty()) {
    return name;
  }
  return name.substr(0, name.size() - ext.size() - 1);
}

bool PathExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool DirectoryExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool CreateDirectory(const std::string& path) {
  if (path.empty()) {
    return false;
  }
  if (DirectoryExists(path)) {
    return true;
  }

  const size_t sep = path.find_last_of(kPathSep);
  if (sep != std::string::npos && sep > 0) {
    if (!CreateDirectory(path.substr(0, sep))) {
      return false;
    }
  }

  if (mkdir(path.c_str(), 0700) == 0) {
    return true;
  }
  // Another caller may have created it in the meantime.
  return errno == EEXIST && DirectoryExists(path);
}

std::string GetHomeDirectory() {
  const char* home = getenv("HOME");
  if (home && home[0] != '\0') {
    return home;
  }

  struct passwd* pw = getpwuid(getuid());
  if (pw && pw->pw_dir) {
    return pw->pw_dir;
  }
  return std::string();
}

}  // namespace tabhost::file_util
