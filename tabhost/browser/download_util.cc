// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/download_util.h"

#include <sstream>

#include "include/base/cef_logging.h"
#include "tabhost/common/file_util.h"

namespace tabhost::download_util {

const char kDefaultFileName[] = "download";

std::string GetUrlFileName(const std::string& url) {
  size_t path_start = 0;
  const size_t scheme_end = url.find("://");
  if (scheme_end != std::string::npos) {
    path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
      return std::string();
    }
  }

  size_t path_end = url.find_first_of("?#", path_start);
  if (path_end == std::string::npos) {
    path_end = url.size();
  }

  const std::string path = url.substr(path_start, path_end - path_start);
  return file_util::GetBaseName(path);
}

std::string ChooseFileName(const std::string& suggested_name,
                           const std::string& item_suggested_name,
                           const std::string& url) {
  if (!suggested_name.empty()) {
    return suggested_name;
  }
  if (!item_suggested_name.empty()) {
    return item_suggested_name;
  }
  const std::string url_name = GetUrlFileName(url);
  if (!url_name.empty()) {
    return url_name;
  }
  return kDefaultFileName;
}

std::string GetUniquePath(const std::string& directory,
                          const std::string& file_name) {
  std::string name = file_util::GetBaseName(file_name);
  if (name.empty() || name == "." || name == "..") {
    name = kDefaultFileName;
  }

  const std::string original_path = file_util::JoinPath(directory, name);
  if (!file_util::PathExists(original_path)) {
    return original_path;
  }

  std::string stem = file_util::RemoveFileExtension(name);
  if (stem.empty()) {
    stem = kDefaultFileName;
  }
  const std::string extension = file_util::GetFileExtension(name);

  for (unsigned attempt = 1;; ++attempt) {
    std::stringstream ss;
    ss << stem << " (" << attempt << ")";
    if (!extension.empty()) {
      ss << "." << extension;
    }

    const std::string candidate = file_util::JoinPath(directory, ss.str());
    if (!file_util::PathExists(candidate)) {
      return candidate;
    }
  }
}

std::string GetDownloadDirectory(const std::string& configured_dir,
                                 const std::string& cache_path) {
  if (!configured_dir.empty()) {
    if (file_util::CreateDirectory(configured_dir)) {
      return configured_dir;
    }
    LOG(WARNING) << "Failed to create download directory " << configured_dir;
  }

  const std::string home = file_util::GetHomeDirectory();
  if (!home.empty()) {
    const std::string preferred = file_util::JoinPath(home, "Downloads");
    if (file_util::CreateDirectory(preferred)) {
      return preferred;
    }
  }

  const std::string fallback = file_util::JoinPath(cache_path, "downloads");
  if (!file_util::CreateDirectory(fallback)) {
    LOG(WARNING) << "Failed to create fallback download directory "
                 << fallback;
  }
  return fallback;
}

}  // namespace tabhost::download_util
