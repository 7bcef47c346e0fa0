// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_COMMON_FILE_UTIL_H_
#define TABHOST_COMMON_FILE_UTIL_H_
#pragma once

#include <string>

namespace tabhost::file_util {

// Platform-specific path separator.
extern const char kPathSep;

// Combines |path1| and |path2| with the correct platform-specific path
// separator.
std::string JoinPath(const std::string& path1, const std::string& path2);

// Returns the last component of |path|, or |path| if it contains no
// separator.
std::string GetBaseName(const std::string& path);

// Extracts the file extension from |path| without the leading dot. Returns an
// empty string for names like "archive" or ".profile".
std::string GetFileExtension(const std::string& path);

// Returns |name| with its extension (and the dot) removed.
std::string RemoveFileExtension(const std::string& name);

// Returns true if something exists at |path|.
bool PathExists(const std::string& path);

// Returns true if |path| names an existing directory.
bool DirectoryExists(const std::string& path);

// Creates |path| and any missing parents. Returns true if the directory exists
// when this call returns.
bool CreateDirectory(const std::string& path);

// Returns the current user's home directory, or an empty string if it cannot
// be determined.
std::string GetHomeDirectory();

}  // namespace tabhost::file_util

#endif  // TABHOST_COMMON_FILE_UTIL_H_
