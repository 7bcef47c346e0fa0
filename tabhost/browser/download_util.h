// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_DOWNLOAD_UTIL_H_
#define TABHOST_BROWSER_DOWNLOAD_UTIL_H_
#pragma once

#include <string>

namespace tabhost::download_util {

// Name used when nothing better is known.
extern const char kDefaultFileName[];

// Returns the last non-empty path segment of |url|, ignoring the query and
// fragment. Returns an empty string if there is none.
std::string GetUrlFileName(const std::string& url);

// Picks the file name for a download: |suggested_name| if non-empty, else
// |item_suggested_name|, else the last segment of |url|, else
// kDefaultFileName.
std::string ChooseFileName(const std::string& suggested_name,
                           const std::string& item_suggested_name,
                           const std::string& url);

// Returns a path in |directory| for |file_name| that does not exist yet.
// Existing names get a counter: "report.pdf", "report (1).pdf", ...
// Directory components in |file_name| are discarded. Nothing is created.
std::string GetUniquePath(const std::string& directory,
                          const std::string& file_name);

// Returns the directory downloads are written to. Uses |configured_dir| if
// set, otherwise ~/Downloads, otherwise a "downloads" directory below
// |cache_path|. The returned directory is created if missing. Blocks on file
// IO, so call it once at startup rather than from engine callbacks.
std::string GetDownloadDirectory(const std::string& configured_dir,
                                 const std::string& cache_path);

}  // namespace tabhost::download_util

#endif  // TABHOST_BROWSER_DOWNLOAD_UTIL_H_
