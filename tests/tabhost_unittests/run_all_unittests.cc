// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "gtest/gtest.h"

int main(int argc, char* argv[]) {
  // The unit tests exercise host-side logic only and never initialize the
  // engine, so no sub-processes are launched.
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
