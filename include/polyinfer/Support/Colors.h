#pragma once

namespace polyinfer::ANSIColors {
  const char* red();
  const char* magenta();
  const char* reset();
  const char* bold();
  const char* faint();
  const char* italic();
}
