#include "ncurses_terminal.hpp"
#include "app.hpp"
#include <cstdio>
#include <cstring>
#include <optional>
#include <filesystem>

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [--rc <path>]\n", argv0);
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> rc;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--rc") == 0 && i + 1 < argc) { rc = std::filesystem::path(argv[++i]); continue; }
    if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) { usage(argv[0]); return 0; }
    usage(argv[0]);
    return 2;
  }
  NcursesTerminal term;
  App app(term, rc);
  return app.run();
}
