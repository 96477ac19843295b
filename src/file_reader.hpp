#pragma once
/*
 * FileReader
 *
 * Purpose: read a text file via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Used for the rc file and for `buff file=<path>` content.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
