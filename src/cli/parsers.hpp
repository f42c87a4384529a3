#pragma once

#include <string>
#include <vector>
#include "command.hpp"

// Rows of `df -P` output, keyed filesystem, size, used, available,
// capacity, mounted_on. The header line is skipped.
std::vector<Record> parse_df(const std::string& output);

// Field names of `avahi-browse -p` records, in order
extern const std::vector<std::string> AVAHI_FIELDS;

// Records of `avahi-browse -aptr` output, one per non-empty line. Fields
// are ';'-separated; a line with fewer fields yields a shorter record whose
// last field holds the remainder.
std::vector<Record> parse_avahi_browse(const std::string& output);
