#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse an unsigned integer from a string.
// Format: decimal digits only, no sign or trailing characters.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB or GB
// (case-insensitive, the trailing B may be omitted).
// Invalid input: bad unit, parse failure or overflow sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Parse a boolean option value as written in config files.
// Format: empty, "1", "true", "yes", "on" are true; "0", "false", "no", "off" are false
// (case-insensitive).
// Invalid input: anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
