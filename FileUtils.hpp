#pragma once
#include <string>

/**
 * Read an entire text file (scene descriptions, etc.) into a string.
 * Throws std::runtime_error when the file cannot be opened.
 */
std::string readTextFile(const std::string& filename);

/**
 * Write text to a file, replacing it. Throws std::runtime_error on failure.
 */
void writeTextFile(const std::string& filename, const std::string& text);
