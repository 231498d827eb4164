#include "FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

std::string readTextFile(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in) throw std::runtime_error("Cannot open " + filename);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeTextFile(const std::string& filename, const std::string& text)
{
    std::ofstream out(filename, std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write " + filename);
    out << text;
    if (!out) throw std::runtime_error("Write failed: " + filename);
}
