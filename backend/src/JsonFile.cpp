#include "JsonFile.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

bool write_json_atomically(const std::string& path, const json& j, int indent, const std::string& tag) {
    try {
        // Write to temporary file first
        std::string temp_path = path + ".tmp";
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[" << tag << "] Error: Could not open file for writing: " << temp_path << std::endl;
            return false;
        }

        out << j.dump(indent);
        out.flush();

        if (!out.good()) {
            std::cerr << "[" << tag << "] Error: Write failed for: " << temp_path << std::endl;
            out.close();
            std::remove(temp_path.c_str());
            return false;
        }
        out.close();

        // Atomic rename
        if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
            std::cerr << "[" << tag << "] Error: Could not rename temp file to " << path << std::endl;
            std::remove(temp_path.c_str());
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[" << tag << "] Error writing " << path << ": " << e.what() << std::endl;
        return false;
    }
}
