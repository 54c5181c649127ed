#ifndef UTILS_HPP
#define UTILS_HPP

#include "Errors.hpp"
#include "Types.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>
#include <vector>
#include <zlib.h>

inline std::string variantToString(Variant variant) {
    switch (variant) {
        case V1:
            return "1";
        case V2:
            return "2";
        default:
            throw std::invalid_argument("Unknown variant");
    }
}

inline std::string subgameToString(Subgame game) {
    switch (game) {
        case GameA:
            return "A";
        case GameB:
            return "B";
        default:
            throw std::invalid_argument("Unknown subgame");
    }
}

// "A1", "B2", ...
inline std::string strategyToString(Subgame game, Variant variant) {
    return subgameToString(game) + variantToString(variant);
}

inline std::string assignmentToString(Assignment assignment) {
    switch (assignment) {
        case Random:
            return "random";
        case Alternating:
            return "alternating";
        default:
            throw std::invalid_argument("Unknown assignment policy");
    }
}

inline Variant otherVariant(Variant variant) {
    return variant == Variant::V1 ? Variant::V2 : Variant::V1;
}

// std::mt19937 only takes a 32-bit seed, so both halves of the run seed go through a seed_seq.
inline std::mt19937 makeGenerator(uint64_t seed) {
    std::seed_seq sequence{static_cast<uint32_t>(seed & 0xffffffffu), static_cast<uint32_t>(seed >> 32)};
    return std::mt19937(sequence);
}

// Shortest text that reads back as the same double.
inline std::string formatExact(double value) {
    char buffer[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

inline double divide(double numerator, double denominator) {
    return denominator == 0.0 ? 0.0 : numerator / denominator;
}

inline void writeCSV(const std::string& path, const std::vector<std::string>& csvData) {
    std::ofstream csvFile(path);
    if (!csvFile.is_open()) {
        throw IOError("Failed to open file for writing: " + path);
    }
    for (const auto& line : csvData) {
        csvFile << line << "\n";
    }
    csvFile.close();
    if (csvFile.fail()) {
        throw IOError("Failed to write file: " + path);
    }
}

// Gzips `path` into `path + ".gz"` and removes the original. Returns the compressed path.
inline std::string compressFile(const std::string& path) {
    std::string compressedFilePath = path + ".gz";
    FILE* source = fopen(path.c_str(), "rb");
    gzFile dest = gzopen(compressedFilePath.c_str(), "wb");
    if ((source == nullptr) || (dest == nullptr)) {
        if (source != nullptr) fclose(source);
        if (dest != nullptr) gzclose(dest);
        throw IOError("Failed to open files for compression: " + path);
    }

    char buffer[8192];
    size_t bytesRead = 0;
    bool failed = false;
    while ((bytesRead = fread(buffer, 1, sizeof(buffer), source)) > 0) {
        if (gzwrite(dest, buffer, static_cast<unsigned>(bytesRead)) != static_cast<int>(bytesRead)) {
            failed = true;
            break;
        }
    }
    if (ferror(source) != 0) {
        failed = true;
    }

    fclose(source);
    if (gzclose(dest) != Z_OK || failed) {
        std::remove(compressedFilePath.c_str());
        throw IOError("Failed to compress " + path);
    }

    if (std::remove(path.c_str()) != 0) {
        throw IOError("Failed to remove original file: " + path);
    }
    return compressedFilePath;
}

#endif // UTILS_HPP
