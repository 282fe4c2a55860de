#ifndef TEST_UTIL_HH
#define TEST_UTIL_HH

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ftw.h>
#include <iterator>
#include <stdexcept>
#include <string>

inline std::string
makeTempDir(const std::string& prefix)
{
    std::string pattern = "/tmp/" + prefix + "_XXXXXX";
    if (mkdtemp(&pattern[0]) == NULL) {
        throw std::runtime_error("mkdtemp failed");
    }
    return pattern;
}

inline void
writeFile(const std::string& path, const std::string& contents)
{
    std::ofstream file(path.c_str(), std::ios::binary | std::ios::trunc);
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string
readFile(const std::string& path)
{
    std::ifstream file(path.c_str(), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
}

/**
 * Deterministic pseudo-random bytes, so a misplaced part shows up as a
 * content mismatch.
 */
inline std::string
patternBytes(size_t size, unsigned seed = 1)
{
    std::string bytes(size, '\0');
    unsigned state = seed;
    for (size_t i = 0; i < size; i++) {
        state = state * 1103515245u + 12345u;
        bytes[i] = static_cast<char>(state >> 16);
    }
    return bytes;
}

inline int
removeEntry(const char* path, const struct stat*, int, struct FTW*)
{
    return std::remove(path);
}

inline void
removeTree(const std::string& path)
{
    nftw(path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
}

#endif /* TEST_UTIL_HH */
